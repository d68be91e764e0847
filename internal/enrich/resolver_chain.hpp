#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"

namespace netsweep::enrich {

/*
  Ordered list of named lookup strategies.

  Resolve() runs the steps in order and returns the first non-empty
  answer. A step that throws is logged at debug and skipped; the chain
  itself never throws.
*/
template <typename T>
class ResolverChain {
 public:
  using Step = std::function<std::optional<T>(const std::string& ip)>;

  struct NamedStep {
    std::string name;
    Step        step;
  };

  explicit ResolverChain(std::string name) : name_(std::move(name)) {
  }

  ResolverChain& Add(std::string step_name, Step step) {
    steps_.push_back({std::move(step_name), std::move(step)});
    return *this;
  }

  std::optional<T> Resolve(const std::string& ip) const {
    for (const auto& step : steps_) {
      try {
        auto value = step.step(ip);
        if (value && !IsEmpty(*value)) {
          NETSWEEP_LOG_DEBUG("resolved", {netsweep::observability::StringField("chain", name_), netsweep::observability::StringField("step", step.name),
                                          netsweep::observability::StringField("ip", ip)});
          return value;
        }
      } catch (const std::exception& e) {
        NETSWEEP_LOG_DEBUG("resolver step failed",
                           {netsweep::observability::StringField("chain", name_), netsweep::observability::StringField("step", step.name),
                            netsweep::observability::StringField("ip", ip), netsweep::observability::StringField("error", e.what())});
      }
    }
    return std::nullopt;
  }

  const std::vector<NamedStep>& Steps() const {
    return steps_;
  }

 private:
  static bool IsEmpty(const std::string& value) {
    return value.empty();
  }

  template <typename U>
  static bool IsEmpty(const U&) {
    return false;
  }

  std::string            name_;
  std::vector<NamedStep> steps_;
};

} // namespace netsweep::enrich
