#pragma once

#include <stdexcept>
#include <string>

namespace netsweep::util {

/*
  Central error types.

  Module boundaries throw these; the repository seam reports db::Result
  and callers map failed results onto the type that fits their module.
*/

// Malformed range, public address space, oversized request.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Probe-level failure. Never escapes the probe executor.
class ProbeError : public std::runtime_error {
 public:
  explicit ProbeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// One resolver step failed; the chain moves on to the next step.
class ResolverError : public std::runtime_error {
 public:
  explicit ResolverError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PersistenceError : public std::runtime_error {
 public:
  explicit PersistenceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RetentionError : public std::runtime_error {
 public:
  explicit RetentionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Optimistic commit lost against a concurrent transaction.
class TransactionConflict : public std::runtime_error {
 public:
  explicit TransactionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace netsweep::util
