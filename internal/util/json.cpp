#include "json.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <cstdio>

#include "internal/util/strings.hpp"

namespace netsweep::util {

namespace {

std::optional<google::protobuf::Struct> ParseObject(std::string_view text) {
  google::protobuf::Struct object;
  if (text.empty()) return object;

  auto status = google::protobuf::util::JsonStringToMessage(std::string(text), &object);
  if (!status.ok()) return std::nullopt;
  return object;
}

// Integral numbers render without a fraction to match SQL json text.
std::string NumberText(double value) {
  if (std::isfinite(value) && std::floor(value) == value && std::fabs(value) < 1e15) {
    return std::to_string(static_cast<long long>(value));
  }
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%g", value);
  return buffer;
}

bool ValueContains(const google::protobuf::Value& value, const std::string& needle) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kStringValue:
      return ToLower(value.string_value()).find(needle) != std::string::npos;
    case google::protobuf::Value::kNumberValue:
      return NumberText(value.number_value()).find(needle) != std::string::npos;
    case google::protobuf::Value::kStructValue:
      for (const auto& [_, field] : value.struct_value().fields()) {
        if (ValueContains(field, needle)) return true;
      }
      return false;
    case google::protobuf::Value::kListValue:
      for (const auto& item : value.list_value().values()) {
        if (ValueContains(item, needle)) return true;
      }
      return false;
    default:
      return false;
  }
}

} // namespace

std::optional<std::string> NormalizeJsonObject(std::string_view text) {
  auto object = ParseObject(text);
  if (!object) return std::nullopt;

  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(*object, &out);
  if (!status.ok()) return std::nullopt;
  return out;
}

std::optional<std::string> MergeJsonObjects(std::string_view base, std::string_view patch) {
  auto update = ParseObject(patch);
  if (!update) return std::nullopt;

  auto merged = ParseObject(base).value_or(google::protobuf::Struct{});
  for (const auto& [key, value] : update->fields()) {
    (*merged.mutable_fields())[key] = value;
  }

  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(merged, &out);
  if (!status.ok()) return std::nullopt;
  return out;
}

bool JsonLeafContains(std::string_view json_object, std::string_view needle) {
  auto object = ParseObject(json_object);
  if (!object) return false;

  const auto lowered = ToLower(needle);
  for (const auto& [_, field] : object->fields()) {
    if (ValueContains(field, lowered)) return true;
  }
  return false;
}

} // namespace netsweep::util
