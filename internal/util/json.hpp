#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace netsweep::util {

/*
  JSON helpers for the opaque extra_info payload, built on
  google::protobuf::Struct so every backend interprets it the same way.
*/

// Canonical compact form of a JSON object; nullopt when text is not one.
std::optional<std::string> NormalizeJsonObject(std::string_view text);

// base with each top-level member of patch set or replaced. A base that is
// not an object counts as {}; nullopt when patch is not one.
std::optional<std::string> MergeJsonObjects(std::string_view base, std::string_view patch);

// True when any string or number leaf nested in the object contains needle
// (case-insensitive). Keys are not searched. Invalid JSON never matches.
bool JsonLeafContains(std::string_view json_object, std::string_view needle);

} // namespace netsweep::util
