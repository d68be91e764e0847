#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace netsweep::db {
class Repository;
}

namespace netsweep::enrich {

// "AA-BB-CC-DD-EE-FF" / "aabb.ccdd.eeff" -> "aa:bb:cc"; nullopt unless
// the input holds exactly twelve hex digits.
std::optional<std::string> OuiFromMac(std::string_view mac);

// Small compiled-in table for when no vendor file was imported.
std::optional<std::string> BuiltinVendor(std::string_view oui);

/*
  MAC -> manufacturer. The repository vendor table is consulted first,
  then the built-in table. Independent of the hostname chain.
*/
class VendorResolver {
 public:
  explicit VendorResolver(std::shared_ptr<db::Repository> repository);

  std::optional<std::string> Resolve(std::string_view mac) const;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace netsweep::enrich
