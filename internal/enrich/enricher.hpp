#pragma once

#include <memory>
#include <optional>
#include <string>

#include "hostname_resolver.hpp"
#include "mac_resolver.hpp"
#include "vendor_resolver.hpp"

namespace netsweep::enrich {

struct EnrichmentOptions {
  MacResolverOptions      mac;
  HostnameResolverOptions hostname;
};

// Newly resolved identity fields; empty means nothing was found.
struct Enrichment {
  std::optional<std::string> mac;
  std::optional<std::string> hostname;
  std::optional<std::string> vendor;
};

class Enricher {
 public:
  virtual ~Enricher() = default;

  virtual Enrichment Enrich(const std::string& ip) = 0;
};

// Runs the MAC and hostname chains; vendor follows from the resolved MAC.
class ChainEnricher final : public Enricher {
 public:
  ChainEnricher(std::shared_ptr<util::CommandRunner> runner, std::shared_ptr<db::Repository> repository, EnrichmentOptions options);

  Enrichment Enrich(const std::string& ip) override;

 private:
  MacResolver      mac_;
  HostnameResolver hostname_;
  VendorResolver   vendor_;
};

} // namespace netsweep::enrich
