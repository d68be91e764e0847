#include "enricher.hpp"

namespace netsweep::enrich {

ChainEnricher::ChainEnricher(std::shared_ptr<util::CommandRunner> runner, std::shared_ptr<db::Repository> repository, EnrichmentOptions options)
    : mac_(runner, std::move(options.mac)),
      hostname_(runner, std::move(options.hostname)),
      vendor_(std::move(repository)) {
}

Enrichment ChainEnricher::Enrich(const std::string& ip) {
  Enrichment out;
  out.mac      = mac_.Resolve(ip);
  out.hostname = hostname_.Resolve(ip);
  if (out.mac) {
    out.vendor = vendor_.Resolve(*out.mac);
  }
  return out;
}

} // namespace netsweep::enrich
