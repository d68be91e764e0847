#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "internal/model/device_status.hpp"
#include "internal/util/time.hpp"
#include "observation.hpp"

namespace netsweep::scan {

struct BatchOptions {
  std::size_t               concurrency = 20;
  std::chrono::milliseconds inter_batch_delay{100};
};

enum class SettleKind {
  // unreachable address with no record: nothing written
  kSkipped,
  kCreated,
  kUpdated,
};

struct SettleOutcome {
  SettleKind                    kind   = SettleKind::kSkipped;
  netsweep::model::DeviceStatus status = netsweep::model::DeviceStatus::kUnknown;
};

struct ScanSummary {
  uint64_t scanned              = 0;
  uint64_t found                = 0; // records created
  uint64_t updated              = 0; // existing records reconciled
  uint64_t online               = 0;
  uint64_t offline              = 0;
  uint64_t persistence_failures = 0;
  uint64_t duration_ms          = 0;
};

/*
  Runs work over addresses in fixed-size concurrent groups.

  - every item of a group runs on its own std::async thread
  - results are settled on the calling thread in completion order
  - group K+1 starts only after group K is fully settled
  - inter_batch_delay separates groups, never trails the last one

  A work item that throws settles as unreachable. A settle that throws
  counts as a persistence failure and the run goes on.
*/
class BatchScheduler {
 public:
  using Work   = std::function<Observation(const std::string& ip)>;
  using Settle = std::function<SettleOutcome(const Observation&)>;

  BatchScheduler(BatchOptions options, std::shared_ptr<util::Clock> clock);

  ScanSummary Run(const std::vector<std::string>& addresses, const Work& work, const Settle& settle) const;

 private:
  BatchOptions                 options_;
  std::shared_ptr<util::Clock> clock_;
};

} // namespace netsweep::scan
