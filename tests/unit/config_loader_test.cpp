#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/runtime_options.hpp"
#include "internal/util/errors.hpp"

namespace {

using netsweep::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "netsweep_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Fn>
bool ThrowsValidation(Fn&& fn) {
  try {
    fn();
  } catch (const netsweep::util::ValidationError&) {
    return true;
  }
  return false;
}

void TestFullDocumentLoads() {
  const auto yaml_path = WriteYaml("full",
                                   R"(database:
  sqlite:
    path: "C:\\netsweep\\\"quoted\"\\inventory.db"
scan:
  concurrency: 32
  probe_timeout: "1.500s"
  inter_batch_delay: "0.250s"
enrichment:
  arp_scan_enabled: true
  hosts_file_path: /etc/hosts.local
retention:
  history_days: 0
  auto_purge: false
  purge_interval: "21600s"
scheduler:
  enabled: true
  mode: SCAN_MODE_QUICK
  ranges:
    - 192.168.1.0/24
    - 10.0.0.1-50
  full_scan_interval: "1800s"
logging:
  level: debug
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\netsweep\\\"quoted\"\\inventory.db");
  netsweep::config::ValidateRuntimeConfig(config);

  auto batch = netsweep::config::ResolveBatchOptions(config);
  assert(batch.concurrency == 32);
  assert(batch.inter_batch_delay == std::chrono::milliseconds(250));

  assert(netsweep::config::ResolveProbeOptions(config).timeout == std::chrono::milliseconds(1500));

  auto enrichment = netsweep::config::ResolveEnrichmentOptions(config);
  assert(enrichment.mac.arp_scan_enabled);
  assert(enrichment.hostname.hosts_file_path == "/etc/hosts.local");
  assert(enrichment.mac.neighbor_table_path == "/proc/net/arp");

  auto retention = netsweep::config::ResolveRetentionPolicy(config);
  assert(retention.history_days == 0);
  assert(retention.scans_days == 90);
  assert(!retention.auto_purge);
  assert(retention.purge_interval == std::chrono::hours(6));

  auto scheduler = netsweep::config::ResolveSchedulerOptions(config);
  assert(scheduler.enabled);
  assert(scheduler.ranges.size() == 2);
  assert(scheduler.mode == netsweep::model::ScanMode::kQuick);
  assert(scheduler.full_scan_interval == std::chrono::minutes(30));
  assert(scheduler.refresh_interval == std::chrono::minutes(15));
}

void TestEmptyDocumentYieldsDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");
  netsweep::config::ValidateRuntimeConfig(config);

  auto batch = netsweep::config::ResolveBatchOptions(config);
  assert(batch.concurrency == 20);
  assert(batch.inter_batch_delay == std::chrono::milliseconds(100));
  assert(netsweep::config::ResolveProbeOptions(config).ping_binary == "ping");
  assert(!netsweep::config::ResolveSchedulerOptions(config).enabled);
  assert(netsweep::config::ResolveRetentionPolicy(config).offline_days == 7);

  auto ports = netsweep::config::ResolvePortScanOptions(config);
  assert(!ports.enabled);
  assert(ports.port_range == "1-10000" && ports.max_hosts == 200);
}

void TestScalarEscapingForNewlineAndUnicode() {
  auto config = ConfigLoader::LoadFromYamlString(R"(scan:
  ping_binary: "line1\nline2☃"
)");
  assert(config.scan().ping_binary() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  memory: {}
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestUnworkableValuesAreRejected() {
  assert(ThrowsValidation([] { netsweep::config::ValidateRuntimeConfig(ConfigLoader::LoadFromYamlString("scan:\n  concurrency: 0\n")); }));
  assert(ThrowsValidation([] { netsweep::config::ValidateRuntimeConfig(ConfigLoader::LoadFromYamlString("scan:\n  concurrency: 1000\n")); }));
  assert(ThrowsValidation([] { netsweep::config::ValidateRuntimeConfig(ConfigLoader::LoadFromYamlString("scheduler:\n  enabled: true\n")); }));
  assert(ThrowsValidation([] {
    netsweep::config::ValidateRuntimeConfig(ConfigLoader::LoadFromYamlString("scheduler:\n  enabled: true\n  ranges: [8.8.8.0/24]\n"));
  }));
  assert(ThrowsValidation([] { netsweep::config::ValidateRuntimeConfig(ConfigLoader::LoadFromYamlString("database:\n  sqlite: {}\n")); }));
  assert(ThrowsValidation([] { ConfigLoader::LoadFromYamlString("- just\n- a list\n"); }));
  assert(ThrowsValidation([] {
    netsweep::config::ValidateRuntimeConfig(ConfigLoader::LoadFromYamlString("enrichment:\n  port_scan:\n    port_range: \"1-100; reboot\"\n"));
  }));
  assert(ThrowsValidation([] {
    netsweep::config::ValidateRuntimeConfig(ConfigLoader::LoadFromYamlString("enrichment:\n  port_scan:\n    max_hosts: 0\n"));
  }));

  // a disabled scheduler is not checked
  netsweep::config::ValidateRuntimeConfig(ConfigLoader::LoadFromYamlString("scheduler:\n  enabled: false\n  ranges: [8.8.8.0/24]\n"));
}

} // namespace

int main() {
  TestFullDocumentLoads();
  TestEmptyDocumentYieldsDefaults();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestUnworkableValuesAreRejected();

  std::cout << "netsweep_config_loader: pass\n";
  return 0;
}
