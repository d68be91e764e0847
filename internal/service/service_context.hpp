#pragma once

#include <memory>

namespace netsweep::core {
class NetworkScanner;
class PortScanPass;
}
namespace netsweep::query {
class DeviceQueryEngine;
}
namespace netsweep::retention {
class RetentionManager;
}
namespace netsweep::db {
class Repository;
}
namespace netsweep::util {
class Clock;
}

namespace netsweep::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<netsweep::core::NetworkScanner>        scanner;
  std::shared_ptr<netsweep::core::PortScanPass>          port_scan;
  std::shared_ptr<netsweep::query::DeviceQueryEngine>    query;
  std::shared_ptr<netsweep::retention::RetentionManager> retention;
  std::shared_ptr<netsweep::db::Repository>              repository;
  std::shared_ptr<netsweep::util::Clock>                 clock;
};

} // namespace netsweep::service
