#pragma once

#include <memory>

namespace nsi::core {
class ProtocolEngine;
}

namespace nsi::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<nsi::core::ProtocolEngine> engine;
};

} // namespace nsi::service
