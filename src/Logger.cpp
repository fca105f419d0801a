#include "scpi-driver/Logger.hpp"

namespace scpidrv {

// DLL-safe singleton implementation
DriverLogger &DriverLogger::instance() {
  static DriverLogger logger;
  return logger;
}

} // namespace scpidrv
