#include "utilities/errors.hpp"
#include "utilities/logger.h"

namespace chunkseal {

void raiseContractViolation(const std::string &what) {
  Logger::getInstance().log(LogLevel::WARN, "Contract violation: " + what);
  throw ContractViolation(what);
}

} // namespace chunkseal
