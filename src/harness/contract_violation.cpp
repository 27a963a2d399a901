#include "harness/contract_violation.h"
#include "common/logging.h"

namespace vaultsim {
namespace harness {

void contract_violation(const std::string &message,
                        const std::map<std::string, std::string> &context) {
  LOG_HARNESS_ERROR(message, "CONTRACT_VIOLATION", context);
  throw ContractViolation(message);
}

} // namespace harness
} // namespace vaultsim
