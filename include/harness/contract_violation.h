#pragma once

#include <map>
#include <stdexcept>
#include <string>

namespace vaultsim {
namespace harness {

/**
 * ContractViolation - The simulation did something a test never expects
 *
 * Raised for an unexpected event, a response carrying a foreign message id,
 * a missing response, a request issued before the client connected, or a
 * simulation that does not quiesce. Protocol failures are not contract
 * violations; they come back as ClientError results.
 */
class ContractViolation : public std::logic_error {
public:
  explicit ContractViolation(const std::string &what)
      : std::logic_error(what) {}
};

/**
 * Log a critical harness failure with `context`, then throw
 * @throws ContractViolation always
 */
[[noreturn]] void
contract_violation(const std::string &message,
                   const std::map<std::string, std::string> &context = {});

} // namespace harness
} // namespace vaultsim
