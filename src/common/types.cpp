#include "common/types.h"
#include <iomanip>
#include <sstream>

namespace vaultsim {
namespace common {

/**
 * @file types.cpp
 * @brief Hex helpers, XOR ordering and Result<T> instantiations
 */

std::string to_hex(const uint8_t *data, size_t len) {
  std::ostringstream oss;
  for (size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setfill('0') << std::setw(2)
        << static_cast<int>(data[i]);
  }
  return oss.str();
}

std::string short_name(const XorName &name) {
  return to_hex(name.data(), 3) + "..";
}

bool closer_to(const XorName &target, const XorName &lhs, const XorName &rhs) {
  for (size_t i = 0; i < XOR_NAME_LEN; ++i) {
    uint8_t dl = lhs[i] ^ target[i];
    uint8_t dr = rhs[i] ^ target[i];
    if (dl != dr) {
      return dl < dr;
    }
  }
  return false;
}

// Explicit template instantiations for frequently used Result types
template class Result<bool>;
template class Result<uint64_t>;

} // namespace common
} // namespace vaultsim
