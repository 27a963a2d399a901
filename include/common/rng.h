#pragma once

#include "common/types.h"
#include <cstdint>
#include <random>
#include <vector>

namespace vaultsim {
namespace common {

/**
 * SeededRng - Deterministic random stream
 *
 * Every source of randomness in a simulation run (identities, message ids,
 * generated data, node names) is drawn from a SeededRng handed in by the
 * caller, so a whole run is reproducible from the network seed.
 */
class SeededRng {
public:
  explicit SeededRng(uint64_t seed);

  uint64_t seed() const { return seed_; }

  uint64_t next_u64();

  /**
   * Uniform value in [low, high)
   * @note Requires low < high
   */
  size_t gen_range(size_t low, size_t high);

  bool gen_bool();

  Bytes gen_bytes(size_t size);

  XorName gen_name();

  /**
   * Split off an independent stream; advances this one
   */
  SeededRng fork();

  /**
   * Choose `amount` distinct elements of `pool` without replacement.
   * Returns the whole pool (shuffled) when amount >= pool.size().
   */
  template <typename T>
  std::vector<T> sample(std::vector<T> pool, size_t amount) {
    if (amount > pool.size()) {
      amount = pool.size();
    }
    // Partial Fisher-Yates: the first `amount` slots end up as the sample
    for (size_t i = 0; i < amount; ++i) {
      size_t j = gen_range(i, pool.size());
      std::swap(pool[i], pool[j]);
    }
    pool.resize(amount);
    return pool;
  }

private:
  uint64_t seed_;
  std::mt19937_64 engine_;
};

} // namespace common
} // namespace vaultsim
