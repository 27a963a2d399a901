#pragma once

#include "common/rng.h"
#include "common/types.h"
#include "crypto/keys.h"
#include "routing/data.h"
#include "vault/authority.h"
#include <cstddef>
#include <utility>

namespace vaultsim {
namespace harness {

using namespace vaultsim::common;

/**
 * Bounds for the random workload generators
 */
struct GeneratorLimits {
  /// Length of keys generated for insert actions
  size_t insert_key_len = 10;
  /// Length of content generated for inserts and updates
  size_t content_len = 10;
  /// Consecutive key collisions tolerated before giving up
  size_t max_collision_retries = 64;
};

/// `size` uniform random bytes
Bytes gen_vec(size_t size, SeededRng &rng);

/// Content-addressed record holding `size` random bytes
routing::ImmutableData gen_immutable_data(size_t size, SeededRng &rng);

/**
 * Mutable data with a random name, `tag`, the given owners and `num_entries`
 * random entries at version 0 with distinct keys.
 *
 * May hold fewer entries when the key space runs out.
 * @throws std::invalid_argument if the record cannot be created
 */
routing::MutableData gen_mutable_data(uint64_t tag, size_t num_entries,
                                      const crypto::PublicSignKey &owner,
                                      SeededRng &rng);
routing::MutableData gen_mutable_data(uint64_t tag, size_t num_entries,
                                      const routing::Owners &owners,
                                      SeededRng &rng,
                                      const GeneratorLimits &limits = {});

routing::Entries
gen_mutable_data_entries(size_t num_entries, SeededRng &rng,
                         const GeneratorLimits &limits = {});

/// One entry: key and content of random length in [1, 10), version 0
std::pair<Bytes, routing::Value> gen_mutable_data_entry(SeededRng &rng);

/**
 * A batch of `count` actions that is valid against the current state of
 * `data`.
 *
 * A random share, at most the number of existing keys, updates or deletes
 * distinct existing entries at their next version. The rest inserts fresh
 * keys at version 0. The batch is shorter than `count` only when no fresh
 * key can be found within `limits.max_collision_retries` attempts.
 */
routing::EntryActionMap
gen_mutable_data_entry_actions(const routing::MutableData &data, size_t count,
                               SeededRng &rng,
                               const GeneratorLimits &limits = {});

/// Client authority with a fresh identity and a random proxy name
std::pair<vault::ClientAuthority, crypto::PublicSignKey>
gen_client_authority(SeededRng &rng);

vault::ClientManagerAuthority
gen_client_manager_authority(const crypto::PublicSignKey &client_key);

} // namespace harness
} // namespace vaultsim
