#include "harness/generators.h"
#include "common/logging.h"
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace vaultsim {
namespace harness {

using namespace vaultsim::routing;

Bytes gen_vec(size_t size, SeededRng &rng) { return rng.gen_bytes(size); }

ImmutableData gen_immutable_data(size_t size, SeededRng &rng) {
  return ImmutableData(gen_vec(size, rng));
}

MutableData gen_mutable_data(uint64_t tag, size_t num_entries,
                             const crypto::PublicSignKey &owner,
                             SeededRng &rng) {
  return gen_mutable_data(tag, num_entries, Owners{owner}, rng);
}

MutableData gen_mutable_data(uint64_t tag, size_t num_entries,
                             const Owners &owners, SeededRng &rng,
                             const GeneratorLimits &limits) {
  if (num_entries > MAX_MUTABLE_DATA_ENTRIES) {
    throw std::invalid_argument(
        "Mutable data can hold at most " +
        std::to_string(MAX_MUTABLE_DATA_ENTRIES) + " entries, " +
        std::to_string(num_entries) + " requested");
  }

  XorName name = rng.gen_name();
  Entries entries = gen_mutable_data_entries(num_entries, rng, limits);

  auto data = MutableData::create(name, tag, Permissions(), std::move(entries),
                                  owners);
  if (data.is_err()) {
    throw std::invalid_argument("Cannot generate mutable data: " +
                                data.error().to_string());
  }
  return data.value();
}

Entries gen_mutable_data_entries(size_t num_entries, SeededRng &rng,
                                 const GeneratorLimits &limits) {
  Entries entries;
  size_t collisions = 0;

  while (entries.size() < num_entries) {
    auto entry = gen_mutable_data_entry(rng);
    if (entries.count(entry.first) > 0) {
      if (++collisions >= limits.max_collision_retries) {
        LOG_WARN("harness", "Key space exhausted after ", entries.size(),
                 " of ", num_entries, " entries");
        break;
      }
      continue;
    }
    collisions = 0;
    entries.emplace(std::move(entry));
  }

  return entries;
}

std::pair<Bytes, Value> gen_mutable_data_entry(SeededRng &rng) {
  Bytes key = gen_vec(rng.gen_range(1, 10), rng);
  Bytes content = gen_vec(rng.gen_range(1, 10), rng);
  return {std::move(key), Value{std::move(content), 0}};
}

EntryActionMap gen_mutable_data_entry_actions(const MutableData &data,
                                              size_t count, SeededRng &rng,
                                              const GeneratorLimits &limits) {
  std::set<Bytes> existing = data.keys();
  EntryActions actions;

  size_t modify_count = rng.gen_range(0, count + 1);
  if (modify_count > existing.size()) {
    modify_count = existing.size();
  }

  std::vector<Bytes> pool(existing.begin(), existing.end());
  for (auto &key : rng.sample(std::move(pool), modify_count)) {
    // keys() and get() read the same map
    uint64_t version = data.get(key)->entry_version + 1;
    if (rng.gen_bool()) {
      actions.del(std::move(key), version);
    } else {
      actions.update(std::move(key), gen_vec(limits.content_len, rng), version);
    }
  }

  size_t collisions = 0;
  while (actions.size() < count) {
    Bytes key = gen_vec(limits.insert_key_len, rng);
    if (existing.count(key) > 0 || actions.contains(key)) {
      if (++collisions >= limits.max_collision_retries) {
        LOG_WARN("harness", "No fresh key after ", collisions,
                 " attempts; batch holds ", actions.size(), " of ", count,
                 " actions");
        break;
      }
      continue;
    }
    collisions = 0;
    actions.ins(std::move(key), gen_vec(limits.content_len, rng), 0);
  }

  return actions.take();
}

std::pair<vault::ClientAuthority, crypto::PublicSignKey>
gen_client_authority(SeededRng &rng) {
  auto keys = crypto::SecretKeys::generate(rng);
  vault::ClientAuthority authority{keys.public_keys(), rng.gen_name()};
  return {authority, keys.public_keys().public_sign_key()};
}

vault::ClientManagerAuthority
gen_client_manager_authority(const crypto::PublicSignKey &client_key) {
  return vault::ClientManagerAuthority::for_client(client_key);
}

} // namespace harness
} // namespace vaultsim
