#pragma once

#include "common/logging.h"
#include "common/types.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace vaultsim {
namespace common {

/// Iteration count for property-style loops in normal runs
constexpr size_t DEFAULT_ITERATIONS = 10;

/// Iteration count when quick mode is requested
constexpr size_t QUICK_ITERATIONS = 4;

/// Duration clients expect a response by
constexpr std::chrono::seconds DEFAULT_CLIENT_MSG_EXPIRY{90};

/**
 * @brief Configuration threaded through a simulation run
 *
 * Nothing in the library reads the process environment; test entry points
 * build a HarnessConfig (from arguments and, explicitly, from an injected
 * environment lookup) and pass it to the network, nodes and clients.
 */
struct HarnessConfig {
  // Reproducibility
  uint64_t seed = 0x5afe'c0de'0000'0001ULL;   ///< Seed of the network random stream
  size_t iterations = DEFAULT_ITERATIONS;     ///< Property-test loop count

  // Network shape
  size_t min_section_size = 8;                ///< Nodes needed before proxies accept clients
  size_t node_count = 10;                     ///< Nodes created by default test fixtures

  // Round driver
  uint64_t round_duration_ms = 100;           ///< Virtual time advanced per round
  size_t max_rounds = 100000;                 ///< Rounds before the driver gives up

  // Client protocol
  std::chrono::seconds client_msg_expiry = DEFAULT_CLIENT_MSG_EXPIRY;

  // Vault behaviour
  uint64_t account_mutations = 1000;          ///< Mutations granted to a new account

  LogLevel log_level = LogLevel::WARN;
  bool log_json = false;                      ///< JSON lines instead of text

  /// Switch to the shortened iteration count
  void enable_quick_mode() { iterations = QUICK_ITERATIONS; }
};

/**
 * @brief Parse command line flags on top of `base`
 *
 * Recognised: --quick, --seed N, --iterations N, --min-section-size N,
 * --node-count N, --max-rounds N, --log-level LEVEL, --log-json and
 * --config FILE. Flags apply in order, so a flag after --config overrides
 * the file.
 */
Result<HarnessConfig> parse_harness_args(int argc, char **argv,
                                         HarnessConfig base = HarnessConfig());

/**
 * @brief Overlay a JSON object onto `base`
 *
 * Keys mirror the struct fields (client_msg_expiry in seconds, log_level as a
 * level name); absent keys keep the base value. `"quick": true` enables
 * quick mode.
 */
Result<HarnessConfig> harness_config_from_json(const std::string &text,
                                               HarnessConfig base = HarnessConfig());

/// Read `path` and overlay it with harness_config_from_json
Result<HarnessConfig> load_harness_config(const std::string &path,
                                          HarnessConfig base = HarnessConfig());

std::string harness_config_to_json(const HarnessConfig &config);

/// Environment lookup, typically a wrapper around std::getenv
using EnvLookup = std::function<const char *(const char *)>;

/**
 * @brief Apply VAULTSIM_QUICK_TEST / QUICK_TEST and VAULTSIM_SEED
 *
 * Presence of either quick-test variable enables quick mode.
 */
Result<HarnessConfig> apply_env_overrides(HarnessConfig config,
                                          const EnvLookup &lookup);

} // namespace common
} // namespace vaultsim
