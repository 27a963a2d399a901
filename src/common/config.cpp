#include "common/config.h"
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

namespace vaultsim {
namespace common {

using json = nlohmann::json;

namespace {

Result<uint64_t> parse_number(const std::string &flag, const std::string &text) {
  try {
    size_t consumed = 0;
    uint64_t value = std::stoull(text, &consumed, 0);
    if (consumed != text.size()) {
      return Result<uint64_t>("Trailing characters in value for " + flag +
                              ": " + text);
    }
    return Result<uint64_t>(value);
  } catch (const std::exception &) {
    return Result<uint64_t>("Invalid value for " + flag + ": " + text);
  }
}

} // namespace

Result<HarnessConfig> parse_harness_args(int argc, char **argv,
                                         HarnessConfig base) {
  HarnessConfig config = base;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--quick") {
      config.enable_quick_mode();
      continue;
    }

    if (arg == "--config") {
      if (i + 1 >= argc) {
        return Result<HarnessConfig>("Missing value for --config");
      }
      auto loaded = load_harness_config(argv[++i], config);
      if (loaded.is_err()) {
        return loaded;
      }
      config = loaded.value();
      continue;
    }

    if (arg == "--log-json") {
      config.log_json = true;
      continue;
    }

    if (arg == "--log-level") {
      if (i + 1 >= argc) {
        return Result<HarnessConfig>("Missing value for --log-level");
      }
      auto level = parse_log_level(argv[++i]);
      if (level.is_err()) {
        return Result<HarnessConfig>(level.error());
      }
      config.log_level = level.value();
      continue;
    }

    bool numeric = arg == "--seed" || arg == "--iterations" ||
                   arg == "--min-section-size" || arg == "--node-count" ||
                   arg == "--max-rounds";
    if (!numeric) {
      return Result<HarnessConfig>("Unknown argument: " + arg);
    }
    if (i + 1 >= argc) {
      return Result<HarnessConfig>("Missing value for " + arg);
    }

    auto value = parse_number(arg, argv[++i]);
    if (value.is_err()) {
      return Result<HarnessConfig>(value.error());
    }

    if (arg == "--seed") {
      config.seed = value.value();
    } else if (arg == "--iterations") {
      config.iterations = static_cast<size_t>(value.value());
    } else if (arg == "--min-section-size") {
      if (value.value() == 0) {
        return Result<HarnessConfig>("--min-section-size must be positive");
      }
      config.min_section_size = static_cast<size_t>(value.value());
    } else if (arg == "--node-count") {
      config.node_count = static_cast<size_t>(value.value());
    } else {
      config.max_rounds = static_cast<size_t>(value.value());
    }
  }

  return Result<HarnessConfig>(config);
}

Result<HarnessConfig> harness_config_from_json(const std::string &text,
                                               HarnessConfig base) {
  try {
    json j = json::parse(text);
    if (!j.is_object()) {
      return Result<HarnessConfig>("Harness config must be a JSON object");
    }

    HarnessConfig config = base;
    if (j.value("quick", false)) {
      config.enable_quick_mode();
    }
    config.seed = j.value("seed", config.seed);
    config.iterations = j.value("iterations", config.iterations);
    config.min_section_size = j.value("min_section_size", config.min_section_size);
    config.node_count = j.value("node_count", config.node_count);
    config.round_duration_ms = j.value("round_duration_ms", config.round_duration_ms);
    config.max_rounds = j.value("max_rounds", config.max_rounds);
    config.account_mutations = j.value("account_mutations", config.account_mutations);
    config.log_json = j.value("log_json", config.log_json);

    if (j.contains("client_msg_expiry")) {
      config.client_msg_expiry =
          std::chrono::seconds(j["client_msg_expiry"].get<int64_t>());
    }
    if (j.contains("log_level")) {
      auto level = parse_log_level(j["log_level"].get<std::string>());
      if (level.is_err()) {
        return Result<HarnessConfig>(level.error());
      }
      config.log_level = level.value();
    }

    if (config.min_section_size == 0) {
      return Result<HarnessConfig>("min_section_size must be positive");
    }
    return Result<HarnessConfig>(config);
  } catch (const json::exception &e) {
    return Result<HarnessConfig>("Harness config JSON error: " +
                                 std::string(e.what()));
  }
}

Result<HarnessConfig> load_harness_config(const std::string &path,
                                          HarnessConfig base) {
  std::ifstream file(path);
  if (!file) {
    return Result<HarnessConfig>("Cannot open harness config: " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return harness_config_from_json(buffer.str(), base);
}

std::string harness_config_to_json(const HarnessConfig &config) {
  json j;
  j["seed"] = config.seed;
  j["iterations"] = config.iterations;
  j["min_section_size"] = config.min_section_size;
  j["node_count"] = config.node_count;
  j["round_duration_ms"] = config.round_duration_ms;
  j["max_rounds"] = config.max_rounds;
  j["client_msg_expiry"] = config.client_msg_expiry.count();
  j["account_mutations"] = config.account_mutations;
  j["log_level"] = level_name(config.log_level);
  j["log_json"] = config.log_json;
  return j.dump(2);
}

Result<HarnessConfig> apply_env_overrides(HarnessConfig config,
                                          const EnvLookup &lookup) {
  if (lookup("VAULTSIM_QUICK_TEST") != nullptr ||
      lookup("QUICK_TEST") != nullptr) {
    config.enable_quick_mode();
  }

  if (const char *seed = lookup("VAULTSIM_SEED")) {
    auto value = parse_number("VAULTSIM_SEED", seed);
    if (value.is_err()) {
      return Result<HarnessConfig>(value.error());
    }
    config.seed = value.value();
  }

  return Result<HarnessConfig>(config);
}

} // namespace common
} // namespace vaultsim
