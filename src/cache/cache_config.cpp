#include "cache/cache_config.h"
#include "common/logging.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace memoflow {
namespace cache {

using json = nlohmann::json;

namespace {

// Integers built in code are signed even when non-negative
bool is_count(const json &value) {
  return value.is_number_unsigned() ||
         (value.is_number_integer() && value.get<int64_t>() >= 0);
}

} // namespace

std::string reuse_policy_to_string(ReusePolicy policy) {
  switch (policy) {
  case ReusePolicy::SHARE_PENDING:
    return "share_pending";
  case ReusePolicy::SETTLED_ONLY:
    return "settled_only";
  default:
    return "unknown";
  }
}

std::optional<ReusePolicy> parse_reuse_policy(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lower == "share_pending")
    return ReusePolicy::SHARE_PENDING;
  if (lower == "settled_only")
    return ReusePolicy::SETTLED_ONLY;
  return std::nullopt;
}

CacheConfig CacheConfigManager::create_default() { return CacheConfig{}; }

Result<CacheConfig>
CacheConfigManager::load_from_file(const std::string &config_path) {
  std::ifstream file(config_path);
  if (!file.is_open()) {
    return Result<CacheConfig>("Cannot open config file: " + config_path);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  try {
    return load_from_json(json::parse(buffer.str()));
  } catch (const json::exception &e) {
    return Result<CacheConfig>("JSON parsing error in " + config_path + ": " +
                               std::string(e.what()));
  }
}

Result<CacheConfig> CacheConfigManager::load_from_json(const json &j) {
  if (!j.is_object()) {
    return Result<CacheConfig>("Cache config must be a JSON object");
  }

  CacheConfig config = create_default();

  try {
    if (j.contains("max_entries")) {
      if (!is_count(j["max_entries"])) {
        return Result<CacheConfig>("max_entries must be a non-negative integer");
      }
      config.max_entries = j["max_entries"].get<std::size_t>();
    }

    if (j.contains("reuse_policy")) {
      std::string name = j["reuse_policy"].get<std::string>();
      auto policy = parse_reuse_policy(name);
      if (!policy) {
        return Result<CacheConfig>("Unknown reuse_policy: " + name);
      }
      config.reuse_policy = *policy;
    }

    config.log_level = j.value("log_level", config.log_level);
    config.json_logging = j.value("json_logging", config.json_logging);
  } catch (const json::exception &e) {
    return Result<CacheConfig>("Invalid cache config: " + std::string(e.what()));
  }

  std::string error = validate_config(config);
  if (!error.empty()) {
    return Result<CacheConfig>(error);
  }

  return Result<CacheConfig>::ok(std::move(config));
}

json CacheConfigManager::to_json(const CacheConfig &config) {
  json j;
  j["max_entries"] = config.max_entries;
  j["reuse_policy"] = reuse_policy_to_string(config.reuse_policy);
  j["log_level"] = config.log_level;
  j["json_logging"] = config.json_logging;
  return j;
}

bool CacheConfigManager::save_to_file(const CacheConfig &config,
                                      const std::string &config_path) {
  std::ofstream file(config_path);
  if (!file.is_open()) {
    LOG_ERROR("Cannot write cache config to ", config_path);
    return false;
  }
  file << to_json(config).dump(2) << std::endl;
  return file.good();
}

std::string CacheConfigManager::validate_config(const CacheConfig &config) {
  if (!parse_log_level(config.log_level)) {
    return "Invalid log level: " + config.log_level;
  }

  if (config.max_entries == 0) {
    LOG_WARN("max_entries is 0: every entry is evicted as soon as it is created");
  }

  return ""; // Valid
}

void CacheConfigManager::apply_logging(const CacheConfig &config) {
  auto &logger = Logger::instance();
  if (auto level = parse_log_level(config.log_level)) {
    logger.set_level(*level);
  }
  logger.set_json_format(config.json_logging);
}

} // namespace cache
} // namespace memoflow
