#pragma once

#include "common/types.h"
#include <cstddef>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace memoflow {
namespace cache {

using namespace memoflow::common;

/**
 * @brief When an entry with unchanged state may be reused
 */
enum class ReusePolicy {
  SHARE_PENDING, ///< Reuse in-flight and settled handles (deduplicates concurrent calls)
  SETTLED_ONLY   ///< Reuse only after the computation settled successfully
};

std::string reuse_policy_to_string(ReusePolicy policy);
std::optional<ReusePolicy> parse_reuse_policy(const std::string &name);

/**
 * @brief File-level configuration for a memoizing cache
 */
struct CacheConfig {
  std::size_t max_entries = 128;
  ReusePolicy reuse_policy = ReusePolicy::SHARE_PENDING;

  // Logging
  std::string log_level = "INFO";
  bool json_logging = false;
};

/**
 * @brief Cache configuration loader and manager
 *
 * Example file:
 * @code
 * {
 *   "max_entries": 256,
 *   "reuse_policy": "settled_only",
 *   "log_level": "DEBUG",
 *   "json_logging": true
 * }
 * @endcode
 */
class CacheConfigManager {
public:
  static CacheConfig create_default();

  /**
   * @brief Load configuration from JSON file
   * @param config_path path to configuration file
   * @return validated configuration, or an error describing the failure
   */
  static Result<CacheConfig> load_from_file(const std::string &config_path);

  /// Missing keys keep their defaults; unknown keys are ignored
  static Result<CacheConfig> load_from_json(const nlohmann::json &json);

  static nlohmann::json to_json(const CacheConfig &config);

  static bool save_to_file(const CacheConfig &config,
                           const std::string &config_path);

  /**
   * @brief Validate configuration
   * @return validation error message, or empty string if valid
   */
  static std::string validate_config(const CacheConfig &config);

  /// Apply log_level and json_logging to the global Logger
  static void apply_logging(const CacheConfig &config);
};

} // namespace cache
} // namespace memoflow
