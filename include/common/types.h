#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace memoflow {
namespace common {

/**
 * @file types.h
 * @brief Fundamental types and utilities shared by the memoflow libraries
 */

/// @brief Raw digest bytes (SHA-256, 32 bytes)
using Hash = std::vector<uint8_t>;

/// @brief Tag selecting the success constructor when T is itself a string
struct success_tag {};

/**
 * @brief Type-safe result wrapper for operations that can fail
 *
 * Provides a way to report recoverable failures (bad configuration files,
 * malformed JSON) without exceptions.
 *
 * @tparam T The type of the success value
 *
 * @note Thread safety: This class is not thread-safe. Each instance should be
 *       used by only one thread at a time.
 *
 * Example usage:
 * @code
 * auto result = CacheConfigManager::load_from_file(path);
 * if (result.is_ok()) {
 *     auto config = result.value();
 * } else {
 *     std::cerr << "Config failed: " << result.error() << std::endl;
 * }
 * @endcode
 */
template <typename T>
class Result {
private:
  bool success_;
  T value_;
  std::string error_;

public:
  /**
   * @brief Construct a successful result with a value
   * @param value The success value to store
   */
  explicit Result(T value) : success_(true), value_(std::move(value)) {}

  /// Successful result; unambiguous for Result<std::string>
  Result(T value, success_tag) : success_(true), value_(std::move(value)) {}

  /**
   * @brief Construct a failed result with an error message
   * @param error C-string describing the error
   */
  explicit Result(const char *error) : success_(false), error_(error) {}

  /**
   * @brief Construct a failed result with an error message
   * @param error String describing the error
   */
  explicit Result(const std::string &error) : success_(false), error_(error) {}

  static Result ok(T value) { return Result(std::move(value), success_tag{}); }

  Result(const Result &other) = default;
  Result(Result &&other) noexcept = default;
  Result &operator=(const Result &other) = default;
  Result &operator=(Result &&other) noexcept = default;

  /**
   * @brief Check if the result represents success
   * @return true if the operation succeeded, false otherwise
   */
  bool is_ok() const noexcept { return success_; }

  /**
   * @brief Check if the result represents failure
   * @return true if the operation failed, false otherwise
   */
  bool is_err() const noexcept { return !success_; }

  /**
   * @brief Get the success value (lvalue reference)
   * @warning Only call this if is_ok() returns true
   */
  const T &value() const & { return value_; }

  /**
   * @brief Get the success value (rvalue reference)
   * @warning Only call this if is_ok() returns true
   */
  T &&value() && { return std::move(value_); }

  /**
   * @brief Get the error message
   * @warning Only call this if is_err() returns true
   */
  const std::string &error() const noexcept { return error_; }
};

} // namespace common
} // namespace memoflow
