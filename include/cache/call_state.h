#pragma once

#include <utility>
#include <string>
#include <variant>

namespace memoflow {
namespace cache {

/**
 * @brief Caller-supplied summary of an argument's validity
 *
 * One of: absent (std::monostate), boolean, number or string. A cached entry
 * is reused only while the state of new calls compares equal to the state
 * stored with the entry.
 *
 * @note Construct numbers as double and strings as std::string; a bare
 *       string literal would select the bool alternative.
 */
using CallState = std::variant<std::monostate, bool, double, std::string>;

/**
 * @brief Strict equality: same alternative and equal value
 *
 * NaN never equals itself, so a NaN state always invalidates.
 */
bool same_state(const CallState &a, const CallState &b);

/// Human readable form for logs ("null", "true", "42", "\"v2\"")
std::string describe_state(const CallState &state);

inline CallState absent_state() { return CallState{}; }
inline CallState string_state(std::string value) { return CallState{std::move(value)}; }
inline CallState number_state(double value) { return CallState{value}; }
inline CallState bool_state(bool value) { return CallState{value}; }

} // namespace cache
} // namespace memoflow
