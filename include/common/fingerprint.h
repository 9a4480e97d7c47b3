#pragma once

#include "common/types.h"
#include <cstdint>
#include <string>
#include <vector>

namespace memoflow {
namespace common {

/**
 * @brief SHA-256 digest helpers for building cache fingerprints
 *
 * All functions throw std::runtime_error if the OpenSSL digest context
 * cannot be created or driven.
 */
class Fingerprint {
public:
  static Hash sha256(const std::vector<uint8_t> &data);
  static Hash sha256(const std::string &data);

  /// Lowercase hex encoding
  static std::string to_hex(const Hash &hash);

  static std::string sha256_hex(const std::string &data);
};

/**
 * @brief Accumulates typed fields into one digest
 *
 * Each field is written with a type tag and a length prefix, so
 * ("ab", "c") and ("a", "bc") produce different fingerprints.
 *
 * @code
 * std::string key = FingerprintBuilder()
 *                       .add("accounts")
 *                       .add(account_id)
 *                       .add(include_history)
 *                       .finish();
 * @endcode
 */
class FingerprintBuilder {
public:
  FingerprintBuilder &add(const std::string &field);
  FingerprintBuilder &add(const char *field);
  FingerprintBuilder &add(int64_t field);
  FingerprintBuilder &add(int field) { return add(static_cast<int64_t>(field)); }
  FingerprintBuilder &add(double field);
  FingerprintBuilder &add(bool field);

  size_t field_count() const { return field_count_; }

  /// Hex SHA-256 over all fields added so far
  std::string finish() const;

private:
  std::vector<uint8_t> buffer_;
  size_t field_count_ = 0;

  void append_field(uint8_t tag, const uint8_t *data, size_t size);
};

} // namespace common
} // namespace memoflow
