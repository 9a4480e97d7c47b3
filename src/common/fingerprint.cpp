#include "common/fingerprint.h"
#include <cstring>
#include <memory>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <stdexcept>

namespace memoflow {
namespace common {

namespace {

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

Hash digest_sha256(const uint8_t *data, size_t size) {
  Hash hash(SHA256_DIGEST_LENGTH);

  DigestContext ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }

  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }

  if (size > 0 && EVP_DigestUpdate(ctx.get(), data, size) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }

  unsigned int len = SHA256_DIGEST_LENGTH;
  if (EVP_DigestFinal_ex(ctx.get(), hash.data(), &len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }

  return hash;
}

// field type tags
constexpr uint8_t kTagString = 's';
constexpr uint8_t kTagInt = 'i';
constexpr uint8_t kTagDouble = 'd';
constexpr uint8_t kTagBool = 'b';

} // namespace

Hash Fingerprint::sha256(const std::vector<uint8_t> &data) {
  return digest_sha256(data.data(), data.size());
}

Hash Fingerprint::sha256(const std::string &data) {
  return digest_sha256(reinterpret_cast<const uint8_t *>(data.data()),
                       data.size());
}

std::string Fingerprint::to_hex(const Hash &hash) {
  static const char digits[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(hash.size() * 2);
  for (uint8_t byte : hash) {
    hex.push_back(digits[byte >> 4]);
    hex.push_back(digits[byte & 0x0f]);
  }
  return hex;
}

std::string Fingerprint::sha256_hex(const std::string &data) {
  return to_hex(sha256(data));
}

void FingerprintBuilder::append_field(uint8_t tag, const uint8_t *data,
                                      size_t size) {
  buffer_.push_back(tag);
  uint64_t length = size;
  for (int shift = 56; shift >= 0; shift -= 8) {
    buffer_.push_back(static_cast<uint8_t>(length >> shift));
  }
  buffer_.insert(buffer_.end(), data, data + size);
  ++field_count_;
}

FingerprintBuilder &FingerprintBuilder::add(const std::string &field) {
  append_field(kTagString, reinterpret_cast<const uint8_t *>(field.data()),
               field.size());
  return *this;
}

FingerprintBuilder &FingerprintBuilder::add(const char *field) {
  return add(std::string(field ? field : ""));
}

FingerprintBuilder &FingerprintBuilder::add(int64_t field) {
  uint8_t bytes[sizeof(field)];
  uint64_t bits = static_cast<uint64_t>(field);
  for (size_t i = 0; i < sizeof(bytes); ++i) {
    bytes[i] = static_cast<uint8_t>(bits >> (8 * (sizeof(bytes) - 1 - i)));
  }
  append_field(kTagInt, bytes, sizeof(bytes));
  return *this;
}

FingerprintBuilder &FingerprintBuilder::add(double field) {
  // -0.0 and 0.0 compare equal, so they share a fingerprint
  if (field == 0.0) {
    field = 0.0;
  }
  uint64_t bits;
  std::memcpy(&bits, &field, sizeof(bits));
  uint8_t bytes[sizeof(bits)];
  for (size_t i = 0; i < sizeof(bytes); ++i) {
    bytes[i] = static_cast<uint8_t>(bits >> (8 * (sizeof(bytes) - 1 - i)));
  }
  append_field(kTagDouble, bytes, sizeof(bytes));
  return *this;
}

FingerprintBuilder &FingerprintBuilder::add(bool field) {
  uint8_t byte = field ? 1 : 0;
  append_field(kTagBool, &byte, 1);
  return *this;
}

std::string FingerprintBuilder::finish() const {
  return Fingerprint::to_hex(digest_sha256(buffer_.data(), buffer_.size()));
}

} // namespace common
} // namespace memoflow
