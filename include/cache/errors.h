#pragma once

#include <stdexcept>
#include <string>

namespace memoflow {
namespace cache {

/// Base class for errors raised by the cache itself (not the wrapped computation)
class CacheError : public std::logic_error {
public:
  explicit CacheError(const std::string &message) : std::logic_error(message) {}
};

/**
 * Thrown when a call arrives for a fingerprint whose previous invocation is
 * still in its synchronous phase, i.e. the wrapped function called the
 * cache again with the same fingerprint. Nothing is mutated.
 */
class ReentrantRecursionError : public CacheError {
public:
  explicit ReentrantRecursionError(const std::string &fingerprint)
      : CacheError("Recursion on exactly the same cached computation detected: " +
                   fingerprint),
        fingerprint_(fingerprint) {}

  const std::string &fingerprint() const noexcept { return fingerprint_; }

private:
  std::string fingerprint_;
};

/// The wrapped function returned a std::future with no shared state
class InvalidComputationError : public CacheError {
public:
  explicit InvalidComputationError(const std::string &fingerprint)
      : CacheError("Wrapped computation returned an invalid future: " + fingerprint),
        fingerprint_(fingerprint) {}

  const std::string &fingerprint() const noexcept { return fingerprint_; }

private:
  std::string fingerprint_;
};

} // namespace cache
} // namespace memoflow
