#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace memoflow {
namespace cache {

/**
 * @brief Doubly linked recency order over opaque entry handles
 *
 * Handles are small integers (entry table slot indices). Links live in an
 * arena indexed by handle, so nodes never own each other and removing an
 * entry leaves nothing dangling. Head is the most recently used handle,
 * tail the least recently used one.
 *
 * All operations are O(1) except snapshot(). Not thread-safe; the owning
 * cache serializes access.
 */
class RecencyList {
public:
  using Handle = std::size_t;

  RecencyList() = default;

  /// Link handle as the new head, unlinking it first if already present
  void promote(Handle handle);

  /// Unlink handle; no-op if it is not linked
  void remove(Handle handle);

  bool contains(Handle handle) const;

  std::size_t size() const noexcept { return length_; }
  bool empty() const noexcept { return length_ == 0; }

  /// Tail handle, or nullopt when empty
  std::optional<Handle> least_recent() const;

  /// Head handle, or nullopt when empty
  std::optional<Handle> most_recent() const;

  /// Handles from most to least recent
  std::vector<Handle> snapshot() const;

  void clear();

private:
  static constexpr Handle kNone = static_cast<Handle>(-1);

  struct Links {
    Handle closer = kNone;  // towards head
    Handle further = kNone; // towards tail
    bool linked = false;
  };

  std::vector<Links> links_;
  Handle head_ = kNone;
  Handle tail_ = kNone;
  std::size_t length_ = 0;

  void unlink(Handle handle);
};

} // namespace cache
} // namespace memoflow
