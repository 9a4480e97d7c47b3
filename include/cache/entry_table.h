#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace memoflow {
namespace cache {

/**
 * @brief Fingerprint-keyed table of entries stored in reusable slots
 *
 * Entries live in a slot arena; the fingerprint index maps to slot ids,
 * which double as RecencyList handles. A freed slot is reused by the next
 * insertion, so ids are only meaningful while the entry is present.
 *
 * Not thread-safe; the owning cache serializes access.
 */
template <typename Entry>
class EntryTable {
public:
  using Id = std::size_t;

  std::optional<Id> find(const std::string &fingerprint) const {
    auto it = index_.find(fingerprint);
    if (it == index_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  bool contains(const std::string &fingerprint) const {
    return index_.count(fingerprint) > 0;
  }

  /// @throws std::logic_error if the fingerprint is already present
  Id insert(const std::string &fingerprint, Entry entry) {
    if (contains(fingerprint)) {
      throw std::logic_error("Duplicate cache entry: " + fingerprint);
    }

    Id id;
    if (!free_slots_.empty()) {
      id = free_slots_.back();
      free_slots_.pop_back();
    } else {
      id = slots_.size();
      slots_.emplace_back();
    }

    slots_[id].fingerprint = fingerprint;
    slots_[id].entry.emplace(std::move(entry));
    index_.emplace(fingerprint, id);
    return id;
  }

  bool is_live(Id id) const {
    return id < slots_.size() && slots_[id].entry.has_value();
  }

  /// @throws std::out_of_range if no entry occupies the slot
  Entry &at(Id id) {
    if (!is_live(id)) {
      throw std::out_of_range("No cache entry in slot " + std::to_string(id));
    }
    return *slots_[id].entry;
  }

  const Entry &at(Id id) const {
    if (!is_live(id)) {
      throw std::out_of_range("No cache entry in slot " + std::to_string(id));
    }
    return *slots_[id].entry;
  }

  /// @throws std::out_of_range if no entry occupies the slot
  const std::string &fingerprint_of(Id id) const {
    if (!is_live(id)) {
      throw std::out_of_range("No cache entry in slot " + std::to_string(id));
    }
    return slots_[id].fingerprint;
  }

  /// Remove by fingerprint; returns the freed slot id
  std::optional<Id> erase(const std::string &fingerprint) {
    auto it = index_.find(fingerprint);
    if (it == index_.end()) {
      return std::nullopt;
    }
    Id id = it->second;
    index_.erase(it);
    release(id);
    return id;
  }

  std::size_t size() const noexcept { return index_.size(); }
  bool empty() const noexcept { return index_.empty(); }

  void clear() {
    slots_.clear();
    free_slots_.clear();
    index_.clear();
  }

  /// Visit (id, fingerprint, entry) for every live slot, in slot order
  template <typename Visitor>
  void for_each(Visitor &&visit) const {
    for (Id id = 0; id < slots_.size(); ++id) {
      if (slots_[id].entry) {
        visit(id, slots_[id].fingerprint, *slots_[id].entry);
      }
    }
  }

private:
  struct Slot {
    std::string fingerprint;
    std::optional<Entry> entry;
  };

  std::vector<Slot> slots_;
  std::vector<Id> free_slots_;
  std::unordered_map<std::string, Id> index_;

  void release(Id id) {
    slots_[id].entry.reset();
    slots_[id].fingerprint.clear();
    free_slots_.push_back(id);
  }
};

} // namespace cache
} // namespace memoflow
