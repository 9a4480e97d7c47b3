#pragma once

/**
 * Bounded memoization for single-argument asynchronous computations.
 *
 * Calls are keyed on a caller-supplied fingerprint of the argument. A call
 * with a known fingerprint and unchanged state shares the existing result
 * handle; a changed state re-invokes the computation; a novel fingerprint
 * creates an entry and may evict the least recently used one.
 *
 * Locking: every structural mutation happens under one recursive mutex per
 * cache. The wrapped function is invoked with that mutex held, so a call it
 * makes back into the cache with the same fingerprint sees the entry as
 * in use and fails with ReentrantRecursionError, while calls from other
 * threads wait for the synchronous phase and then share the pending handle.
 *
 * Settlement: an AsyncExecutor task waits on the wrapped future outside the
 * mutex, runs the completion bookkeeping under it, and only then fulfils the
 * handle callers hold. Bookkeeping is skipped when the entry's generation no
 * longer matches the invocation (a later invalidation superseded it, or the
 * entry was evicted).
 */

#include "cache/cache_config.h"
#include "cache/call_state.h"
#include "cache/entry_table.h"
#include "cache/errors.h"
#include "cache/recency_list.h"
#include "common/async_executor.h"
#include "common/logging.h"
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace memoflow {
namespace cache {

/**
 * @brief Construction contract of an AsyncMemoCache
 */
template <typename Arg, typename R>
struct CacheSettings {
  /// Required. Equal arguments must produce equal fingerprints.
  std::function<std::string(const Arg &)> param_hasher;

  /// Required. A different state for a known fingerprint invalidates it.
  std::function<CallState(const Arg &)> param_state;

  /// Eviction threshold; 0 keeps nothing
  std::size_t max_entries = 0;

  /// Optional. Returning false drops the entry once the result settles.
  std::function<bool(const R &, const Arg &)> should_cache;

  ReusePolicy reuse_policy = ReusePolicy::SHARE_PENDING;

  /// Logging module name
  std::string name = "memo_cache";

  void apply(const CacheConfig &config) {
    max_entries = config.max_entries;
    reuse_policy = config.reuse_policy;
  }
};

/**
 * Cache statistics for monitoring
 */
struct CacheStatistics {
  uint64_t hits = 0;
  uint64_t misses = 0;
  uint64_t invalidations = 0;
  uint64_t evictions = 0;
  uint64_t detachments = 0;
  uint64_t reentrancy_rejections = 0;
  uint64_t synchronous_failures = 0;
  uint64_t computation_failures = 0;
  uint64_t uncacheable_results = 0;
  std::size_t entries = 0;

  double get_hit_rate() const {
    uint64_t total = hits + misses + invalidations;
    return total > 0 ? static_cast<double>(hits) / total : 0.0;
  }
};

namespace detail {

inline std::string describe_exception(const std::exception_ptr &error) {
  try {
    std::rethrow_exception(error);
  } catch (const std::exception &e) {
    return e.what();
  } catch (...) {
    return "non-standard exception";
  }
}

} // namespace detail

template <typename Arg, typename R>
class AsyncMemoCache {
  static_assert(!std::is_void<R>::value,
                "AsyncMemoCache requires a computation that produces a value");

public:
  using Computation = std::function<std::future<R>(const Arg &)>;
  using Handle = std::shared_future<R>;
  using Settings = CacheSettings<Arg, R>;

  /**
   * @throws std::invalid_argument if fn, param_hasher or param_state is empty
   */
  AsyncMemoCache(Computation fn, Settings settings,
                 common::AsyncExecutor &executor = common::global_async_executor())
      : core_(std::make_shared<Core>(std::move(fn), std::move(settings))),
        executor_(executor) {
    if (!core_->fn) {
      throw std::invalid_argument("AsyncMemoCache requires a computation");
    }
    if (!core_->settings.param_hasher) {
      throw std::invalid_argument("CacheSettings::param_hasher is required");
    }
    if (!core_->settings.param_state) {
      throw std::invalid_argument("CacheSettings::param_state is required");
    }

    LOG_MODULE_DEBUG(core_->settings.name, "Cache created (max_entries=",
                     core_->settings.max_entries, ", reuse_policy=",
                     reuse_policy_to_string(core_->settings.reuse_policy), ")");
  }

  AsyncMemoCache(const AsyncMemoCache &) = delete;
  AsyncMemoCache &operator=(const AsyncMemoCache &) = delete;

  /**
   * @brief Run or reuse the computation for arg
   *
   * @throws ReentrantRecursionError if the wrapped function re-enters with
   *         the same fingerprint
   * @throws whatever the wrapped function throws synchronously (the entry is
   *         detached first), or InvalidComputationError for an empty future
   */
  Handle operator()(const Arg &arg) {
    const Settings &settings = core_->settings;
    std::string fingerprint = settings.param_hasher(arg);
    CallState state = settings.param_state(arg);

    std::lock_guard<std::recursive_mutex> lock(core_->mutex);

    if (auto id = core_->entries.find(fingerprint)) {
      Entry &entry = core_->entries.at(*id);

      if (entry.in_use) {
        ++core_->stats.reentrancy_rejections;
        LOG_MODULE_WARN(settings.name,
                        "Recursion on exactly the same cached computation detected: ",
                        fingerprint);
        throw ReentrantRecursionError(fingerprint);
      }

      bool reusable = same_state(state, entry.state) &&
                      (settings.reuse_policy == ReusePolicy::SHARE_PENDING ||
                       entry.resolved);
      if (reusable) {
        ++core_->stats.hits;
        core_->recency.promote(*id);
        LOG_MODULE_DEBUG(settings.name, "hit ", fingerprint);
        return entry.result;
      }

      ++core_->stats.invalidations;
      LOG_MODULE_DEBUG(settings.name, "invalidate ", fingerprint, " state ",
                       describe_state(entry.state), " -> ", describe_state(state),
                       entry.resolved ? "" : " (unsettled)");
      entry.state = std::move(state);

      uint64_t generation = ++core_->next_generation;
      Handle handle = invoke(*id, fingerprint, arg, generation);
      if (core_->current(fingerprint, generation)) {
        core_->recency.promote(*id);
      }
      return handle;
    }

    ++core_->stats.misses;
    LOG_MODULE_DEBUG(settings.name, "miss ", fingerprint);

    Entry fresh;
    fresh.state = std::move(state);
    fresh.in_use = true;
    auto id = core_->entries.insert(fingerprint, std::move(fresh));
    core_->recency.promote(id);

    uint64_t generation = ++core_->next_generation;
    Handle handle = invoke(id, fingerprint, arg, generation);
    enforce_capacity();
    return handle;
  }

  /// Detach one entry; pending holders of its handle are unaffected
  bool invalidate(const std::string &fingerprint) {
    std::lock_guard<std::recursive_mutex> lock(core_->mutex);
    if (!core_->entries.contains(fingerprint)) {
      return false;
    }
    core_->detach(fingerprint);
    LOG_MODULE_DEBUG(core_->settings.name, "invalidated ", fingerprint);
    return true;
  }

  void clear() {
    std::lock_guard<std::recursive_mutex> lock(core_->mutex);
    core_->stats.detachments += core_->entries.size();
    core_->entries.clear();
    core_->recency.clear();
  }

  bool contains(const std::string &fingerprint) const {
    std::lock_guard<std::recursive_mutex> lock(core_->mutex);
    return core_->entries.contains(fingerprint);
  }

  /// nullopt if the fingerprint is not tracked
  std::optional<bool> is_resolved(const std::string &fingerprint) const {
    std::lock_guard<std::recursive_mutex> lock(core_->mutex);
    auto id = core_->entries.find(fingerprint);
    if (!id) {
      return std::nullopt;
    }
    return core_->entries.at(*id).resolved;
  }

  std::size_t size() const {
    std::lock_guard<std::recursive_mutex> lock(core_->mutex);
    return core_->entries.size();
  }

  std::size_t max_entries() const { return core_->settings.max_entries; }
  ReusePolicy reuse_policy() const { return core_->settings.reuse_policy; }
  const std::string &name() const { return core_->settings.name; }

  /**
   * @brief Internal recency order, for diagnostics and tests
   * @warning Not synchronized; read only while no other thread uses the cache
   */
  const RecencyList &recency_list() const { return core_->recency; }

  /// Fingerprints from most to least recently used
  std::vector<std::string> recency_snapshot() const {
    std::lock_guard<std::recursive_mutex> lock(core_->mutex);
    std::vector<std::string> order;
    for (auto id : core_->recency.snapshot()) {
      order.push_back(core_->entries.fingerprint_of(id));
    }
    return order;
  }

  CacheStatistics get_statistics() const {
    std::lock_guard<std::recursive_mutex> lock(core_->mutex);
    CacheStatistics stats = core_->stats;
    stats.entries = core_->entries.size();
    return stats;
  }

  void reset_statistics() {
    std::lock_guard<std::recursive_mutex> lock(core_->mutex);
    core_->stats = CacheStatistics{};
  }

  /// Table and recency list hold exactly the same entries
  bool verify_consistency() const {
    std::lock_guard<std::recursive_mutex> lock(core_->mutex);
    if (core_->entries.size() != core_->recency.size()) {
      return false;
    }
    for (auto id : core_->recency.snapshot()) {
      if (!core_->entries.is_live(id)) {
        return false;
      }
    }
    bool all_linked = true;
    core_->entries.for_each([&](std::size_t id, const std::string &, const Entry &) {
      if (!core_->recency.contains(id)) {
        all_linked = false;
      }
    });
    return all_linked;
  }

  std::string get_cache_report() const {
    CacheStatistics stats = get_statistics();
    std::ostringstream report;
    report << "Cache '" << core_->settings.name << "': " << stats.entries << "/"
           << core_->settings.max_entries << " entries, "
           << reuse_policy_to_string(core_->settings.reuse_policy) << "\n"
           << "  hits: " << stats.hits << ", misses: " << stats.misses
           << ", invalidations: " << stats.invalidations << "\n"
           << "  evictions: " << stats.evictions
           << ", detachments: " << stats.detachments
           << ", uncacheable: " << stats.uncacheable_results << "\n"
           << "  failures: " << stats.computation_failures << " async, "
           << stats.synchronous_failures << " sync, "
           << stats.reentrancy_rejections << " reentrant\n"
           << "  hit rate: " << stats.get_hit_rate() * 100.0 << "%";
    return report.str();
  }

private:
  struct Entry {
    CallState state;
    Handle result;
    uint64_t generation = 0;
    bool in_use = false;
    bool resolved = false;
  };

  using EntryId = typename EntryTable<Entry>::Id;

  // Shared with settlement tasks, which may outlive the cache object
  struct Core {
    Core(Computation f, Settings s) : fn(std::move(f)), settings(std::move(s)) {}

    Computation fn;
    Settings settings;
    mutable std::recursive_mutex mutex;
    EntryTable<Entry> entries;
    RecencyList recency;
    uint64_t next_generation = 0;
    CacheStatistics stats;

    // Entry still owned by invocation `generation`, or nullptr
    Entry *current(const std::string &fingerprint, uint64_t generation) {
      auto id = entries.find(fingerprint);
      if (!id) {
        return nullptr;
      }
      Entry &entry = entries.at(*id);
      return entry.generation == generation ? &entry : nullptr;
    }

    void detach(const std::string &fingerprint) {
      if (auto id = entries.erase(fingerprint)) {
        recency.remove(*id);
        ++stats.detachments;
      }
    }

    void on_success(const std::string &fingerprint, uint64_t generation,
                    const R &value, const Arg &arg) {
      std::lock_guard<std::recursive_mutex> lock(mutex);
      Entry *entry = current(fingerprint, generation);
      if (!entry) {
        LOG_MODULE_DEBUG(settings.name, "stale settlement ignored for ", fingerprint);
        return;
      }

      entry->resolved = true;
      if (settings.should_cache && !settings.should_cache(value, arg)) {
        ++stats.uncacheable_results;
        detach(fingerprint);
        LOG_MODULE_DEBUG(settings.name, "result not cacheable, detached ", fingerprint);
      }
    }

    void on_failure(const std::string &fingerprint, uint64_t generation,
                    const std::exception_ptr &error) {
      std::lock_guard<std::recursive_mutex> lock(mutex);
      ++stats.computation_failures;
      bool is_current = current(fingerprint, generation) != nullptr;
      if (is_current) {
        detach(fingerprint);
      }
      LOG_MODULE_ERROR(settings.name, "computation failed for ", fingerprint, ": ",
                       detail::describe_exception(error),
                       is_current ? " (entry detached)" : " (stale)");
    }
  };

  std::shared_ptr<Core> core_;
  common::AsyncExecutor &executor_;

  Handle invoke(EntryId id, const std::string &fingerprint, const Arg &arg,
                uint64_t generation) {
    {
      Entry &entry = core_->entries.at(id);
      entry.generation = generation;
      entry.in_use = true;
      entry.resolved = false;
    }

    try {
      std::future<R> pending = core_->fn(arg);
      if (!pending.valid()) {
        throw InvalidComputationError(fingerprint);
      }

      auto source = std::make_shared<std::future<R>>(std::move(pending));
      auto promise = std::make_shared<std::promise<R>>();
      Handle handle = promise->get_future().share();

      executor_.submit([core = core_, fingerprint, generation, arg, source, promise]() {
        settle(*core, fingerprint, generation, arg, *source, *promise);
      });

      // The entry may have been evicted by a nested call during fn
      if (Entry *entry = core_->current(fingerprint, generation)) {
        entry->result = handle;
        entry->in_use = false;
      }
      return handle;
    } catch (...) {
      ++core_->stats.synchronous_failures;
      if (core_->current(fingerprint, generation)) {
        core_->detach(fingerprint);
      }
      LOG_MODULE_ERROR(core_->settings.name, "invocation failed for ", fingerprint,
                       ": ", detail::describe_exception(std::current_exception()));
      throw;
    }
  }

  static void settle(Core &core, const std::string &fingerprint,
                     uint64_t generation, const Arg &arg,
                     std::future<R> &source, std::promise<R> &promise) {
    try {
      R value = source.get();
      core.on_success(fingerprint, generation, value, arg);
      promise.set_value(std::move(value));
    } catch (...) {
      core.on_failure(fingerprint, generation, std::current_exception());
      promise.set_exception(std::current_exception());
    }
  }

  void enforce_capacity() {
    while (core_->recency.size() > core_->settings.max_entries) {
      auto tail = core_->recency.least_recent();
      if (!tail) {
        break;
      }
      std::string evicted = core_->entries.fingerprint_of(*tail);
      core_->entries.erase(evicted);
      core_->recency.remove(*tail);
      ++core_->stats.evictions;
      LOG_MODULE_DEBUG(core_->settings.name, "evict ", evicted);
    }
  }
};

/**
 * @brief Wrap fn in a memoizing cache
 *
 * @code
 * auto cached_fetch = with_cache<Query, Row>(fetch_row, settings);
 * std::shared_future<Row> row = (*cached_fetch)(query);
 * @endcode
 */
template <typename Arg, typename R>
std::shared_ptr<AsyncMemoCache<Arg, R>>
with_cache(typename AsyncMemoCache<Arg, R>::Computation fn,
           CacheSettings<Arg, R> settings,
           common::AsyncExecutor &executor = common::global_async_executor()) {
  return std::make_shared<AsyncMemoCache<Arg, R>>(std::move(fn), std::move(settings),
                                                  executor);
}

} // namespace cache
} // namespace memoflow
