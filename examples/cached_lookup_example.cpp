/**
 * Cached Account Lookup Example
 *
 * Wraps a slow asynchronous account lookup in an AsyncMemoCache and shows
 * request deduplication, state-based invalidation, LRU eviction and failure
 * detachment. Pass a JSON config file as the first argument to override the
 * cache settings.
 */

#include "cache/async_memo_cache.h"
#include "cache/cache_config.h"
#include "common/async_executor.h"
#include "common/fingerprint.h"
#include "common/logging.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace memoflow::cache;
using namespace memoflow::common;

struct AccountQuery {
    std::string account;
    uint64_t slot; // ledger slot the caller considers current
};

struct AccountInfo {
    std::string account;
    uint64_t lamports = 0;
    uint64_t slot = 0;
};

// Simulated remote lookup
class AccountService {
public:
    std::future<AccountInfo> fetch(const AccountQuery& query) {
        requests_.fetch_add(1);
        return std::async(std::launch::async, [query]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            if (query.account.rfind("missing", 0) == 0) {
                throw std::runtime_error("account not found: " + query.account);
            }
            AccountInfo info;
            info.account = query.account;
            info.lamports = 1000 * query.account.size() + query.slot;
            info.slot = query.slot;
            return info;
        });
    }

    uint64_t requests() const { return requests_.load(); }

private:
    std::atomic<uint64_t> requests_{0};
};

CacheConfig load_config(int argc, char** argv) {
    if (argc < 2) {
        return CacheConfigManager::create_default();
    }

    auto result = CacheConfigManager::load_from_file(argv[1]);
    if (!result.is_ok()) {
        LOG_WARN("Falling back to default cache config: ", result.error());
        return CacheConfigManager::create_default();
    }
    return result.value();
}

void demonstrate_cached_lookups(const CacheConfig& config, AsyncExecutor& executor) {
    AccountService service;

    CacheSettings<AccountQuery, AccountInfo> settings;
    settings.param_hasher = [](const AccountQuery& q) {
        return FingerprintBuilder().add("account").add(q.account).finish();
    };
    settings.param_state = [](const AccountQuery& q) {
        return number_state(static_cast<double>(q.slot));
    };
    settings.should_cache = [](const AccountInfo& info, const AccountQuery&) {
        return info.lamports > 0;
    };
    settings.name = "account_cache";
    settings.apply(config);
    settings.max_entries = std::max<std::size_t>(settings.max_entries, 2);

    auto lookup = with_cache<AccountQuery, AccountInfo>(
        [&service](const AccountQuery& q) { return service.fetch(q); }, settings, executor);

    std::cout << "Example 1: Concurrent callers share one request\n";
    {
        auto first = (*lookup)({"alice", 100});
        auto second = (*lookup)({"alice", 100});
        std::cout << "  alice: " << first.get().lamports << " lamports (requests: "
                  << service.requests() << ")\n";
        std::cout << "  same handle value: " << second.get().lamports << "\n";
    }

    std::cout << "\nExample 2: A newer slot invalidates the entry\n";
    {
        auto refreshed = (*lookup)({"alice", 101});
        std::cout << "  alice@101: " << refreshed.get().lamports << " lamports (requests: "
                  << service.requests() << ")\n";
    }

    std::cout << "\nExample 3: Failures are not cached\n";
    for (int attempt = 1; attempt <= 2; ++attempt) {
        try {
            (*lookup)({"missing-bob", 100}).get();
        } catch (const std::runtime_error& e) {
            std::cout << "  attempt " << attempt << ": " << e.what() << "\n";
        }
    }
    std::cout << "  requests so far: " << service.requests() << "\n";

    std::cout << "\nExample 4: Least recently used entries are evicted\n";
    std::vector<std::string> accounts = {"carol", "dave", "erin", "frank"};
    for (const auto& account : accounts) {
        (*lookup)({account, 100}).wait();
    }
    std::cout << "  cached entries: " << lookup->size() << "/" << lookup->max_entries()
              << ", alice still cached: "
              << (lookup->contains(FingerprintBuilder().add("account").add("alice").finish())
                      ? "yes"
                      : "no")
              << "\n";

    std::cout << "\n" << lookup->get_cache_report() << "\n";
}

int main(int argc, char** argv) {
    std::cout << "Memoflow cached lookup example\n";
    std::cout << "==============================\n\n";

    try {
        CacheConfig config = load_config(argc, argv);
        CacheConfigManager::apply_logging(config);

        AsyncExecutor executor;
        executor.initialize();
        demonstrate_cached_lookups(config, executor);
        executor.shutdown();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << "\n";
        return 1;
    }
}
