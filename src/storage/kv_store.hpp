/**
 * @file kv_store.hpp
 * @brief Generic key-value store boundary and an in-process implementation.
 *
 * Snapshots, settings and webhook history are all kept behind this
 * interface. InMemoryStore lets the daemon run stand-alone and backs the
 * tests; a networked store plugs in by implementing IKeyValueStore.
 */

#pragma once

#include "core/result.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace container_pulse {

class IKeyValueStore {
public:
    virtual ~IKeyValueStore() = default;

    /// ttl empty = keep until removed.
    virtual Result<void> put(const std::string& key,
                             std::string value,
                             std::optional<std::chrono::seconds> ttl) = 0;
    virtual Result<std::optional<std::string>> get(const std::string& key) = 0;

    /// Keys starting with prefix, in ascending order.
    virtual Result<std::vector<std::string>> scan(std::string_view prefix) = 0;
    virtual Result<void> remove(const std::string& key) = 0;
};

/**
 * @brief Mutex-guarded map with lazy TTL expiry.
 *
 * Expired keys are invisible to get() and scan() and are purged when touched.
 */
class InMemoryStore : public IKeyValueStore {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    explicit InMemoryStore(ClockFn clock = [] { return Clock::now(); });

    Result<void> put(const std::string& key,
                     std::string value,
                     std::optional<std::chrono::seconds> ttl) override;
    Result<std::optional<std::string>> get(const std::string& key) override;
    Result<std::vector<std::string>> scan(std::string_view prefix) override;
    Result<void> remove(const std::string& key) override;

    /// Remaining lifetime of key; empty when absent or without TTL.
    [[nodiscard]] std::optional<std::chrono::seconds> ttl(const std::string& key);

    [[nodiscard]] size_t size();

private:
    struct Entry {
        std::string value;
        std::optional<Clock::time_point> expires_at;
    };

    [[nodiscard]] bool expired(const Entry& entry, Clock::time_point now) const;
    void purge_expired(Clock::time_point now);

    ClockFn clock_;
    std::map<std::string, Entry, std::less<>> entries_;
    std::mutex mutex_;
};

}  // namespace container_pulse
