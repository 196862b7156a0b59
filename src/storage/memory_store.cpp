/**
 * @file memory_store.cpp
 * @brief InMemoryStore implementation.
 */

#include "storage/kv_store.hpp"

#include <algorithm>

namespace container_pulse {

InMemoryStore::InMemoryStore(ClockFn clock) : clock_(std::move(clock)) {}

bool InMemoryStore::expired(const Entry& entry, Clock::time_point now) const {
    return entry.expires_at && *entry.expires_at <= now;
}

void InMemoryStore::purge_expired(Clock::time_point now) {
    std::erase_if(entries_, [this, now](const auto& item) { return expired(item.second, now); });
}

Result<void> InMemoryStore::put(const std::string& key,
                                std::string value,
                                std::optional<std::chrono::seconds> ttl) {
    if (key.empty()) {
        return Error{"empty key"};
    }

    Entry entry{std::move(value), std::nullopt};
    if (ttl) {
        entry.expires_at = clock_() + *ttl;
    }

    std::lock_guard lock(mutex_);
    entries_.insert_or_assign(key, std::move(entry));
    return {};
}

Result<std::optional<std::string>> InMemoryStore::get(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::optional<std::string>{};
    if (expired(it->second, clock_())) {
        entries_.erase(it);
        return std::optional<std::string>{};
    }
    return std::optional<std::string>{it->second.value};
}

Result<std::vector<std::string>> InMemoryStore::scan(std::string_view prefix) {
    std::lock_guard lock(mutex_);
    purge_expired(clock_());

    std::vector<std::string> keys;
    for (auto it = entries_.lower_bound(prefix);
         it != entries_.end() && std::string_view{it->first}.starts_with(prefix); ++it) {
        keys.push_back(it->first);
    }
    return keys;
}

Result<void> InMemoryStore::remove(const std::string& key) {
    std::lock_guard lock(mutex_);
    entries_.erase(key);
    return {};
}

std::optional<std::chrono::seconds> InMemoryStore::ttl(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end() || !it->second.expires_at) return std::nullopt;

    auto now = clock_();
    if (expired(it->second, now)) return std::nullopt;
    return std::chrono::duration_cast<std::chrono::seconds>(*it->second.expires_at - now);
}

size_t InMemoryStore::size() {
    std::lock_guard lock(mutex_);
    purge_expired(clock_());
    return entries_.size();
}

}  // namespace container_pulse
