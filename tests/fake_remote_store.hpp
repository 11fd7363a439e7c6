/**
 * QueryCache - Prefix-invalidating query cache
 * Fake Remote Store - In-process RemoteStore for backend tests
 *
 * Keeps values with per-key deadlines on the steady clock and can be
 * switched into an "unavailable" mode where every call throws.
 */

#ifndef QUERYCACHE_TESTS_FAKE_REMOTE_STORE_HPP
#define QUERYCACHE_TESTS_FAKE_REMOTE_STORE_HPP

#include "remote/remote_store.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace querycache::fakes {

class FakeRemoteStore : public remote::RemoteStore {
public:
    using Clock = std::chrono::steady_clock;

    std::optional<std::string> get(std::string_view key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        check_available();
        auto it = find_live(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second.value;
    }

    void set(std::string_view key, std::string_view value, std::chrono::milliseconds ttl) override {
        std::lock_guard<std::mutex> lock(mutex_);
        check_available();
        entries_[std::string(key)] = Entry{std::string(value), Clock::now() + ttl};
        set_ttls_[std::string(key)] = ttl;
    }

    bool remove(std::string_view key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        check_available();
        auto it = find_live(key);
        if (it == entries_.end()) {
            return false;
        }
        entries_.erase(it);
        return true;
    }

    bool expire(std::string_view key, std::chrono::milliseconds ttl) override {
        std::lock_guard<std::mutex> lock(mutex_);
        check_available();
        expire_calls_.emplace_back(std::string(key), ttl);
        auto it = find_live(key);
        if (it == entries_.end()) {
            return false;
        }
        it->second.deadline = Clock::now() + ttl;
        return true;
    }

    std::optional<std::chrono::milliseconds> ttl(std::string_view key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        check_available();
        auto it = find_live(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return std::chrono::duration_cast<std::chrono::milliseconds>(it->second.deadline - Clock::now());
    }

    bool ping() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return available_;
    }

    // Test controls

    void set_available(bool available) {
        std::lock_guard<std::mutex> lock(mutex_);
        available_ = available;
    }

    /**
     * Store raw bytes without going through a backend (corrupt payload tests)
     */
    void put_raw(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[key] = Entry{value, Clock::now() + ttl};
    }

    bool contains(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return find_live(key) != entries_.end();
    }

    std::size_t size() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t live = 0;
        auto now = Clock::now();
        for (const auto& [key, entry] : entries_) {
            if (entry.deadline > now) ++live;
        }
        return live;
    }

    /**
     * TTL passed to the most recent set() of key
     */
    std::optional<std::chrono::milliseconds> last_set_ttl(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = set_ttls_.find(key);
        if (it == set_ttls_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<std::pair<std::string, std::chrono::milliseconds>> expire_calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return expire_calls_;
    }

private:
    struct Entry {
        std::string value;
        Clock::time_point deadline;
    };

    using EntryMap = std::map<std::string, Entry, std::less<>>;

    void check_available() const {
        if (!available_) {
            throw remote::StoreUnavailableError("fake store offline");
        }
    }

    EntryMap::iterator find_live(std::string_view key) {
        auto it = entries_.find(key);
        if (it != entries_.end() && it->second.deadline <= Clock::now()) {
            entries_.erase(it);
            return entries_.end();
        }
        return it;
    }

    std::mutex mutex_;
    bool available_{true};
    EntryMap entries_;
    std::map<std::string, std::chrono::milliseconds> set_ttls_;
    std::vector<std::pair<std::string, std::chrono::milliseconds>> expire_calls_;
};

} // namespace querycache::fakes

#endif // QUERYCACHE_TESTS_FAKE_REMOTE_STORE_HPP
