#ifndef NL_COMMAND_CACHE_RESULT_CACHE_H
#define NL_COMMAND_CACHE_RESULT_CACHE_H

#include <chrono>
#include <cstddef>
#include <list>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "nl_command/command/command.h"

namespace nl_command {

// Memoizes key -> Command for high-confidence results.
// Bounded; when full, the entry inserted longest ago is evicted.
// Thread-safe: lookups take a shared lock, writes an exclusive one.
class ResultCache {
public:
    using Clock = std::chrono::steady_clock;

    explicit ResultCache(std::size_t capacity);

    std::optional<Command> Lookup(const std::string& key) const;

    // Re-inserting an existing key replaces it and makes it the newest.
    void Insert(const std::string& key, Command command);

    // When `key` was inserted, if present.
    std::optional<Clock::time_point> InsertionTime(const std::string& key) const;

    void Clear();

    std::size_t Size() const;
    std::size_t Capacity() const { return capacity_; }

private:
    struct Entry {
        Command command;
        Clock::time_point inserted_at;
        std::list<std::string>::iterator order_it;
    };

    const std::size_t capacity_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::list<std::string> insertion_order_;  // Oldest first
};

}  // namespace nl_command

#endif  // NL_COMMAND_CACHE_RESULT_CACHE_H
