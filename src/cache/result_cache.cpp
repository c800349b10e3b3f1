#include "nl_command/cache/result_cache.h"

#include <iterator>
#include <mutex>

namespace nl_command {

ResultCache::ResultCache(std::size_t capacity) : capacity_(capacity) {}

std::optional<Command> ResultCache::Lookup(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.command;
}

void ResultCache::Insert(const std::string& key, Command command) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (capacity_ == 0) {
        return;
    }

    auto existing = entries_.find(key);
    if (existing != entries_.end()) {
        insertion_order_.erase(existing->second.order_it);
        entries_.erase(existing);
    }

    while (entries_.size() >= capacity_ && !insertion_order_.empty()) {
        entries_.erase(insertion_order_.front());
        insertion_order_.pop_front();
    }

    insertion_order_.push_back(key);
    Entry entry;
    entry.command = std::move(command);
    entry.inserted_at = Clock::now();
    entry.order_it = std::prev(insertion_order_.end());
    entries_.emplace(key, std::move(entry));
}

std::optional<ResultCache::Clock::time_point> ResultCache::InsertionTime(
    const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.inserted_at;
}

void ResultCache::Clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.clear();
    insertion_order_.clear();
}

std::size_t ResultCache::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace nl_command
