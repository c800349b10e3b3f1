#include "nl_command/context/command_history.h"

namespace nl_command {

CommandHistory::CommandHistory(std::size_t capacity) : capacity_(capacity) {}

void CommandHistory::Append(HistoryEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (capacity_ == 0) {
        return;
    }

    entries_.push_back(std::move(entry));
    while (entries_.size() > capacity_) {
        entries_.pop_front();
    }
}

std::optional<HistoryEntry> CommandHistory::Latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.empty()) {
        return std::nullopt;
    }
    return entries_.back();
}

std::optional<HistoryEntry> CommandHistory::LatestDistinctFrom(
    const std::string& canonical_form) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->canonical_form != canonical_form) {
            return *it;
        }
    }
    return std::nullopt;
}

std::vector<HistoryEntry> CommandHistory::Entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<HistoryEntry>(entries_.begin(), entries_.end());
}

std::size_t CommandHistory::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void CommandHistory::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

SessionHistoryStore::SessionHistoryStore(std::size_t history_capacity)
    : history_capacity_(history_capacity) {}

std::shared_ptr<CommandHistory> SessionHistoryStore::GetOrCreate(
    const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& history = sessions_[session_id];
    if (!history) {
        history = std::make_shared<CommandHistory>(history_capacity_);
    }
    return history;
}

std::shared_ptr<CommandHistory> SessionHistoryStore::Find(
    const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

bool SessionHistoryStore::ClearSession(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.erase(session_id) > 0;
}

void SessionHistoryStore::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.clear();
}

std::size_t SessionHistoryStore::SessionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

}  // namespace nl_command
