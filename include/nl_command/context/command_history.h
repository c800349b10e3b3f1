#ifndef NL_COMMAND_CONTEXT_COMMAND_HISTORY_H
#define NL_COMMAND_CONTEXT_COMMAND_HISTORY_H

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "nl_command/command/intent.h"

namespace nl_command {

struct HistoryEntry {
    Intent intent = Intent::kHelp;
    std::string canonical_form;
};

// Bounded ring buffer of the commands recognized in one session.
// Oldest entries are evicted first. Thread-safe.
class CommandHistory {
public:
    explicit CommandHistory(std::size_t capacity);

    void Append(HistoryEntry entry);

    // Most recent entry, if any.
    std::optional<HistoryEntry> Latest() const;

    // Most recent entry whose canonical form differs from |canonical_form|.
    // Repeating a command does not hide the command issued before it.
    std::optional<HistoryEntry> LatestDistinctFrom(const std::string& canonical_form) const;

    // Oldest first.
    std::vector<HistoryEntry> Entries() const;

    std::size_t Size() const;
    std::size_t Capacity() const { return capacity_; }

    void Clear();

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<HistoryEntry> entries_;
};

// Owns one CommandHistory per session id. Histories are created on first
// use and live until ClearSession() or Clear().
class SessionHistoryStore {
public:
    explicit SessionHistoryStore(std::size_t history_capacity);

    // Returns the session's history, creating it if needed.
    std::shared_ptr<CommandHistory> GetOrCreate(const std::string& session_id);

    // Returns the session's history or nullptr.
    std::shared_ptr<CommandHistory> Find(const std::string& session_id) const;

    // Returns true if the session existed.
    bool ClearSession(const std::string& session_id);

    void Clear();

    std::size_t SessionCount() const;

private:
    const std::size_t history_capacity_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<CommandHistory>> sessions_;
};

}  // namespace nl_command

#endif  // NL_COMMAND_CONTEXT_COMMAND_HISTORY_H
