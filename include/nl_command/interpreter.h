#ifndef NL_COMMAND_INTERPRETER_H
#define NL_COMMAND_INTERPRETER_H

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "nl_command/cache/result_cache.h"
#include "nl_command/catalog/pattern_catalog.h"
#include "nl_command/command/command.h"
#include "nl_command/context/command_history.h"
#include "nl_command/context/session_context.h"
#include "nl_command/interpreter_config.h"
#include "nl_command/nlu/normalizer.h"

namespace nl_command {

inline constexpr const char* kDefaultSessionId = "default";

/// Read-only snapshot of interpreter counters.
struct InterpreterMetrics {
    std::size_t total_processed = 0;
    std::size_t cache_hits = 0;
    /// cache_hits / total_processed, 0.0 when nothing was processed
    double cache_hit_ratio = 0.0;
    double average_processing_time_ms = 0.0;
    std::size_t supported_intents_count = 0;
    std::size_t supported_actions_count = 0;
    std::size_t cache_size = 0;
    std::size_t session_count = 0;
};

/// Interpreter turns free-form command text into structured Commands.
///
/// Pipeline per call:
/// - Normalize the text
/// - Result cache lookup (short-circuits on hit)
/// - Candidate matching against the pattern catalog
/// - Parameter extraction for the winning action
/// - Context boosting from the session context and history
/// - Cache write and history append
///
/// Ownership:
/// - The catalog is shared read-only; ReplaceCatalog() swaps it atomically
/// - The result cache and the per-session histories are owned by the
///   interpreter, so separate instances never share state
///
/// Thread Safety:
/// - Interpret(), GetMetrics(), SuggestPhrases(), ClearSession(),
///   GetHistory() and ReplaceCatalog() may be called concurrently
/// - Init() and Shutdown() must not race with other calls
class Interpreter {
public:
    Interpreter();
    ~Interpreter();

    Interpreter(const Interpreter&) = delete;
    Interpreter& operator=(const Interpreter&) = delete;
    Interpreter(Interpreter&&) = delete;
    Interpreter& operator=(Interpreter&&) = delete;

    /// Initialize the interpreter
    /// @param config Thresholds and capacities; rejected if invalid
    /// @param catalog Action catalog; the built-in catalog when null
    /// @return true if initialization succeeded
    bool Init(const InterpreterConfig& config,
              std::shared_ptr<const PatternCatalog> catalog = nullptr);

    /// Release the catalog, cache and histories
    void Shutdown();

    bool IsInitialized() const;

    /// Interpret one utterance. Never throws for malformed input.
    /// @param utterance Raw text, e.g. "open file test.py"
    /// @param context Caller's current file, directory and mode flags
    /// @param session_id Key of the history used for context boosting
    InterpretationResult Interpret(const std::string& utterance,
                                   const SessionContext& context = {},
                                   const std::string& session_id = kDefaultSessionId);

    /// Counters and sizes. Side-effect free.
    InterpreterMetrics GetMetrics() const;

    /// Install a new catalog and clear the result cache.
    /// Calls already in flight finish on the catalog they started with.
    /// @return false if not initialized or the catalog is null or empty
    bool ReplaceCatalog(std::shared_ptr<const PatternCatalog> catalog);

    /// Trigger phrases completing a partial utterance
    std::vector<std::string> SuggestPhrases(const std::string& partial_text,
                                            std::size_t limit = 5) const;

    /// Drop a session's history
    /// @return true if the session existed
    bool ClearSession(const std::string& session_id);

    /// A session's history, oldest first. Empty for unknown sessions.
    std::vector<HistoryEntry> GetHistory(const std::string& session_id) const;

    /// Current catalog snapshot (null before Init)
    std::shared_ptr<const PatternCatalog> GetCatalog() const;

    const InterpreterConfig& GetConfig() const;

    /// Owned stores, exposed for inspection (null before Init)
    ResultCache* GetCache();
    SessionHistoryStore* GetHistoryStore();

private:
    std::string CacheKey(const NormalizedText& normalized,
                         const SessionContext& context) const;

    void RecordMetrics(double processing_time_ms, bool cache_hit);

    void LogResult(const std::string& utterance, const InterpretationResult& result) const;

    InterpreterConfig config_;
    std::atomic<bool> initialized_{false};

    std::shared_ptr<const PatternCatalog> catalog_;
    mutable std::shared_mutex catalog_mutex_;

    std::unique_ptr<ResultCache> cache_;
    std::unique_ptr<SessionHistoryStore> history_store_;

    // Metrics
    mutable std::mutex metrics_mutex_;
    std::size_t total_processed_ = 0;
    std::size_t cache_hits_ = 0;
    double total_processing_time_ms_ = 0.0;
};

}  // namespace nl_command

#endif  // NL_COMMAND_INTERPRETER_H
