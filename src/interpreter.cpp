#include "nl_command/interpreter.h"

#include <chrono>
#include <cstdio>

#include "nl_command/catalog/default_catalog.h"
#include "nl_command/context/context_booster.h"
#include "nl_command/nlu/candidate_matcher.h"
#include "nl_command/nlu/normalizer.h"
#include "nl_command/nlu/parameter_extractor.h"
#include "nl_command/suggestion/suggestion_engine.h"

namespace nl_command {

namespace {

using Clock = std::chrono::steady_clock;

constexpr const char* kEmptyInputError = "could not understand: empty input";
constexpr const char* kUnrecognizedError = "could not understand: no matching command";
constexpr const char* kNotInitializedError = "interpreter not initialized";

double ElapsedMs(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

InterpretationResult FailureResult(InterpretationError kind, const char* message) {
    InterpretationResult result;
    result.success = false;
    result.confidence = 0.0f;
    result.canonical_form = kUnrecognizedCanonicalForm;
    result.low_confidence = true;
    result.suggestions = std::vector<std::string>{};
    result.error = message;
    result.error_kind = kind;
    return result;
}

}  // namespace

Interpreter::Interpreter() = default;

Interpreter::~Interpreter() {
    if (initialized_) {
        Shutdown();
    }
}

bool Interpreter::Init(const InterpreterConfig& config,
                       std::shared_ptr<const PatternCatalog> catalog) {
    if (initialized_) {
        return false;  // Already initialized
    }

    std::string error;
    if (!ValidateConfig(config, error)) {
        std::fprintf(stderr, "Interpreter: invalid configuration: %s\n", error.c_str());
        return false;
    }

    if (!catalog) {
        catalog = BuildDefaultCatalog();
    }
    if (catalog->ActionCount() == 0) {
        std::fprintf(stderr, "Interpreter: catalog has no actions\n");
        return false;
    }

    config_ = config;
    {
        std::unique_lock<std::shared_mutex> lock(catalog_mutex_);
        catalog_ = std::move(catalog);
    }
    cache_ = std::make_unique<ResultCache>(config_.cache_capacity);
    history_store_ = std::make_unique<SessionHistoryStore>(config_.history_capacity);

    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        total_processed_ = 0;
        cache_hits_ = 0;
        total_processing_time_ms_ = 0.0;
    }

    initialized_ = true;
    return true;
}

void Interpreter::Shutdown() {
    if (!initialized_) {
        return;
    }

    initialized_ = false;

    {
        std::unique_lock<std::shared_mutex> lock(catalog_mutex_);
        catalog_.reset();
    }
    cache_.reset();
    history_store_.reset();
}

bool Interpreter::IsInitialized() const {
    return initialized_;
}

InterpretationResult Interpreter::Interpret(const std::string& utterance,
                                            const SessionContext& context,
                                            const std::string& session_id) {
    const auto start = Clock::now();

    if (!initialized_) {
        auto result = FailureResult(InterpretationError::kNotInitialized,
                                    kNotInitializedError);
        result.processing_time_ms = ElapsedMs(start);
        return result;
    }

    // Snapshot: a concurrent ReplaceCatalog() does not affect this call.
    std::shared_ptr<const PatternCatalog> catalog = GetCatalog();

    NormalizedText normalized = Normalize(utterance, catalog->PhraseRewrites());
    if (normalized.IsEmpty()) {
        auto result = FailureResult(InterpretationError::kEmptyInput, kEmptyInputError);
        result.processing_time_ms = ElapsedMs(start);
        RecordMetrics(result.processing_time_ms, false);
        LogResult(utterance, result);
        return result;
    }

    auto history = history_store_->GetOrCreate(session_id);
    const std::string cache_key = CacheKey(normalized, context);

    // Step 1: cache
    if (auto cached = cache_->Lookup(cache_key)) {
        InterpretationResult result;
        result.success = true;
        result.from_cache = true;
        result.confidence = cached->confidence;
        result.canonical_form = cached->canonical_form;
        result.low_confidence = cached->confidence < config_.low_confidence_threshold;
        result.processing_time_ms = ElapsedMs(start);
        cached->processing_time_ms = result.processing_time_ms;

        history->Append({cached->intent, cached->canonical_form});
        result.command = std::move(cached);

        RecordMetrics(result.processing_time_ms, true);
        LogResult(utterance, result);
        return result;
    }

    // Step 2: match
    CandidateMatcher matcher(*catalog, config_);
    SuggestionEngine suggestion_engine(*catalog, config_);

    std::vector<Candidate> candidates = matcher.Match(normalized);
    if (candidates.empty()) {
        auto result = FailureResult(InterpretationError::kUnrecognized, kUnrecognizedError);
        result.suggestions = suggestion_engine.SuggestAlternatives(normalized, "");
        result.processing_time_ms = ElapsedMs(start);
        RecordMetrics(result.processing_time_ms, false);
        LogResult(utterance, result);
        return result;
    }
    const Candidate& best = candidates.front();

    // Step 3: parameters
    ParameterExtractor extractor;
    ExtractionResult extraction = extractor.Extract(best, normalized, context);

    Command command;
    command.intent = best.action->intent;
    command.action = best.action->name;
    command.parameters = std::move(extraction.parameters);
    command.missing_parameters = std::move(extraction.missing_parameters);
    command.canonical_form =
        BuildCanonicalForm(command.intent, command.action, command.parameters);
    command.confidence = best.score;
    if (!command.missing_parameters.empty()) {
        command.confidence *= config_.missing_parameter_penalty;
    }

    // Step 4: context
    ContextBooster booster(config_);
    command.confidence =
        booster.Boost(command, context, history->LatestDistinctFrom(command.canonical_form))
            .confidence;

    InterpretationResult result;
    result.success = true;
    result.confidence = command.confidence;
    result.canonical_form = command.canonical_form;
    result.low_confidence = command.confidence < config_.low_confidence_threshold;
    if (result.low_confidence) {
        result.suggestions =
            suggestion_engine.SuggestAlternatives(normalized, best.action->QualifiedName());
    }

    // Step 5: remember
    if (command.confidence >= config_.cache_threshold &&
        command.missing_parameters.empty()) {
        cache_->Insert(cache_key, command);
    }
    history->Append({command.intent, command.canonical_form});

    result.processing_time_ms = ElapsedMs(start);
    command.processing_time_ms = result.processing_time_ms;
    result.command = std::move(command);

    RecordMetrics(result.processing_time_ms, false);
    LogResult(utterance, result);
    return result;
}

InterpreterMetrics Interpreter::GetMetrics() const {
    InterpreterMetrics metrics;

    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        metrics.total_processed = total_processed_;
        metrics.cache_hits = cache_hits_;
        if (total_processed_ > 0) {
            metrics.cache_hit_ratio =
                static_cast<double>(cache_hits_) / static_cast<double>(total_processed_);
            metrics.average_processing_time_ms =
                total_processing_time_ms_ / static_cast<double>(total_processed_);
        }
    }

    if (!initialized_) {
        return metrics;
    }

    if (auto catalog = GetCatalog()) {
        metrics.supported_intents_count = catalog->SupportedIntentCount();
        metrics.supported_actions_count = catalog->ActionCount();
    }
    metrics.cache_size = cache_->Size();
    metrics.session_count = history_store_->SessionCount();
    return metrics;
}

bool Interpreter::ReplaceCatalog(std::shared_ptr<const PatternCatalog> catalog) {
    if (!initialized_ || !catalog || catalog->ActionCount() == 0) {
        return false;
    }

    {
        std::unique_lock<std::shared_mutex> lock(catalog_mutex_);
        catalog_ = std::move(catalog);
    }
    // Cached commands may name actions the new catalog no longer has.
    cache_->Clear();

    std::fprintf(stderr, "Interpreter: catalog replaced, cache cleared\n");
    return true;
}

std::vector<std::string> Interpreter::SuggestPhrases(const std::string& partial_text,
                                                     std::size_t limit) const {
    auto catalog = GetCatalog();
    if (!catalog) {
        return {};
    }

    SuggestionEngine suggestion_engine(*catalog, config_);
    return suggestion_engine.SuggestPhrases(partial_text, limit);
}

bool Interpreter::ClearSession(const std::string& session_id) {
    if (!initialized_) {
        return false;
    }
    return history_store_->ClearSession(session_id);
}

std::vector<HistoryEntry> Interpreter::GetHistory(const std::string& session_id) const {
    if (!initialized_) {
        return {};
    }

    auto history = history_store_->Find(session_id);
    if (!history) {
        return {};
    }
    return history->Entries();
}

std::shared_ptr<const PatternCatalog> Interpreter::GetCatalog() const {
    std::shared_lock<std::shared_mutex> lock(catalog_mutex_);
    return catalog_;
}

const InterpreterConfig& Interpreter::GetConfig() const {
    return config_;
}

ResultCache* Interpreter::GetCache() {
    return cache_.get();
}

SessionHistoryStore* Interpreter::GetHistoryStore() {
    return history_store_.get();
}

std::string Interpreter::CacheKey(const NormalizedText& normalized,
                                  const SessionContext& context) const {
    // Original casing: "README.md" and "readme.md" are different files.
    std::string key;
    for (const auto& word : normalized.raw_tokens) {
        if (!key.empty()) {
            key += ' ';
        }
        key += word;
    }
    if (!config_.cache_key_includes_context) {
        return key;
    }

    // Unit separator keeps fields from running into each other.
    key += '\x1f';
    key += context.current_file;
    key += '\x1f';
    key += context.current_directory;
    for (const auto& flag : context.mode_flags) {
        key += '\x1f';
        key += flag;
    }
    return key;
}

void Interpreter::RecordMetrics(double processing_time_ms, bool cache_hit) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    ++total_processed_;
    if (cache_hit) {
        ++cache_hits_;
    }
    total_processing_time_ms_ += processing_time_ms;
}

void Interpreter::LogResult(const std::string& utterance,
                            const InterpretationResult& result) const {
    if (!config_.enable_debug_logging) {
        return;
    }

    std::fprintf(stderr, "Interpreter: \"%s\" -> %s (confidence %.2f, %.3f ms%s)\n",
                 utterance.c_str(), result.canonical_form.c_str(), result.confidence,
                 result.processing_time_ms, result.from_cache ? ", cached" : "");
    if (result.error) {
        std::fprintf(stderr, "Interpreter: error: %s\n", result.error->c_str());
    }
}

}  // namespace nl_command
