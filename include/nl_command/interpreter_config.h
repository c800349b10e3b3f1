#ifndef NL_COMMAND_INTERPRETER_CONFIG_H
#define NL_COMMAND_INTERPRETER_CONFIG_H

#include <cstddef>
#include <string>

namespace nl_command {

/// Configuration for Interpreter. Every threshold of the pipeline lives here.
struct InterpreterConfig {
    /// Candidates scoring below this are discarded (0.0-1.0)
    float discard_floor = 0.3f;

    /// Results at or above this confidence are cached (0.0-1.0)
    float cache_threshold = 0.9f;

    /// Results below this confidence carry suggestions (0.0-1.0)
    float low_confidence_threshold = 0.5f;

    /// Maximum absolute edit distance for a fuzzy token match
    std::size_t max_edit_distance = 2;

    /// Trigger tokens shorter than this only match exactly
    std::size_t min_fuzzy_token_length = 4;

    /// Weight of a token matched through the synonym table (0.0-1.0)
    float synonym_weight = 0.9f;

    /// Confidence multiplier applied when a required slot is unresolved
    float missing_parameter_penalty = 0.9f;

    /// Bonus when the previous command of the session has the same intent
    float history_bonus = 0.05f;

    /// Bonus when a path parameter names the session's current file/directory
    float context_bonus = 0.1f;

    /// Bonus when the session mode flag matching the intent is set
    float mode_bonus = 0.05f;

    /// Per-session history ring buffer capacity
    std::size_t history_capacity = 20;

    /// Maximum number of cached results
    std::size_t cache_capacity = 100;

    /// Maximum number of alternative actions suggested
    std::size_t max_suggestions = 3;

    /// Key the cache on normalized text plus session context instead of
    /// normalized text alone
    bool cache_key_includes_context = false;

    /// Log every interpretation to stderr
    bool enable_debug_logging = false;
};

/// Checks ranges and relationships between thresholds.
/// @param config Configuration to check
/// @param error Receives a description of the first problem found
/// @return true if the configuration is usable
bool ValidateConfig(const InterpreterConfig& config, std::string& error);

/// Reads configuration from JSON text. Keys absent from the JSON keep the
/// values already in `config`; unknown keys are ignored.
/// @param json_text JSON object, e.g. {"discard_floor": 0.25}
/// @param config In/out configuration
/// @param error Receives a parse or type error
/// @return true on success; `config` is left untouched on failure
bool LoadConfigFromJson(const std::string& json_text,
                        InterpreterConfig& config,
                        std::string& error);

/// Reads configuration from a JSON file. See LoadConfigFromJson().
bool LoadConfigFromFile(const std::string& path,
                        InterpreterConfig& config,
                        std::string& error);

}  // namespace nl_command

#endif  // NL_COMMAND_INTERPRETER_CONFIG_H
