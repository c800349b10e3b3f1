#include "nl_command/interpreter_config.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace nl_command {

namespace {

bool InUnitRange(float value) {
    return value >= 0.0f && value <= 1.0f;
}

// Copies json[key] into `out` when present. Throws nlohmann::json::type_error
// when the value has the wrong type.
template <typename T>
void ReadIfPresent(const nlohmann::json& json, const char* key, T& out) {
    auto it = json.find(key);
    if (it != json.end()) {
        out = it->template get<T>();
    }
}

}  // namespace

bool ValidateConfig(const InterpreterConfig& config, std::string& error) {
    if (!InUnitRange(config.discard_floor)) {
        error = "discard_floor must be within [0, 1]";
        return false;
    }
    if (!InUnitRange(config.cache_threshold)) {
        error = "cache_threshold must be within [0, 1]";
        return false;
    }
    if (!InUnitRange(config.low_confidence_threshold)) {
        error = "low_confidence_threshold must be within [0, 1]";
        return false;
    }
    if (!InUnitRange(config.synonym_weight)) {
        error = "synonym_weight must be within [0, 1]";
        return false;
    }
    if (!InUnitRange(config.missing_parameter_penalty)) {
        error = "missing_parameter_penalty must be within [0, 1]";
        return false;
    }
    if (!InUnitRange(config.history_bonus) || !InUnitRange(config.context_bonus) ||
        !InUnitRange(config.mode_bonus)) {
        error = "confidence bonuses must be within [0, 1]";
        return false;
    }
    if (config.history_capacity == 0) {
        error = "history_capacity must be positive";
        return false;
    }
    if (config.cache_capacity == 0) {
        error = "cache_capacity must be positive";
        return false;
    }
    if (config.low_confidence_threshold > config.cache_threshold) {
        error = "low_confidence_threshold must not exceed cache_threshold";
        return false;
    }
    return true;
}

bool LoadConfigFromJson(const std::string& json_text,
                        InterpreterConfig& config,
                        std::string& error) {
    InterpreterConfig loaded = config;

    try {
        auto json = nlohmann::json::parse(json_text);
        if (!json.is_object()) {
            error = "Configuration must be a JSON object";
            return false;
        }

        ReadIfPresent(json, "discard_floor", loaded.discard_floor);
        ReadIfPresent(json, "cache_threshold", loaded.cache_threshold);
        ReadIfPresent(json, "low_confidence_threshold", loaded.low_confidence_threshold);
        ReadIfPresent(json, "max_edit_distance", loaded.max_edit_distance);
        ReadIfPresent(json, "min_fuzzy_token_length", loaded.min_fuzzy_token_length);
        ReadIfPresent(json, "synonym_weight", loaded.synonym_weight);
        ReadIfPresent(json, "missing_parameter_penalty", loaded.missing_parameter_penalty);
        ReadIfPresent(json, "history_bonus", loaded.history_bonus);
        ReadIfPresent(json, "context_bonus", loaded.context_bonus);
        ReadIfPresent(json, "mode_bonus", loaded.mode_bonus);
        ReadIfPresent(json, "history_capacity", loaded.history_capacity);
        ReadIfPresent(json, "cache_capacity", loaded.cache_capacity);
        ReadIfPresent(json, "max_suggestions", loaded.max_suggestions);
        ReadIfPresent(json, "cache_key_includes_context", loaded.cache_key_includes_context);
        ReadIfPresent(json, "enable_debug_logging", loaded.enable_debug_logging);

    } catch (const nlohmann::json::exception& e) {
        error = std::string("Invalid configuration: ") + e.what();
        return false;
    }

    config = loaded;
    return true;
}

bool LoadConfigFromFile(const std::string& path,
                        InterpreterConfig& config,
                        std::string& error) {
    std::ifstream file(path);
    if (!file) {
        error = "Cannot open configuration file: " + path;
        return false;
    }

    std::ostringstream content;
    content << file.rdbuf();
    return LoadConfigFromJson(content.str(), config, error);
}

}  // namespace nl_command
