#include "nl_command/serialization/json_serialization.h"

namespace nl_command {

std::string InterpretationErrorToString(InterpretationError error) {
    switch (error) {
        case InterpretationError::kNone:
            return "none";
        case InterpretationError::kEmptyInput:
            return "empty_input";
        case InterpretationError::kUnrecognized:
            return "unrecognized";
        case InterpretationError::kNotInitialized:
            return "not_initialized";
    }
    return "none";
}

nlohmann::json ToJson(const Command& command) {
    nlohmann::json parameters = nlohmann::json::object();
    for (const auto& parameter : command.parameters) {
        auto number = parameter.type == SlotType::kInteger ? parameter.value.TryAsInt()
                                                           : std::nullopt;
        if (number) {
            parameters[parameter.name] = *number;
        } else {
            parameters[parameter.name] = parameter.value.AsString();
        }
    }

    nlohmann::json json;
    json["intent"] = IntentToString(command.intent);
    json["action"] = command.action;
    json["parameters"] = std::move(parameters);
    json["missing_parameters"] = command.missing_parameters;
    json["confidence"] = command.confidence;
    json["canonical_form"] = command.canonical_form;
    json["processing_time_ms"] = command.processing_time_ms;
    return json;
}

nlohmann::json ToJson(const InterpretationResult& result) {
    nlohmann::json json;
    json["success"] = result.success;
    json["confidence"] = result.confidence;
    json["canonical_form"] = result.canonical_form;
    json["processing_time_ms"] = result.processing_time_ms;
    json["low_confidence"] = result.low_confidence;
    json["from_cache"] = result.from_cache;
    json["error_kind"] = InterpretationErrorToString(result.error_kind);

    if (result.command) {
        json["command"] = ToJson(*result.command);
    }
    if (result.suggestions) {
        json["suggestions"] = *result.suggestions;
    }
    if (result.error) {
        json["error"] = *result.error;
    }
    return json;
}

nlohmann::json ToJson(const InterpreterMetrics& metrics) {
    return {
        {"total_processed", metrics.total_processed},
        {"cache_hits", metrics.cache_hits},
        {"cache_hit_ratio", metrics.cache_hit_ratio},
        {"average_processing_time_ms", metrics.average_processing_time_ms},
        {"supported_intents_count", metrics.supported_intents_count},
        {"supported_actions_count", metrics.supported_actions_count},
        {"cache_size", metrics.cache_size},
        {"session_count", metrics.session_count},
    };
}

nlohmann::json ToJson(const std::vector<HistoryEntry>& history) {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& entry : history) {
        entries.push_back({
            {"intent", IntentToString(entry.intent)},
            {"canonical_form", entry.canonical_form},
        });
    }
    return entries;
}

}  // namespace nl_command
