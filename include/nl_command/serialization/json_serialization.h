#ifndef NL_COMMAND_SERIALIZATION_JSON_SERIALIZATION_H
#define NL_COMMAND_SERIALIZATION_JSON_SERIALIZATION_H

#include <nlohmann/json.hpp>

#include "nl_command/command/command.h"
#include "nl_command/interpreter.h"

// JSON views of interpreter results, for logs and network bridges.
// Integer parameters are emitted as numbers, everything else as strings.

namespace nl_command {

nlohmann::json ToJson(const Command& command);

// "command", "suggestions" and "error" appear only when present.
nlohmann::json ToJson(const InterpretationResult& result);

nlohmann::json ToJson(const InterpreterMetrics& metrics);

nlohmann::json ToJson(const std::vector<HistoryEntry>& history);

// "none", "empty_input", "unrecognized", "not_initialized".
std::string InterpretationErrorToString(InterpretationError error);

}  // namespace nl_command

#endif  // NL_COMMAND_SERIALIZATION_JSON_SERIALIZATION_H
