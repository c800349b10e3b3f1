#ifndef NL_COMMAND_COMMAND_COMMAND_H
#define NL_COMMAND_COMMAND_COMMAND_H

#include <optional>
#include <string>
#include <vector>

#include "nl_command/catalog/action_descriptor.h"
#include "nl_command/command/intent.h"
#include "nl_command/command/param_value.h"

namespace nl_command {

// A resolved slot.
struct ExtractedParameter {
    std::string name;
    SlotType type = SlotType::kString;
    ParamValue value;
};

// Structured command produced by the interpreter.
struct Command {
    Intent intent = Intent::kHelp;
    std::string action;
    std::vector<ExtractedParameter> parameters;   // Slot declaration order
    std::vector<std::string> missing_parameters;  // Required slots not resolved
    float confidence = 0.0f;                      // 0.0 - 1.0
    std::string canonical_form;
    double processing_time_ms = 0.0;

    // Returns the parameter with the given name, or nullptr.
    const ExtractedParameter* FindParameter(const std::string& name) const;

    bool HasParameter(const std::string& name) const {
        return FindParameter(name) != nullptr;
    }
};

// "<intent>.<action>(name=value, ...)"; the parenthesized part is omitted
// when there are no parameters.
std::string BuildCanonicalForm(Intent intent,
                               const std::string& action,
                               const std::vector<ExtractedParameter>& parameters);

// Canonical form reported for input that could not be interpreted.
inline constexpr const char* kUnrecognizedCanonicalForm = "help.unrecognized";

// Why an interpretation failed.
enum class InterpretationError {
    kNone,
    kEmptyInput,
    kUnrecognized,
    kNotInitialized,
};

// Outcome of Interpreter::Interpret().
struct InterpretationResult {
    bool success = false;
    std::optional<Command> command;            // Present iff success
    float confidence = 0.0f;
    std::string canonical_form;
    double processing_time_ms = 0.0;
    bool low_confidence = false;               // confidence < low threshold
    bool from_cache = false;
    // Present iff confidence is below the low-confidence threshold.
    std::optional<std::vector<std::string>> suggestions;
    // Present iff !success.
    std::optional<std::string> error;
    InterpretationError error_kind = InterpretationError::kNone;
};

}  // namespace nl_command

#endif  // NL_COMMAND_COMMAND_COMMAND_H
