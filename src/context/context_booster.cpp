#include "nl_command/context/context_booster.h"

#include <algorithm>

namespace nl_command {

ContextBooster::ContextBooster(const InterpreterConfig& config) : config_(config) {}

BoostResult ContextBooster::Boost(const Command& command,
                                  const SessionContext& context,
                                  const std::optional<HistoryEntry>& previous) const {
    BoostResult result;
    float confidence = command.confidence;

    // Continuing a conversation in the same domain. Repeating the exact
    // same command earns nothing.
    if (previous && previous->intent == command.intent &&
        previous->canonical_form != command.canonical_form) {
        confidence += config_.history_bonus;
        result.history_applied = true;
    }

    for (const auto& parameter : command.parameters) {
        if (parameter.type != SlotType::kPath) continue;
        const std::string& value = parameter.value.AsString();
        if ((!context.current_file.empty() && value == context.current_file) ||
            (!context.current_directory.empty() && value == context.current_directory)) {
            confidence += config_.context_bonus;
            result.context_applied = true;
            break;
        }
    }

    std::string mode_flag = IntentModeFlag(command.intent);
    if (!mode_flag.empty() && context.HasMode(mode_flag)) {
        confidence += config_.mode_bonus;
        result.mode_applied = true;
    }

    result.confidence = std::clamp(confidence, 0.0f, 1.0f);
    return result;
}

}  // namespace nl_command
