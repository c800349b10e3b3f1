#ifndef NL_COMMAND_CONTEXT_CONTEXT_BOOSTER_H
#define NL_COMMAND_CONTEXT_CONTEXT_BOOSTER_H

#include <optional>

#include "nl_command/command/command.h"
#include "nl_command/context/command_history.h"
#include "nl_command/context/session_context.h"
#include "nl_command/interpreter_config.h"

namespace nl_command {

// Breakdown of the adjustments applied to one command.
struct BoostResult {
    float confidence = 0.0f;   // Final, clamped to [0, 1]
    bool history_applied = false;
    bool context_applied = false;
    bool mode_applied = false;
};

// Adjusts confidence using session context, mode flags and the previous
// command of the session. Additive, never subtractive. Pure.
class ContextBooster {
public:
    explicit ContextBooster(const InterpreterConfig& config);

    BoostResult Boost(const Command& command,
                      const SessionContext& context,
                      const std::optional<HistoryEntry>& previous) const;

private:
    const InterpreterConfig& config_;
};

}  // namespace nl_command

#endif  // NL_COMMAND_CONTEXT_CONTEXT_BOOSTER_H
