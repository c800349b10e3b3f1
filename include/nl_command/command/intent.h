#ifndef NL_COMMAND_COMMAND_INTENT_H
#define NL_COMMAND_COMMAND_INTENT_H

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace nl_command {

// Top-level category of a recognized command. Closed set.
// Functions over Intent switch exhaustively without a default label so the
// compiler reports any Intent left unhandled.
enum class Intent {
    kSystemStatus,
    kFileOperations,
    kProjectNavigation,
    kCodeAnalysis,
    kTaskManagement,
    kVoiceControl,
    kHelp,
};

inline constexpr std::size_t kIntentCount = 7;

// All intents in declaration order.
inline constexpr std::array<Intent, kIntentCount> kAllIntents = {
    Intent::kSystemStatus,
    Intent::kFileOperations,
    Intent::kProjectNavigation,
    Intent::kCodeAnalysis,
    Intent::kTaskManagement,
    Intent::kVoiceControl,
    Intent::kHelp,
};

// Stable wire name, e.g. "task_management". Used in canonical forms.
std::string IntentToString(Intent intent);

// Inverse of IntentToString. Returns nullopt for unknown names.
std::optional<Intent> IntentFromString(const std::string& name);

// Session mode flag that signals affinity to the intent ("voice_active"
// for kVoiceControl). Empty when the intent has none.
std::string IntentModeFlag(Intent intent);

// Position of the intent in kAllIntents.
std::size_t IntentIndex(Intent intent);

}  // namespace nl_command

#endif  // NL_COMMAND_COMMAND_INTENT_H
