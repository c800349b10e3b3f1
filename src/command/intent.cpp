#include "nl_command/command/intent.h"

namespace nl_command {

std::string IntentToString(Intent intent) {
    switch (intent) {
        case Intent::kSystemStatus:
            return "system_status";
        case Intent::kFileOperations:
            return "file_operations";
        case Intent::kProjectNavigation:
            return "project_navigation";
        case Intent::kCodeAnalysis:
            return "code_analysis";
        case Intent::kTaskManagement:
            return "task_management";
        case Intent::kVoiceControl:
            return "voice_control";
        case Intent::kHelp:
            return "help";
    }
    return "unknown";
}

std::optional<Intent> IntentFromString(const std::string& name) {
    for (Intent intent : kAllIntents) {
        if (IntentToString(intent) == name) {
            return intent;
        }
    }
    return std::nullopt;
}

std::string IntentModeFlag(Intent intent) {
    switch (intent) {
        case Intent::kVoiceControl:
            return "voice_active";
        case Intent::kTaskManagement:
            return "task_context";
        case Intent::kSystemStatus:
        case Intent::kFileOperations:
        case Intent::kProjectNavigation:
        case Intent::kCodeAnalysis:
        case Intent::kHelp:
            return "";
    }
    return "";
}

std::size_t IntentIndex(Intent intent) {
    switch (intent) {
        case Intent::kSystemStatus:
            return 0;
        case Intent::kFileOperations:
            return 1;
        case Intent::kProjectNavigation:
            return 2;
        case Intent::kCodeAnalysis:
            return 3;
        case Intent::kTaskManagement:
            return 4;
        case Intent::kVoiceControl:
            return 5;
        case Intent::kHelp:
            return 6;
    }
    return 0;
}

}  // namespace nl_command
