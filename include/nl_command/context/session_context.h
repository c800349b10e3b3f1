#ifndef NL_COMMAND_CONTEXT_SESSION_CONTEXT_H
#define NL_COMMAND_CONTEXT_SESSION_CONTEXT_H

#include <set>
#include <string>

namespace nl_command {

// Supplied by the caller on every Interpret() call. Read-only to the core.
struct SessionContext {
    std::string current_file;        // "src/main.py", empty if none
    std::string current_directory;   // "/home/user/project", empty if none
    std::set<std::string> mode_flags;  // "voice_active", "task_context", ...

    bool HasMode(const std::string& flag) const {
        return mode_flags.count(flag) > 0;
    }
};

}  // namespace nl_command

#endif  // NL_COMMAND_CONTEXT_SESSION_CONTEXT_H
