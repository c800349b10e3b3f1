#include "nl_command/command/command.h"

namespace nl_command {

const ExtractedParameter* Command::FindParameter(const std::string& name) const {
    for (const auto& parameter : parameters) {
        if (parameter.name == name) {
            return &parameter;
        }
    }
    return nullptr;
}

std::string BuildCanonicalForm(Intent intent,
                               const std::string& action,
                               const std::vector<ExtractedParameter>& parameters) {
    std::string canonical = IntentToString(intent) + "." + action;
    if (parameters.empty()) {
        return canonical;
    }

    canonical += "(";
    for (size_t i = 0; i < parameters.size(); ++i) {
        if (i > 0) canonical += ", ";
        canonical += parameters[i].name + "=" + parameters[i].value.AsString();
    }
    canonical += ")";
    return canonical;
}

}  // namespace nl_command
