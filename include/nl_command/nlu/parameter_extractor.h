#ifndef NL_COMMAND_NLU_PARAMETER_EXTRACTOR_H
#define NL_COMMAND_NLU_PARAMETER_EXTRACTOR_H

#include <string>
#include <vector>

#include "nl_command/command/command.h"
#include "nl_command/context/session_context.h"
#include "nl_command/nlu/candidate_matcher.h"
#include "nl_command/nlu/normalizer.h"

namespace nl_command {

struct ExtractionResult {
    // Resolved slots in slot declaration order.
    std::vector<ExtractedParameter> parameters;
    // Names of required slots that could not be resolved.
    std::vector<std::string> missing_parameters;
};

// Resolves the slots of the winning action from the utterance.
//
// Resolution order: {slot} captures of the winning pattern, then every
// non free-text slot in declaration order, then free-text slots. A token
// taken by one slot is not available to the next. Values keep the casing
// of the original text ("Main.cpp", "@Alice" -> "Alice").
class ParameterExtractor {
public:
    ExtractionResult Extract(const Candidate& candidate,
                             const NormalizedText& input,
                             const SessionContext& context) const;
};

// Parses "75", "#12" or "75%". Returns false for anything else.
bool ParseIntegerToken(const std::string& token, int& value);

// True for tokens that look like a path: a separator ("src/main.cc",
// "..\\lib") or a file extension ("test.py").
bool LooksLikePath(const std::string& token);

}  // namespace nl_command

#endif  // NL_COMMAND_NLU_PARAMETER_EXTRACTOR_H
