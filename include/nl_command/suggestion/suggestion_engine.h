#ifndef NL_COMMAND_SUGGESTION_SUGGESTION_ENGINE_H
#define NL_COMMAND_SUGGESTION_SUGGESTION_ENGINE_H

#include <cstddef>
#include <string>
#include <vector>

#include "nl_command/catalog/pattern_catalog.h"
#include "nl_command/interpreter_config.h"
#include "nl_command/nlu/candidate_matcher.h"
#include "nl_command/nlu/normalizer.h"

namespace nl_command {

// Phrases offered when there is nothing better to suggest.
extern const std::vector<std::string> kStarterPhrases;

// Proposes alternatives to help the caller re-prompt the user.
// Never alters the confidence of a result.
class SuggestionEngine {
public:
    // Neither argument is owned; both must outlive the engine.
    SuggestionEngine(const PatternCatalog& catalog, const InterpreterConfig& config);

    /// Alternative actions for a low-confidence or unrecognized input.
    /// @param input Normalized utterance
    /// @param exclude Qualified action name to leave out (the primary
    ///                result), empty for none
    /// @return Up to max_suggestions "intent.action" names, best first
    std::vector<std::string> SuggestAlternatives(const NormalizedText& input,
                                                 const std::string& exclude) const;

    /// Trigger phrases completing a partial utterance, best first.
    /// Empty input, or input nothing relates to, yields kStarterPhrases.
    std::vector<std::string> SuggestPhrases(const std::string& partial_text,
                                            std::size_t limit) const;

private:
    const PatternCatalog& catalog_;
    const InterpreterConfig& config_;
    CandidateMatcher matcher_;
};

}  // namespace nl_command

#endif  // NL_COMMAND_SUGGESTION_SUGGESTION_ENGINE_H
