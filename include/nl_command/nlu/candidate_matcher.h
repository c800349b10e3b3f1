#ifndef NL_COMMAND_NLU_CANDIDATE_MATCHER_H
#define NL_COMMAND_NLU_CANDIDATE_MATCHER_H

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "nl_command/catalog/action_descriptor.h"
#include "nl_command/catalog/pattern_catalog.h"
#include "nl_command/interpreter_config.h"
#include "nl_command/nlu/normalizer.h"

namespace nl_command {

// Scored, provisional match between the input and one catalog action.
// Only valid while the catalog it points into is alive.
struct Candidate {
    const ActionDescriptor* action = nullptr;
    const TriggerPattern* pattern = nullptr;   // Best-scoring trigger
    float score = 0.0f;                        // 0.0 - 1.0
    std::size_t specificity = 0;               // Literal tokens in `pattern`
    std::size_t declaration_order = 0;         // Position in the catalog
    bool exact = false;                        // Phrase matched verbatim
    // Input token indices matched by trigger tokens.
    std::vector<std::size_t> matched_indices;
    // Slot captures from {slot} markers (exact matches only).
    std::unordered_map<std::string, TokenSpan> captures;
};

// Scores normalized input against every trigger pattern in the catalog.
//
// Scoring per pattern:
//  1. The phrase matches a contiguous token window: 1.0.
//  2. Otherwise token overlap: each trigger token contributes 1.0 for an
//     identical input token, synonym_weight for a declared synonym, or the
//     normalized similarity for a token within max_edit_distance edits.
//     The sum is divided by the number of trigger tokens.
// An action's candidate is its best pattern. A full-score match is demoted
// when a longer trigger contains all of its words and the remaining input
// words are near misses of the rest ("shw status" is a typo of "show status",
// not an exact "status"). A longer trigger of the same action supplies its
// own score; one of another action leaves the shorter match the share of
// the phrase it explains. Ranking is by score, then specificity, then
// declaration order.
class CandidateMatcher {
public:
    // Neither argument is owned; both must outlive the matcher.
    CandidateMatcher(const PatternCatalog& catalog, const InterpreterConfig& config);

    // Ranked candidates scoring at or above the discard floor.
    std::vector<Candidate> Match(const NormalizedText& input) const;

    // Ranked candidates with a non-zero score, ignoring the floor.
    std::vector<Candidate> RankAll(const NormalizedText& input) const;

    // Weight of a single trigger token against a single input token.
    float TokenWeight(const std::string& trigger_token,
                      const std::string& input_token) const;

private:
    std::vector<Candidate> Evaluate(const NormalizedText& input, float floor) const;

    void DemoteCoveredMatch(const std::vector<const ActionDescriptor*>& actions,
                            const std::vector<std::string>& tokens,
                            Candidate& candidate) const;

    // Score of `longer` when its literals are `literals` (already matched
    // at `matched_indices`) plus near misses among the other tokens.
    // Returns 0 when `longer` does not cover the input that way.
    float CoverScore(const TriggerPattern& longer,
                     const std::vector<std::string>& literals,
                     const std::vector<std::size_t>& matched_indices,
                     const std::vector<std::string>& tokens,
                     std::vector<std::size_t>& cover_indices) const;

    // TokenWeight, plus a single edit on words below the fuzzy length.
    float NearMissWeight(const std::string& trigger_token,
                         const std::string& input_token) const;

    // Scores one pattern. Fills matched indices and captures into `out`.
    float ScorePattern(const TriggerPattern& pattern,
                       const std::vector<std::string>& tokens,
                       Candidate& out) const;

    const PatternCatalog& catalog_;
    const InterpreterConfig& config_;
};

// Ordering used for ranking: higher score, then higher specificity, then
// earlier declaration.
bool CandidateRanksBefore(const Candidate& a, const Candidate& b);

}  // namespace nl_command

#endif  // NL_COMMAND_NLU_CANDIDATE_MATCHER_H
