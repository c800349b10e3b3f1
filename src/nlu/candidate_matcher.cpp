#include "nl_command/nlu/candidate_matcher.h"

#include <algorithm>
#include <cmath>

#include "nl_command/nlu/string_similarity.h"

namespace nl_command {

namespace {

constexpr float kScoreEpsilon = 1e-6f;

}  // namespace

bool CandidateRanksBefore(const Candidate& a, const Candidate& b) {
    if (std::fabs(a.score - b.score) > kScoreEpsilon) {
        return a.score > b.score;
    }
    if (a.specificity != b.specificity) {
        return a.specificity > b.specificity;
    }
    return a.declaration_order < b.declaration_order;
}

CandidateMatcher::CandidateMatcher(const PatternCatalog& catalog,
                                   const InterpreterConfig& config)
    : catalog_(catalog), config_(config) {}

std::vector<Candidate> CandidateMatcher::Match(const NormalizedText& input) const {
    return Evaluate(input, config_.discard_floor);
}

std::vector<Candidate> CandidateMatcher::RankAll(const NormalizedText& input) const {
    return Evaluate(input, 0.0f);
}

std::vector<Candidate> CandidateMatcher::Evaluate(const NormalizedText& input,
                                                  float floor) const {
    std::vector<Candidate> candidates;
    if (input.IsEmpty()) {
        return candidates;
    }

    const std::vector<const ActionDescriptor*> actions = catalog_.AllActions();
    std::vector<Candidate> best_per_action;
    best_per_action.reserve(actions.size());

    std::size_t order = 0;
    for (const ActionDescriptor* action : actions) {
        Candidate best;
        best.action = action;
        best.declaration_order = order++;

        for (const auto& pattern : action->triggers) {
            Candidate scored;
            float score = ScorePattern(pattern, input.tokens, scored);

            bool better = score > best.score + kScoreEpsilon ||
                          (std::fabs(score - best.score) <= kScoreEpsilon &&
                           pattern.Specificity() > best.specificity);
            if (best.pattern == nullptr || better) {
                best.pattern = &pattern;
                best.score = score;
                best.specificity = pattern.Specificity();
                best.exact = scored.exact;
                best.matched_indices = std::move(scored.matched_indices);
                best.captures = std::move(scored.captures);
            }
        }
        best_per_action.push_back(std::move(best));
    }

    for (auto& best : best_per_action) {
        DemoteCoveredMatch(actions, input.tokens, best);
        if (best.score <= 0.0f || best.score + kScoreEpsilon < floor) {
            continue;
        }
        candidates.push_back(std::move(best));
    }

    std::stable_sort(candidates.begin(), candidates.end(), CandidateRanksBefore);
    return candidates;
}

void CandidateMatcher::DemoteCoveredMatch(const std::vector<const ActionDescriptor*>& actions,
                                          const std::vector<std::string>& tokens,
                                          Candidate& candidate) const {
    if (candidate.pattern == nullptr || candidate.pattern->HasMarkers() ||
        candidate.score + kScoreEpsilon < 1.0f) {
        return;
    }

    const std::vector<std::string> literals = candidate.pattern->Literals();
    for (const ActionDescriptor* action : actions) {
        const bool same_action = action == candidate.action;

        for (const auto& longer : action->triggers) {
            if (longer.HasMarkers() || longer.Specificity() <= literals.size()) {
                continue;
            }

            std::vector<std::size_t> cover_indices;
            float cover = CoverScore(longer, literals, candidate.matched_indices, tokens,
                                     cover_indices);
            if (cover <= 0.0f) {
                continue;
            }

            // Another action's trigger explains more of the input; this
            // action keeps only its share of that phrase.
            float score = same_action
                              ? cover
                              : static_cast<float>(literals.size()) /
                                    static_cast<float>(longer.Specificity());
            if (score + kScoreEpsilon >= candidate.score) {
                continue;
            }

            candidate.score = score;
            candidate.exact = false;
            if (same_action) {
                candidate.pattern = &longer;
                candidate.specificity = longer.Specificity();
                candidate.matched_indices = std::move(cover_indices);
            }
        }
    }
}

float CandidateMatcher::CoverScore(const TriggerPattern& longer,
                                   const std::vector<std::string>& literals,
                                   const std::vector<std::size_t>& matched_indices,
                                   const std::vector<std::string>& tokens,
                                   std::vector<std::size_t>& cover_indices) const {
    std::vector<std::string> unclaimed = literals;
    cover_indices = matched_indices;
    float total = 0.0f;

    for (const auto& literal : longer.Literals()) {
        auto it = std::find(unclaimed.begin(), unclaimed.end(), literal);
        if (it != unclaimed.end()) {
            unclaimed.erase(it);
            total += 1.0f;
            continue;
        }

        float best_weight = 0.0f;
        std::size_t best_index = 0;
        for (std::size_t i = 0; i < tokens.size(); ++i) {
            if (std::find(cover_indices.begin(), cover_indices.end(), i) !=
                cover_indices.end()) {
                continue;
            }
            float weight = NearMissWeight(literal, tokens[i]);
            if (weight > best_weight) {
                best_weight = weight;
                best_index = i;
            }
        }
        if (best_weight <= 0.0f) {
            return 0.0f;
        }
        total += best_weight;
        cover_indices.push_back(best_index);
    }

    // Every shorter literal must be part of the longer phrase.
    if (!unclaimed.empty()) {
        return 0.0f;
    }
    return total / static_cast<float>(longer.Specificity());
}

float CandidateMatcher::ScorePattern(const TriggerPattern& pattern,
                                     const std::vector<std::string>& tokens,
                                     Candidate& out) const {
    // Step 1: whole phrase present
    if (auto match = pattern.MatchExact(tokens)) {
        out.exact = true;
        out.matched_indices = std::move(match->literal_indices);
        out.captures = std::move(match->captures);
        return 1.0f;
    }

    // Step 2: token overlap with fuzzy and synonym tolerance
    const std::vector<std::string> literals = pattern.Literals();
    float total = 0.0f;

    for (const auto& literal : literals) {
        float best_weight = 0.0f;
        std::size_t best_index = 0;

        for (std::size_t i = 0; i < tokens.size(); ++i) {
            float weight = TokenWeight(literal, tokens[i]);
            if (weight > best_weight) {
                best_weight = weight;
                best_index = i;
                if (weight >= 1.0f) break;
            }
        }

        if (best_weight > 0.0f) {
            total += best_weight;
            if (std::find(out.matched_indices.begin(), out.matched_indices.end(),
                          best_index) == out.matched_indices.end()) {
                out.matched_indices.push_back(best_index);
            }
        }
    }

    out.exact = false;
    return total / static_cast<float>(literals.size());
}

float CandidateMatcher::TokenWeight(const std::string& trigger_token,
                                    const std::string& input_token) const {
    if (trigger_token == input_token) {
        return 1.0f;
    }

    if (catalog_.IsSynonym(trigger_token, input_token)) {
        return config_.synonym_weight;
    }

    if (trigger_token.length() < config_.min_fuzzy_token_length) {
        return 0.0f;
    }

    std::size_t distance = EditDistance(trigger_token, input_token);
    if (distance > config_.max_edit_distance ||
        2 * distance >= trigger_token.length()) {
        return 0.0f;
    }

    return ComputeSimilarity(trigger_token, input_token);
}

float CandidateMatcher::NearMissWeight(const std::string& trigger_token,
                                       const std::string& input_token) const {
    float weight = TokenWeight(trigger_token, input_token);
    if (weight > 0.0f) {
        return weight;
    }

    // Short words ("set", "new") are too short for fuzzy matching on their
    // own, but one edit still counts when completing a longer phrase.
    if (trigger_token.length() < 2 || input_token.length() < 2 ||
        EditDistance(trigger_token, input_token) != 1) {
        return 0.0f;
    }
    return ComputeSimilarity(trigger_token, input_token);
}

}  // namespace nl_command
