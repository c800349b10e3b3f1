#include "nl_command/suggestion/suggestion_engine.h"

#include <algorithm>
#include <unordered_set>
#include <utility>

#include "nl_command/nlu/string_similarity.h"

namespace nl_command {

namespace {

constexpr float kSubstringRelevance = 1.0f;
constexpr float kSharedWordRelevance = 0.7f;
constexpr float kMinRelevance = 0.3f;

std::vector<std::string> Head(const std::vector<std::string>& items, std::size_t limit) {
    std::size_t count = std::min(limit, items.size());
    return std::vector<std::string>(items.begin(), items.begin() + count);
}

}  // namespace

const std::vector<std::string> kStarterPhrases = {
    "show status",
    "list files",
    "help me",
    "analyze code",
    "create task",
};

SuggestionEngine::SuggestionEngine(const PatternCatalog& catalog,
                                   const InterpreterConfig& config)
    : catalog_(catalog), config_(config), matcher_(catalog, config) {}

std::vector<std::string> SuggestionEngine::SuggestAlternatives(
    const NormalizedText& input,
    const std::string& exclude) const {
    std::vector<std::string> suggestions;

    for (const auto& candidate : matcher_.RankAll(input)) {
        if (suggestions.size() >= config_.max_suggestions) break;

        std::string name = candidate.action->QualifiedName();
        if (name == exclude) continue;
        suggestions.push_back(std::move(name));
    }

    return suggestions;
}

std::vector<std::string> SuggestionEngine::SuggestPhrases(const std::string& partial_text,
                                                          std::size_t limit) const {
    NormalizedText partial = Normalize(partial_text);
    if (partial.IsEmpty()) {
        return Head(kStarterPhrases, limit);
    }

    std::vector<std::pair<std::string, float>> scored;
    std::unordered_set<std::string> seen;

    for (const ActionDescriptor* action : catalog_.AllActions()) {
        for (const auto& pattern : action->triggers) {
            if (pattern.HasMarkers() || !seen.insert(pattern.Text()).second) {
                continue;
            }
            const std::string& phrase = pattern.Text();

            float relevance = 0.0f;
            if (phrase.find(partial.text) != std::string::npos) {
                relevance = kSubstringRelevance;
            } else {
                const auto literals = pattern.Literals();
                bool shared_word = std::any_of(
                    partial.tokens.begin(), partial.tokens.end(),
                    [&literals](const std::string& word) {
                        return std::find(literals.begin(), literals.end(), word) !=
                               literals.end();
                    });
                relevance = shared_word ? kSharedWordRelevance
                                        : ComputeSimilarity(partial.text, phrase);
            }

            if (relevance > kMinRelevance) {
                scored.emplace_back(phrase, relevance);
            }
        }
    }

    if (scored.empty()) {
        return Head(kStarterPhrases, limit);
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    std::vector<std::string> phrases;
    for (const auto& [phrase, relevance] : scored) {
        if (phrases.size() >= limit) break;
        phrases.push_back(phrase);
    }
    return phrases;
}

}  // namespace nl_command
