#ifndef NL_COMMAND_CATALOG_TRIGGER_PATTERN_H
#define NL_COMMAND_CATALOG_TRIGGER_PATTERN_H

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace nl_command {

// One element of a trigger pattern.
struct PatternElement {
    enum class Type {
        kLiteral,    // Required token, e.g. "create"
        kSlot,       // {name}: one or more tokens captured for slot `name`
        kWildcard,   // *: zero or more tokens
    };

    Type type = Type::kLiteral;
    // Token text for kLiteral, slot name for kSlot.
    std::string text;
};

// Token span [begin, end) in the normalized token sequence.
using TokenSpan = std::pair<std::size_t, std::size_t>;

// Result of a successful exact pattern match.
struct PatternMatch {
    // Input token indices matched by literal elements, in pattern order.
    std::vector<std::size_t> literal_indices;
    // Slot name -> captured span.
    std::unordered_map<std::string, TokenSpan> captures;
};

// A trigger phrase such as "open file", "move {filename} to {destination}"
// or "search * for". Literal tokens are stored lower-case.
class TriggerPattern {
public:
    TriggerPattern() = default;

    // Parses a whitespace-separated pattern. Returns nullopt if the pattern
    // has no literal token or a malformed slot marker.
    static std::optional<TriggerPattern> Parse(const std::string& text);

    // Matches the pattern against a contiguous window of `tokens`
    // (unanchored). Literals must be identical; slot markers absorb one or
    // more tokens, wildcards zero or more. Leftmost match wins.
    std::optional<PatternMatch> MatchExact(
        const std::vector<std::string>& tokens) const;

    // Literal tokens in pattern order.
    std::vector<std::string> Literals() const;

    // Number of literal tokens. Longer phrases are more specific.
    std::size_t Specificity() const { return literal_count_; }

    bool HasMarkers() const { return literal_count_ != elements_.size(); }

    const std::vector<PatternElement>& Elements() const { return elements_; }

    // Pattern text as declared (normalized spacing).
    const std::string& Text() const { return text_; }

private:
    bool MatchFrom(const std::vector<std::string>& tokens,
                   std::size_t element_index,
                   std::size_t token_index,
                   PatternMatch& match) const;

    std::vector<PatternElement> elements_;
    std::size_t literal_count_ = 0;
    std::string text_;
};

}  // namespace nl_command

#endif  // NL_COMMAND_CATALOG_TRIGGER_PATTERN_H
