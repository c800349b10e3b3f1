#include "nl_command/nlu/parameter_extractor.h"

#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>
#include <unordered_set>

namespace nl_command {

namespace {

// Words that refer to the session's current file or directory.
const std::unordered_set<std::string> kDeicticWords = {
    "this", "current", "here", "that",
};

// Words between a keyword and its value ("file called notes.md").
const std::unordered_set<std::string> kConnectorWords = {
    "the", "a", "an", "called", "named", "at",
};

// Trimmed from both ends of free text ("for code review" -> "code review").
const std::unordered_set<std::string> kFillerWords = {
    "a", "an", "the", "for", "to", "called", "named", "about", "please",
    "that", "with", "priority", "me", "new", "my",
};

// Working state of one extraction.
struct ExtractionState {
    const NormalizedText& input;
    std::vector<bool> trigger_matched;  // Token matched a trigger literal
    std::vector<bool> slot_used;        // Token already taken by a slot

    explicit ExtractionState(const NormalizedText& text)
        : input(text),
          trigger_matched(text.tokens.size(), false),
          slot_used(text.tokens.size(), false) {}

    size_t size() const { return input.tokens.size(); }

    bool IsQuoted(size_t i) const {
        return i < input.quoted.size() && input.quoted[i];
    }

    bool IsFree(size_t i) const { return !trigger_matched[i] && !slot_used[i]; }

    bool HasDeicticWord() const {
        for (const auto& token : input.tokens) {
            if (kDeicticWords.count(token) > 0) return true;
        }
        return false;
    }
};

std::string JoinRaw(const NormalizedText& input, size_t begin, size_t end) {
    std::string joined;
    for (size_t i = begin; i < end && i < input.raw_tokens.size(); ++i) {
        if (!joined.empty()) joined += " ";
        joined += input.raw_tokens[i];
    }
    return joined;
}

int ClampToRange(int value, const SlotDescriptor& slot) {
    if (slot.min_value && value < *slot.min_value) return *slot.min_value;
    if (slot.max_value && value > *slot.max_value) return *slot.max_value;
    return value;
}

bool IsKeyword(const SlotDescriptor& slot, const std::string& token) {
    return std::find(slot.keywords.begin(), slot.keywords.end(), token) !=
           slot.keywords.end();
}

// "@alice" satisfies the "@" keyword on its own.
bool IsMention(const SlotDescriptor& slot, const std::string& token) {
    return token.size() > 1 && token[0] == '@' && IsKeyword(slot, "@");
}

std::string StripMention(const std::string& value) {
    if (value.size() > 1 && value[0] == '@') return value.substr(1);
    return value;
}

// Value from a {slot} capture of the winning pattern.
std::optional<ParamValue> ResolveCapture(const SlotDescriptor& slot,
                                         const TokenSpan& span,
                                         ExtractionState& state) {
    std::string raw = JoinRaw(state.input, span.first, span.second);
    if (raw.empty()) {
        return std::nullopt;
    }

    std::optional<ParamValue> value;
    switch (slot.type) {
        case SlotType::kInteger: {
            int number = 0;
            if (span.second - span.first == 1 &&
                ParseIntegerToken(state.input.tokens[span.first], number)) {
                value = ParamValue(ClampToRange(number, slot));
            }
            break;
        }
        case SlotType::kEnum: {
            std::string lowered = ToLowerAscii(raw);
            auto alias = slot.value_aliases.find(lowered);
            if (alias != slot.value_aliases.end()) {
                value = ParamValue(alias->second);
            } else if (std::find(slot.enum_values.begin(), slot.enum_values.end(),
                                 lowered) != slot.enum_values.end()) {
                value = ParamValue(lowered);
            }
            break;
        }
        case SlotType::kString:
            value = ParamValue(StripMention(raw));
            break;
        case SlotType::kPath:
            value = ParamValue(raw);
            break;
    }

    if (value) {
        for (size_t i = span.first; i < span.second; ++i) {
            state.slot_used[i] = true;
        }
    }
    return value;
}

std::optional<ParamValue> ResolveKeywordAdjacent(const SlotDescriptor& slot,
                                                 ExtractionState& state) {
    const auto& tokens = state.input.tokens;

    for (size_t k = 0; k < state.size(); ++k) {
        if (state.slot_used[k] || state.IsQuoted(k)) continue;

        if (IsMention(slot, tokens[k])) {
            state.slot_used[k] = true;
            return ParamValue(StripMention(state.input.raw_tokens[k]));
        }
        if (!IsKeyword(slot, tokens[k])) continue;

        // First token after the keyword that is not filler.
        for (size_t i = k + 1; i < state.size(); ++i) {
            if (!state.IsFree(i) || state.IsQuoted(i) ||
                kConnectorWords.count(tokens[i]) > 0 ||
                kDeicticWords.count(tokens[i]) > 0 ||
                IsKeyword(slot, tokens[i])) {
                continue;
            }
            state.slot_used[i] = true;
            return ParamValue(StripMention(state.input.raw_tokens[i]));
        }
    }

    if (slot.type != SlotType::kPath) {
        return std::nullopt;
    }

    // Longest free token shaped like a path.
    std::optional<size_t> best;
    for (size_t i = 0; i < state.size(); ++i) {
        if (!state.IsFree(i) || state.IsQuoted(i)) continue;
        if (!LooksLikePath(state.input.raw_tokens[i])) continue;
        if (!best || state.input.raw_tokens[i].size() >
                         state.input.raw_tokens[*best].size()) {
            best = i;
        }
    }
    if (best) {
        state.slot_used[*best] = true;
        return ParamValue(state.input.raw_tokens[*best]);
    }

    return std::nullopt;
}

std::optional<ParamValue> ResolveContextFallback(const SlotDescriptor& slot,
                                                 const ExtractionState& state,
                                                 const SessionContext& context) {
    if (slot.context_fallback == ContextFallback::kNone || !state.HasDeicticWord()) {
        return std::nullopt;
    }

    const std::string& fallback =
        slot.context_fallback == ContextFallback::kCurrentFile
            ? context.current_file
            : context.current_directory;
    if (fallback.empty()) {
        return std::nullopt;
    }
    return ParamValue(fallback);
}

std::optional<ParamValue> ResolveEnum(const SlotDescriptor& slot,
                                      ExtractionState& state) {
    for (size_t i = 0; i < state.size(); ++i) {
        if (state.slot_used[i] || state.IsQuoted(i)) continue;
        const std::string& token = state.input.tokens[i];

        if (std::find(slot.enum_values.begin(), slot.enum_values.end(), token) !=
            slot.enum_values.end()) {
            state.slot_used[i] = true;
            return ParamValue(token);
        }
        auto alias = slot.value_aliases.find(token);
        if (alias != slot.value_aliases.end()) {
            state.slot_used[i] = true;
            return ParamValue(alias->second);
        }
    }
    return std::nullopt;
}

std::optional<ParamValue> ResolveInteger(const SlotDescriptor& slot,
                                         ExtractionState& state) {
    for (size_t i = 0; i < state.size(); ++i) {
        if (state.slot_used[i] || state.IsQuoted(i)) continue;
        int number = 0;
        if (ParseIntegerToken(state.input.tokens[i], number)) {
            state.slot_used[i] = true;
            return ParamValue(ClampToRange(number, slot));
        }
    }

    // Spoken values ("mute", "max").
    for (size_t i = 0; i < state.size(); ++i) {
        if (state.slot_used[i] || state.IsQuoted(i)) continue;
        auto alias = slot.value_aliases.find(state.input.tokens[i]);
        if (alias == slot.value_aliases.end()) continue;

        int number = 0;
        if (ParseIntegerToken(alias->second, number)) {
            state.slot_used[i] = true;
            return ParamValue(ClampToRange(number, slot));
        }
    }
    return std::nullopt;
}

std::optional<ParamValue> ResolveRemainingText(ExtractionState& state) {
    // A quoted span wins.
    for (size_t i = 0; i < state.size(); ++i) {
        if (!state.IsQuoted(i) || state.slot_used[i]) continue;
        size_t end = i;
        while (end < state.size() && state.IsQuoted(end) && !state.slot_used[end]) {
            state.slot_used[end] = true;
            ++end;
        }
        return ParamValue(JoinRaw(state.input, i, end));
    }

    std::vector<size_t> remaining;
    for (size_t i = 0; i < state.size(); ++i) {
        if (state.IsFree(i)) remaining.push_back(i);
    }

    auto is_filler = [&state](size_t i) {
        return kFillerWords.count(state.input.tokens[i]) > 0;
    };
    while (!remaining.empty() && is_filler(remaining.front())) {
        remaining.erase(remaining.begin());
    }
    while (!remaining.empty() && is_filler(remaining.back())) {
        remaining.pop_back();
    }
    if (remaining.empty()) {
        return std::nullopt;
    }

    std::string text;
    for (size_t i : remaining) {
        if (!text.empty()) text += " ";
        text += state.input.raw_tokens[i];
        state.slot_used[i] = true;
    }
    return ParamValue(text);
}

}  // namespace

bool ParseIntegerToken(const std::string& token, int& value) {
    std::string digits = token;
    if (!digits.empty() && digits.front() == '#') digits.erase(0, 1);
    if (!digits.empty() && digits.back() == '%') digits.pop_back();

    size_t start = (!digits.empty() && digits[0] == '-') ? 1 : 0;
    if (digits.size() <= start) {
        return false;
    }
    for (size_t i = start; i < digits.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(digits[i]))) {
            return false;
        }
    }

    try {
        value = std::stoi(digits);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

bool LooksLikePath(const std::string& token) {
    if (token.find('/') != std::string::npos ||
        token.find('\\') != std::string::npos) {
        return true;
    }

    size_t dot = token.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 >= token.size()) {
        return false;
    }

    bool has_letter = false;
    for (size_t i = dot + 1; i < token.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(token[i]);
        if (!std::isalnum(c)) return false;
        if (std::isalpha(c)) has_letter = true;
    }
    return has_letter;
}

ExtractionResult ParameterExtractor::Extract(const Candidate& candidate,
                                             const NormalizedText& input,
                                             const SessionContext& context) const {
    ExtractionResult result;
    if (candidate.action == nullptr) {
        return result;
    }

    const auto& slots = candidate.action->slots;
    ExtractionState state(input);
    for (size_t index : candidate.matched_indices) {
        if (index < state.size()) state.trigger_matched[index] = true;
    }

    std::vector<std::optional<ParamValue>> values(slots.size());

    // Pass 1: pattern captures
    for (size_t s = 0; s < slots.size(); ++s) {
        auto capture = candidate.captures.find(slots[s].name);
        if (capture != candidate.captures.end()) {
            values[s] = ResolveCapture(slots[s], capture->second, state);
        }
    }

    // Pass 2: closed vocabularies, so "analyze python file x.py" does not
    // hand "python" to the keyword after "analyze"
    for (size_t s = 0; s < slots.size(); ++s) {
        if (!values[s] && slots[s].strategy == ExtractionStrategy::kEnumLookup) {
            values[s] = ResolveEnum(slots[s], state);
        }
    }

    // Pass 3: everything except free text
    for (size_t s = 0; s < slots.size(); ++s) {
        const SlotDescriptor& slot = slots[s];
        if (values[s]) continue;

        switch (slot.strategy) {
            case ExtractionStrategy::kKeywordAdjacent:
                values[s] = ResolveKeywordAdjacent(slot, state);
                if (!values[s] && slot.type == SlotType::kPath) {
                    values[s] = ResolveContextFallback(slot, state, context);
                }
                break;
            case ExtractionStrategy::kFirstInteger:
                values[s] = ResolveInteger(slot, state);
                break;
            case ExtractionStrategy::kEnumLookup:
            case ExtractionStrategy::kRemainingText:
                break;
        }
    }

    // Pass 4: free text takes what is left
    for (size_t s = 0; s < slots.size(); ++s) {
        if (!values[s] && slots[s].strategy == ExtractionStrategy::kRemainingText) {
            values[s] = ResolveRemainingText(state);
        }
    }

    for (size_t s = 0; s < slots.size(); ++s) {
        if (values[s] && !values[s]->IsEmpty()) {
            result.parameters.push_back({slots[s].name, slots[s].type, *values[s]});
        } else if (slots[s].required) {
            result.missing_parameters.push_back(slots[s].name);
        }
    }

    return result;
}

}  // namespace nl_command
