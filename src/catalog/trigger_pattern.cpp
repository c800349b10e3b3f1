#include "nl_command/catalog/trigger_pattern.h"

#include <sstream>

#include "nl_command/nlu/normalizer.h"

namespace nl_command {

std::optional<TriggerPattern> TriggerPattern::Parse(const std::string& text) {
    TriggerPattern pattern;

    std::istringstream iss(text);
    std::string word;
    while (iss >> word) {
        PatternElement element;
        if (word == "*") {
            element.type = PatternElement::Type::kWildcard;
        } else if (word.front() == '{') {
            if (word.size() < 3 || word.back() != '}') {
                return std::nullopt;
            }
            element.type = PatternElement::Type::kSlot;
            element.text = word.substr(1, word.size() - 2);
        } else {
            element.type = PatternElement::Type::kLiteral;
            element.text = ToLowerAscii(word);
            pattern.literal_count_++;
        }

        if (!pattern.text_.empty()) pattern.text_ += " ";
        pattern.text_ += (element.type == PatternElement::Type::kLiteral)
                              ? element.text
                              : word;
        pattern.elements_.push_back(std::move(element));
    }

    if (pattern.literal_count_ == 0) {
        return std::nullopt;
    }
    return pattern;
}

std::optional<PatternMatch> TriggerPattern::MatchExact(
    const std::vector<std::string>& tokens) const {
    for (std::size_t start = 0; start < tokens.size(); ++start) {
        PatternMatch match;
        if (MatchFrom(tokens, 0, start, match)) {
            return match;
        }
    }
    return std::nullopt;
}

bool TriggerPattern::MatchFrom(const std::vector<std::string>& tokens,
                               std::size_t element_index,
                               std::size_t token_index,
                               PatternMatch& match) const {
    if (element_index == elements_.size()) {
        return true;
    }

    const PatternElement& element = elements_[element_index];

    switch (element.type) {
        case PatternElement::Type::kLiteral: {
            if (token_index >= tokens.size() ||
                tokens[token_index] != element.text) {
                return false;
            }
            match.literal_indices.push_back(token_index);
            if (MatchFrom(tokens, element_index + 1, token_index + 1, match)) {
                return true;
            }
            match.literal_indices.pop_back();
            return false;
        }

        case PatternElement::Type::kSlot: {
            // Prefer the shortest capture so following literals anchor early.
            for (std::size_t end = token_index + 1; end <= tokens.size(); ++end) {
                match.captures[element.text] = {token_index, end};
                if (MatchFrom(tokens, element_index + 1, end, match)) {
                    return true;
                }
            }
            match.captures.erase(element.text);
            return false;
        }

        case PatternElement::Type::kWildcard: {
            for (std::size_t end = token_index; end <= tokens.size(); ++end) {
                if (MatchFrom(tokens, element_index + 1, end, match)) {
                    return true;
                }
            }
            return false;
        }
    }
    return false;
}

std::vector<std::string> TriggerPattern::Literals() const {
    std::vector<std::string> literals;
    literals.reserve(literal_count_);
    for (const auto& element : elements_) {
        if (element.type == PatternElement::Type::kLiteral) {
            literals.push_back(element.text);
        }
    }
    return literals;
}

}  // namespace nl_command
