#include "nl_command/nlu/normalizer.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace nl_command {

namespace {

constexpr const char* kLeadingPunctuation = "\"'([{<,;:!?";
constexpr const char* kTrailingPunctuation = "\"')]}>,;:!?.";

// Strip sentence punctuation from both ends of a word.
std::string TrimWord(const std::string& word) {
    size_t start = word.find_first_not_of(kLeadingPunctuation);
    if (start == std::string::npos) return "";
    size_t end = word.find_last_not_of(kTrailingPunctuation);
    if (end == std::string::npos || end < start) return "";
    return word.substr(start, end - start + 1);
}

bool PhraseAt(const NormalizedText& text, size_t pos, const PhraseRewrite& rewrite) {
    if (rewrite.phrase.empty() || pos + rewrite.phrase.size() > text.tokens.size()) {
        return false;
    }
    for (size_t i = 0; i < rewrite.phrase.size(); ++i) {
        if (text.quoted[pos + i] || text.tokens[pos + i] != rewrite.phrase[i]) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::string ToLowerAscii(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

NormalizedText Normalize(const std::string& raw_text) {
    NormalizedText normalized;

    std::istringstream iss(raw_text);
    std::string word;
    bool in_quote = false;
    while (iss >> word) {
        bool opens = !in_quote && word.front() == '"';
        if (opens) in_quote = true;
        bool quoted = in_quote;
        if (in_quote && word.find('"', opens ? 1 : 0) != std::string::npos) {
            in_quote = false;
        }

        std::string trimmed = TrimWord(word);
        if (trimmed.empty()) {
            continue;
        }
        std::string lowered = ToLowerAscii(trimmed);

        if (!normalized.text.empty()) normalized.text += " ";
        normalized.text += lowered;

        normalized.raw_tokens.push_back(std::move(trimmed));
        normalized.tokens.push_back(std::move(lowered));
        normalized.quoted.push_back(quoted);
    }

    return normalized;
}

NormalizedText Normalize(const std::string& raw_text,
                         const std::vector<PhraseRewrite>& rewrites) {
    NormalizedText input = Normalize(raw_text);
    if (rewrites.empty()) {
        return input;
    }

    NormalizedText output;
    size_t pos = 0;
    while (pos < input.tokens.size()) {
        auto rewrite = std::find_if(rewrites.begin(), rewrites.end(),
                                    [&](const PhraseRewrite& r) { return PhraseAt(input, pos, r); });

        if (rewrite == rewrites.end()) {
            output.tokens.push_back(input.tokens[pos]);
            output.raw_tokens.push_back(input.raw_tokens[pos]);
            output.quoted.push_back(input.quoted[pos]);
            ++pos;
        } else {
            std::string raw;
            for (size_t i = 0; i < rewrite->phrase.size(); ++i) {
                if (!raw.empty()) raw += " ";
                raw += input.raw_tokens[pos + i];
            }
            output.tokens.push_back(rewrite->replacement);
            output.raw_tokens.push_back(std::move(raw));
            output.quoted.push_back(false);
            pos += rewrite->phrase.size();
        }

        if (!output.text.empty()) output.text += " ";
        output.text += output.tokens.back();
    }

    return output;
}

}  // namespace nl_command
