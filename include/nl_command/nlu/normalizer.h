#ifndef NL_COMMAND_NLU_NORMALIZER_H
#define NL_COMMAND_NLU_NORMALIZER_H

#include <string>
#include <vector>

namespace nl_command {

// Normalized form of an utterance.
// tokens[i] and raw_tokens[i] describe the same word: tokens are
// lower-cased, raw_tokens keep the original casing (file names, paths).
struct NormalizedText {
    std::vector<std::string> tokens;
    std::vector<std::string> raw_tokens;
    std::string text;  // tokens joined by single spaces
    // quoted[i] is true when tokens[i] came from inside a "double-quoted"
    // span of the original text.
    std::vector<bool> quoted;

    bool IsEmpty() const { return tokens.empty(); }
};

// Spoken phrase replaced by a single word before matching,
// e.g. {"look", "at"} -> "analyze".
struct PhraseRewrite {
    std::vector<std::string> phrase;  // Lower-case words
    std::string replacement;          // Lower-case word
};

// Lower-cases, trims punctuation around each word and collapses whitespace.
// Punctuation inside a word ("test.py", "src/main.cc") is kept. An
// unterminated quote runs to the end of the text.
NormalizedText Normalize(const std::string& raw_text);

// Normalize(), then replaces each occurrence of a rewrite phrase with its
// replacement word, scanning left to right; the first rewrite that matches
// at a position wins. The raw words of a rewritten phrase are merged into
// one raw token so raw_tokens stays aligned with tokens. Quoted words are
// never rewritten.
NormalizedText Normalize(const std::string& raw_text,
                         const std::vector<PhraseRewrite>& rewrites);

// Lower-case ASCII copy.
std::string ToLowerAscii(const std::string& str);

}  // namespace nl_command

#endif  // NL_COMMAND_NLU_NORMALIZER_H
