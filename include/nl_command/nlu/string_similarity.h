#ifndef NL_COMMAND_NLU_STRING_SIMILARITY_H
#define NL_COMMAND_NLU_STRING_SIMILARITY_H

#include <cstddef>
#include <string>

namespace nl_command {

// Levenshtein distance (insertions, deletions, substitutions).
std::size_t EditDistance(const std::string& a, const std::string& b);

// 1 - distance / max(len(a), len(b)), in [0, 1].
// Two empty strings are identical (1.0).
float ComputeSimilarity(const std::string& a, const std::string& b);

}  // namespace nl_command

#endif  // NL_COMMAND_NLU_STRING_SIMILARITY_H
