#include "nl_command/nlu/string_similarity.h"

#include <algorithm>
#include <vector>

namespace nl_command {

std::size_t EditDistance(const std::string& a, const std::string& b) {
    const std::size_t m = a.length();
    const std::size_t n = b.length();
    if (m == 0) return n;
    if (n == 0) return m;

    std::vector<std::vector<std::size_t>> dp(m + 1, std::vector<std::size_t>(n + 1));

    for (std::size_t i = 0; i <= m; i++) dp[i][0] = i;
    for (std::size_t j = 0; j <= n; j++) dp[0][j] = j;

    for (std::size_t i = 1; i <= m; i++) {
        for (std::size_t j = 1; j <= n; j++) {
            std::size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            dp[i][j] = std::min({
                dp[i - 1][j] + 1,       // deletion
                dp[i][j - 1] + 1,       // insertion
                dp[i - 1][j - 1] + cost // substitution
            });
        }
    }

    return dp[m][n];
}

float ComputeSimilarity(const std::string& a, const std::string& b) {
    if (a.empty() && b.empty()) return 1.0f;
    if (a.empty() || b.empty()) return 0.0f;

    std::size_t distance = EditDistance(a, b);
    std::size_t max_len = std::max(a.length(), b.length());

    return 1.0f - static_cast<float>(distance) / static_cast<float>(max_len);
}

}  // namespace nl_command
