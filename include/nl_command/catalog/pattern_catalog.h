#ifndef NL_COMMAND_CATALOG_PATTERN_CATALOG_H
#define NL_COMMAND_CATALOG_PATTERN_CATALOG_H

#include <array>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "nl_command/catalog/action_descriptor.h"
#include "nl_command/command/intent.h"
#include "nl_command/nlu/normalizer.h"

// Table of action definitions, indexed by Intent.

namespace nl_command {

// The catalog is built once (Register/AddSynonym) and then shared read-only,
// typically as std::shared_ptr<const PatternCatalog>. It performs no
// locking: mutation after it has been handed to an Interpreter is not
// supported; build a new catalog and use Interpreter::ReplaceCatalog().
class PatternCatalog {
public:
    PatternCatalog() = default;

    // Register an action.
    // Returns false if the action has no triggers, its name is already
    // registered for the same intent, a trigger phrase is already used by
    // another action, or a trigger references an undeclared slot.
    bool Register(const ActionDescriptor& descriptor);

    // Convenience: parse trigger phrases and register.
    // Returns false if any phrase fails to parse or Register() fails.
    bool Register(Intent intent,
                  const std::string& name,
                  const std::vector<std::string>& triggers,
                  const std::vector<SlotDescriptor>& slots = {},
                  const std::string& description = "");

    // Declare `synonym` as an accepted stand-in for trigger token `token`.
    void AddSynonym(const std::string& token, const std::string& synonym);

    // True if `input_token` is a declared synonym of `trigger_token`.
    bool IsSynonym(const std::string& trigger_token,
                   const std::string& input_token) const;

    // Rewrite spoken `phrase` ("look at") to the single word `replacement`
    // ("analyze") before matching. Re-adding a phrase replaces its word.
    // Returns false for an empty phrase or a replacement that is not one
    // word. Trigger phrases should use the replacement, since input never
    // contains the original phrase once rewritten.
    bool AddPhraseRewrite(const std::string& phrase, const std::string& replacement);

    // In the order they were added.
    const std::vector<PhraseRewrite>& PhraseRewrites() const { return rewrites_; }

    // Lookup.
    const ActionDescriptor* FindAction(Intent intent, const std::string& name) const;
    const std::vector<ActionDescriptor>& ActionsFor(Intent intent) const;

    // All actions in declaration order (intent order, then registration
    // order). Pointers stay valid until the next Register().
    std::vector<const ActionDescriptor*> AllActions() const;

    // All trigger phrases in declaration order.
    std::vector<std::string> AllTriggerPhrases() const;

    // Number of intents with at least one action.
    std::size_t SupportedIntentCount() const;
    std::size_t ActionCount() const;

    const std::unordered_map<std::string, std::unordered_set<std::string>>&
    Synonyms() const { return synonyms_; }

private:
    std::array<std::vector<ActionDescriptor>, kIntentCount> actions_;
    std::unordered_set<std::string> trigger_texts_;
    std::unordered_map<std::string, std::unordered_set<std::string>> synonyms_;
    std::vector<PhraseRewrite> rewrites_;
};

}  // namespace nl_command

#endif  // NL_COMMAND_CATALOG_PATTERN_CATALOG_H
