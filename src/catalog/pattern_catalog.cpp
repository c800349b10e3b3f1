#include "nl_command/catalog/pattern_catalog.h"

#include <algorithm>
#include <cstdio>
#include <sstream>

namespace nl_command {

namespace {

bool HasSlot(const ActionDescriptor& descriptor, const std::string& slot_name) {
    return std::any_of(descriptor.slots.begin(), descriptor.slots.end(),
                       [&](const SlotDescriptor& slot) { return slot.name == slot_name; });
}

}  // namespace

bool PatternCatalog::Register(const ActionDescriptor& descriptor) {
    if (descriptor.name.empty() || descriptor.triggers.empty()) {
        std::fprintf(stderr, "PatternCatalog: action '%s' has no triggers\n",
                     descriptor.QualifiedName().c_str());
        return false;
    }

    if (FindAction(descriptor.intent, descriptor.name) != nullptr) {
        std::fprintf(stderr, "PatternCatalog: duplicate action '%s'\n",
                     descriptor.QualifiedName().c_str());
        return false;
    }

    for (const auto& trigger : descriptor.triggers) {
        if (trigger_texts_.count(trigger.Text()) > 0) {
            std::fprintf(stderr,
                         "PatternCatalog: trigger '%s' of '%s' is already registered\n",
                         trigger.Text().c_str(), descriptor.QualifiedName().c_str());
            return false;
        }
        for (const auto& element : trigger.Elements()) {
            if (element.type == PatternElement::Type::kSlot &&
                !HasSlot(descriptor, element.text)) {
                std::fprintf(stderr,
                             "PatternCatalog: trigger '%s' references unknown slot '%s'\n",
                             trigger.Text().c_str(), element.text.c_str());
                return false;
            }
        }
    }

    for (const auto& trigger : descriptor.triggers) {
        trigger_texts_.insert(trigger.Text());
    }
    actions_[IntentIndex(descriptor.intent)].push_back(descriptor);
    return true;
}

bool PatternCatalog::Register(Intent intent,
                              const std::string& name,
                              const std::vector<std::string>& triggers,
                              const std::vector<SlotDescriptor>& slots,
                              const std::string& description) {
    ActionDescriptor descriptor;
    descriptor.intent = intent;
    descriptor.name = name;
    descriptor.description = description;
    descriptor.slots = slots;

    for (const auto& phrase : triggers) {
        auto pattern = TriggerPattern::Parse(phrase);
        if (!pattern) {
            std::fprintf(stderr, "PatternCatalog: cannot parse trigger '%s'\n",
                         phrase.c_str());
            return false;
        }
        descriptor.triggers.push_back(std::move(*pattern));
    }

    return Register(descriptor);
}

void PatternCatalog::AddSynonym(const std::string& token, const std::string& synonym) {
    synonyms_[ToLowerAscii(token)].insert(ToLowerAscii(synonym));
}

bool PatternCatalog::AddPhraseRewrite(const std::string& phrase,
                                      const std::string& replacement) {
    PhraseRewrite rewrite;
    std::istringstream iss(ToLowerAscii(phrase));
    std::string word;
    while (iss >> word) {
        rewrite.phrase.push_back(word);
    }
    rewrite.replacement = ToLowerAscii(replacement);

    if (rewrite.phrase.empty() || rewrite.replacement.empty() ||
        rewrite.replacement.find(' ') != std::string::npos) {
        std::fprintf(stderr, "PatternCatalog: invalid rewrite '%s' -> '%s'\n",
                phrase.c_str(), replacement.c_str());
        return false;
    }

    for (auto& existing : rewrites_) {
        if (existing.phrase == rewrite.phrase) {
            existing.replacement = rewrite.replacement;
            return true;
        }
    }
    rewrites_.push_back(std::move(rewrite));
    return true;
}

bool PatternCatalog::IsSynonym(const std::string& trigger_token,
                               const std::string& input_token) const {
    auto it = synonyms_.find(trigger_token);
    if (it == synonyms_.end()) {
        return false;
    }
    return it->second.count(input_token) > 0;
}

const ActionDescriptor* PatternCatalog::FindAction(Intent intent,
                                                   const std::string& name) const {
    for (const auto& action : actions_[IntentIndex(intent)]) {
        if (action.name == name) {
            return &action;
        }
    }
    return nullptr;
}

const std::vector<ActionDescriptor>& PatternCatalog::ActionsFor(Intent intent) const {
    return actions_[IntentIndex(intent)];
}

std::vector<const ActionDescriptor*> PatternCatalog::AllActions() const {
    std::vector<const ActionDescriptor*> all;
    all.reserve(ActionCount());
    for (const auto& intent_actions : actions_) {
        for (const auto& action : intent_actions) {
            all.push_back(&action);
        }
    }
    return all;
}

std::vector<std::string> PatternCatalog::AllTriggerPhrases() const {
    std::vector<std::string> phrases;
    for (const auto& intent_actions : actions_) {
        for (const auto& action : intent_actions) {
            for (const auto& trigger : action.triggers) {
                phrases.push_back(trigger.Text());
            }
        }
    }
    return phrases;
}

std::size_t PatternCatalog::SupportedIntentCount() const {
    return static_cast<std::size_t>(
        std::count_if(actions_.begin(), actions_.end(),
                      [](const std::vector<ActionDescriptor>& a) { return !a.empty(); }));
}

std::size_t PatternCatalog::ActionCount() const {
    std::size_t count = 0;
    for (const auto& intent_actions : actions_) {
        count += intent_actions.size();
    }
    return count;
}

}  // namespace nl_command
