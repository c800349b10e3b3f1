#ifndef NL_COMMAND_CATALOG_ACTION_DESCRIPTOR_H
#define NL_COMMAND_CATALOG_ACTION_DESCRIPTOR_H

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "nl_command/catalog/trigger_pattern.h"
#include "nl_command/command/intent.h"

// Defines the schema for an action: its trigger phrases, parameter slots,
// types and extraction rules.

namespace nl_command {

// Semantic type of a slot value.
enum class SlotType {
    kString,
    kEnum,     // String constrained to a set of allowed values
    kInteger,
    kPath,     // File or directory path
};

// How the extractor resolves a slot from the utterance.
enum class ExtractionStrategy {
    kKeywordAdjacent,  // Token following one of the slot keywords
    kEnumLookup,       // First token equal to a value or alias
    kFirstInteger,     // First integer token, clamped to the range
    kRemainingText,    // Text left over after trigger and other slots
};

// Where a path slot falls back to when the utterance refers to "this file".
enum class ContextFallback {
    kNone,
    kCurrentFile,
    kCurrentDirectory,
};

// Wire names: "string", "enum", "integer", "path".
std::string SlotTypeToString(SlotType type);
std::optional<SlotType> SlotTypeFromString(const std::string& name);

// Wire names: "keyword_adjacent", "enum_lookup", "first_integer",
// "remaining_text".
std::optional<ExtractionStrategy> ExtractionStrategyFromString(const std::string& name);

// Strategy used when a slot definition does not name one.
ExtractionStrategy DefaultStrategyFor(SlotType type);

// Wire names: "none", "current_file", "current_directory".
std::optional<ContextFallback> ContextFallbackFromString(const std::string& name);

// Defines a single parameter slot in an action's schema.
struct SlotDescriptor {
    std::string name;                                // "filename"
    SlotType type = SlotType::kString;
    ExtractionStrategy strategy = ExtractionStrategy::kKeywordAdjacent;
    bool required = false;
    std::vector<std::string> keywords;               // For kKeywordAdjacent
    std::vector<std::string> enum_values;            // For kEnum
    // Spoken word -> canonical value ("critical" -> "urgent", "mute" -> "0").
    std::unordered_map<std::string, std::string> value_aliases;
    std::optional<int> min_value;                    // For kInteger
    std::optional<int> max_value;                    // For kInteger
    ContextFallback context_fallback = ContextFallback::kNone;
};

// Full schema for an action. Belongs to exactly one Intent.
struct ActionDescriptor {
    Intent intent = Intent::kHelp;

    // Unique within the intent. "create", "analyze_file".
    std::string name;

    // Human-readable description.
    std::string description;

    // Parsed trigger patterns in declaration order.
    std::vector<TriggerPattern> triggers;

    // Parameter schema. Empty = action takes no parameters.
    std::vector<SlotDescriptor> slots;

    // "<intent>.<action>", e.g. "task_management.create".
    std::string QualifiedName() const {
        return IntentToString(intent) + "." + name;
    }

    bool IsParameterized() const { return !slots.empty(); }
};

}  // namespace nl_command

#endif  // NL_COMMAND_CATALOG_ACTION_DESCRIPTOR_H
