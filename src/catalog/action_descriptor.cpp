#include "nl_command/catalog/action_descriptor.h"

namespace nl_command {

std::string SlotTypeToString(SlotType type) {
    switch (type) {
        case SlotType::kString:
            return "string";
        case SlotType::kEnum:
            return "enum";
        case SlotType::kInteger:
            return "integer";
        case SlotType::kPath:
            return "path";
    }
    return "string";
}

std::optional<SlotType> SlotTypeFromString(const std::string& name) {
    if (name == "string") return SlotType::kString;
    if (name == "enum") return SlotType::kEnum;
    if (name == "integer") return SlotType::kInteger;
    if (name == "path") return SlotType::kPath;
    return std::nullopt;
}

std::optional<ExtractionStrategy> ExtractionStrategyFromString(const std::string& name) {
    if (name == "keyword_adjacent") return ExtractionStrategy::kKeywordAdjacent;
    if (name == "enum_lookup") return ExtractionStrategy::kEnumLookup;
    if (name == "first_integer") return ExtractionStrategy::kFirstInteger;
    if (name == "remaining_text") return ExtractionStrategy::kRemainingText;
    return std::nullopt;
}

ExtractionStrategy DefaultStrategyFor(SlotType type) {
    switch (type) {
        case SlotType::kString:
        case SlotType::kPath:
            return ExtractionStrategy::kKeywordAdjacent;
        case SlotType::kEnum:
            return ExtractionStrategy::kEnumLookup;
        case SlotType::kInteger:
            return ExtractionStrategy::kFirstInteger;
    }
    return ExtractionStrategy::kKeywordAdjacent;
}

std::optional<ContextFallback> ContextFallbackFromString(const std::string& name) {
    if (name == "none") return ContextFallback::kNone;
    if (name == "current_file") return ContextFallback::kCurrentFile;
    if (name == "current_directory") return ContextFallback::kCurrentDirectory;
    return std::nullopt;
}

}  // namespace nl_command
