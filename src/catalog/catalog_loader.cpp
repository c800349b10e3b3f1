#include "nl_command/catalog/catalog_loader.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace nl_command {

namespace {

std::string StringOr(const nlohmann::json& json, const char* key,
                     const std::string& fallback) {
    auto it = json.find(key);
    if (it == json.end()) {
        return fallback;
    }
    return it->get<std::string>();
}

bool ParseSlot(const nlohmann::json& json, SlotDescriptor& slot, std::string& error) {
    if (!json.is_object()) {
        error = "slot must be an object";
        return false;
    }

    slot.name = json.at("name").get<std::string>();
    if (slot.name.empty()) {
        error = "slot name must not be empty";
        return false;
    }

    std::string type_name = StringOr(json, "type", "string");
    auto type = SlotTypeFromString(type_name);
    if (!type) {
        error = "slot '" + slot.name + "' has unknown type '" + type_name + "'";
        return false;
    }
    slot.type = *type;
    slot.strategy = DefaultStrategyFor(slot.type);

    if (json.contains("strategy")) {
        std::string strategy_name = json["strategy"].get<std::string>();
        auto strategy = ExtractionStrategyFromString(strategy_name);
        if (!strategy) {
            error = "slot '" + slot.name + "' has unknown strategy '" + strategy_name + "'";
            return false;
        }
        slot.strategy = *strategy;
    }

    if (json.contains("fallback")) {
        std::string fallback_name = json["fallback"].get<std::string>();
        auto fallback = ContextFallbackFromString(fallback_name);
        if (!fallback) {
            error = "slot '" + slot.name + "' has unknown fallback '" + fallback_name + "'";
            return false;
        }
        slot.context_fallback = *fallback;
    }

    slot.required = json.value("required", false);
    if (json.contains("keywords")) {
        slot.keywords = json["keywords"].get<std::vector<std::string>>();
    }
    if (json.contains("values")) {
        slot.enum_values = json["values"].get<std::vector<std::string>>();
    }
    if (json.contains("aliases")) {
        for (auto& [word, value] : json["aliases"].items()) {
            slot.value_aliases[word] = value.get<std::string>();
        }
    }
    if (json.contains("min")) {
        slot.min_value = json["min"].get<int>();
    }
    if (json.contains("max")) {
        slot.max_value = json["max"].get<int>();
    }

    if (slot.type == SlotType::kEnum && slot.enum_values.empty()) {
        error = "enum slot '" + slot.name + "' declares no values";
        return false;
    }
    return true;
}

bool ParseAction(const nlohmann::json& json, PatternCatalog& catalog, std::string& error) {
    if (!json.is_object()) {
        error = "action must be an object";
        return false;
    }

    std::string intent_name = json.at("intent").get<std::string>();
    auto intent = IntentFromString(intent_name);
    if (!intent) {
        error = "unknown intent '" + intent_name + "'";
        return false;
    }

    std::string name = json.at("name").get<std::string>();
    auto triggers = json.at("triggers").get<std::vector<std::string>>();

    std::vector<SlotDescriptor> slots;
    if (json.contains("slots")) {
        for (const auto& slot_json : json["slots"]) {
            SlotDescriptor slot;
            if (!ParseSlot(slot_json, slot, error)) {
                error = "action '" + name + "': " + error;
                return false;
            }
            slots.push_back(std::move(slot));
        }
    }

    if (!catalog.Register(*intent, name, triggers, slots, StringOr(json, "description", ""))) {
        error = "action '" + intent_name + "." + name + "' was rejected by the catalog";
        return false;
    }
    return true;
}

}  // namespace

bool LoadCatalogFromJson(const std::string& json_text,
                         PatternCatalog& catalog,
                         std::string& error) {
    PatternCatalog loaded = catalog;

    try {
        auto json = nlohmann::json::parse(json_text);
        if (!json.is_object()) {
            error = "Catalog must be a JSON object";
            return false;
        }

        if (json.contains("actions")) {
            for (const auto& action : json["actions"]) {
                if (!ParseAction(action, loaded, error)) {
                    return false;
                }
            }
        }

        if (json.contains("synonyms")) {
            for (auto& [token, synonyms] : json["synonyms"].items()) {
                for (const auto& synonym : synonyms) {
                    loaded.AddSynonym(token, synonym.get<std::string>());
                }
            }
        }

        if (json.contains("rewrites")) {
            for (auto& [phrase, replacement] : json["rewrites"].items()) {
                if (!loaded.AddPhraseRewrite(phrase, replacement.get<std::string>())) {
                    error = "invalid rewrite '" + phrase + "'";
                    return false;
                }
            }
        }
    } catch (const nlohmann::json::exception& e) {
        error = std::string("Invalid catalog: ") + e.what();
        return false;
    }

    catalog = std::move(loaded);
    return true;
}

bool LoadCatalogFromFile(const std::string& path,
                         PatternCatalog& catalog,
                         std::string& error) {
    std::ifstream file(path);
    if (!file) {
        error = "Cannot open catalog file: " + path;
        return false;
    }

    std::ostringstream content;
    content << file.rdbuf();
    return LoadCatalogFromJson(content.str(), catalog, error);
}

}  // namespace nl_command
