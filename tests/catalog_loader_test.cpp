#include <gtest/gtest.h>

#include <memory>

#include "nl_command/catalog/catalog_loader.h"
#include "nl_command/catalog/default_catalog.h"

namespace nl_command {
namespace {

constexpr const char* kSnoozeCatalog = R"({
  "actions": [
    {
      "intent": "task_management",
      "name": "snooze",
      "description": "Snoozes a task",
      "triggers": ["snooze task", "remind me later"],
      "slots": [
        {"name": "task_id", "type": "integer", "required": true, "min": 1},
        {"name": "when", "type": "enum", "values": ["today", "tomorrow"],
         "aliases": {"tonight": "today"}},
        {"name": "target", "type": "path", "keywords": ["in"],
         "fallback": "current_file"}
      ]
    }
  ],
  "synonyms": {"snooze": ["postpone", "defer"]},
  "rewrites": {"put off": "snooze"}
})";

TEST(CatalogLoaderTest, LoadsActionsAndSlots) {
    PatternCatalog catalog;
    std::string error;
    ASSERT_TRUE(LoadCatalogFromJson(kSnoozeCatalog, catalog, error)) << error;

    const ActionDescriptor* action = catalog.FindAction(Intent::kTaskManagement, "snooze");
    ASSERT_NE(action, nullptr);
    EXPECT_EQ(action->description, "Snoozes a task");
    EXPECT_EQ(action->triggers.size(), 2u);
    ASSERT_EQ(action->slots.size(), 3u);

    const SlotDescriptor& task_id = action->slots[0];
    EXPECT_EQ(task_id.type, SlotType::kInteger);
    EXPECT_EQ(task_id.strategy, ExtractionStrategy::kFirstInteger);
    EXPECT_TRUE(task_id.required);
    EXPECT_EQ(task_id.min_value.value_or(0), 1);
    EXPECT_FALSE(task_id.max_value.has_value());

    const SlotDescriptor& when = action->slots[1];
    EXPECT_EQ(when.type, SlotType::kEnum);
    EXPECT_EQ(when.strategy, ExtractionStrategy::kEnumLookup);
    EXPECT_FALSE(when.required);
    EXPECT_EQ(when.value_aliases.at("tonight"), "today");

    const SlotDescriptor& target = action->slots[2];
    EXPECT_EQ(target.type, SlotType::kPath);
    EXPECT_EQ(target.context_fallback, ContextFallback::kCurrentFile);
    EXPECT_EQ(target.keywords, (std::vector<std::string>{"in"}));

    EXPECT_TRUE(catalog.IsSynonym("snooze", "postpone"));
    EXPECT_TRUE(catalog.IsSynonym("snooze", "defer"));

    ASSERT_EQ(catalog.PhraseRewrites().size(), 1u);
    EXPECT_EQ(catalog.PhraseRewrites()[0].phrase, (std::vector<std::string>{"put", "off"}));
    EXPECT_EQ(catalog.PhraseRewrites()[0].replacement, "snooze");
}

TEST(CatalogLoaderTest, RejectsMultiWordRewrite) {
    PatternCatalog catalog;
    std::string error;

    EXPECT_FALSE(LoadCatalogFromJson(R"({"rewrites": {"look at": "look into"}})",
                                     catalog, error));
    EXPECT_NE(error.find("look at"), std::string::npos);
    EXPECT_TRUE(catalog.PhraseRewrites().empty());
}

TEST(CatalogLoaderTest, ExtendsExistingCatalog) {
    auto catalog = BuildDefaultCatalog();
    const std::size_t before = catalog->ActionCount();
    std::string error;

    ASSERT_TRUE(LoadCatalogFromJson(kSnoozeCatalog, *catalog, error)) << error;
    EXPECT_EQ(catalog->ActionCount(), before + 1);
    EXPECT_NE(catalog->FindAction(Intent::kHelp, "general"), nullptr);
}

TEST(CatalogLoaderTest, ExplicitStrategy) {
    PatternCatalog catalog;
    std::string error;
    ASSERT_TRUE(LoadCatalogFromJson(R"({"actions": [{
        "intent": "help", "name": "topic", "triggers": ["help with"],
        "slots": [{"name": "topic", "strategy": "remaining_text", "required": true}]
    }]})", catalog, error)) << error;

    const ActionDescriptor* action = catalog.FindAction(Intent::kHelp, "topic");
    ASSERT_NE(action, nullptr);
    EXPECT_EQ(action->slots[0].type, SlotType::kString);
    EXPECT_EQ(action->slots[0].strategy, ExtractionStrategy::kRemainingText);
}

TEST(CatalogLoaderTest, RejectsUnknownIntent) {
    PatternCatalog catalog;
    std::string error;

    EXPECT_FALSE(LoadCatalogFromJson(
        R"({"actions": [{"intent": "weather", "name": "today", "triggers": ["weather"]}]})",
        catalog, error));
    EXPECT_NE(error.find("weather"), std::string::npos);
}

TEST(CatalogLoaderTest, RejectsBadSlots) {
    PatternCatalog catalog;
    std::string error;

    EXPECT_FALSE(LoadCatalogFromJson(R"({"actions": [{
        "intent": "help", "name": "a", "triggers": ["aa"],
        "slots": [{"name": "x", "type": "float"}]}]})", catalog, error));
    EXPECT_NE(error.find("float"), std::string::npos);

    EXPECT_FALSE(LoadCatalogFromJson(R"({"actions": [{
        "intent": "help", "name": "a", "triggers": ["aa"],
        "slots": [{"name": "x", "type": "enum"}]}]})", catalog, error));

    EXPECT_FALSE(LoadCatalogFromJson(R"({"actions": [{
        "intent": "help", "name": "a", "triggers": ["aa"],
        "slots": [{"name": "x", "fallback": "clipboard"}]}]})", catalog, error));
}

TEST(CatalogLoaderTest, FailureLeavesCatalogUntouched) {
    auto catalog = BuildDefaultCatalog();
    const std::size_t before = catalog->ActionCount();
    std::string error;

    // The first action is valid; the second reuses a built-in trigger.
    EXPECT_FALSE(LoadCatalogFromJson(R"({"actions": [
        {"intent": "help", "name": "faq", "triggers": ["show faq"]},
        {"intent": "help", "name": "again", "triggers": ["show status"]}
    ]})", *catalog, error));

    EXPECT_EQ(catalog->ActionCount(), before);
    EXPECT_EQ(catalog->FindAction(Intent::kHelp, "faq"), nullptr);
}

TEST(CatalogLoaderTest, MalformedJson) {
    PatternCatalog catalog;
    std::string error;

    EXPECT_FALSE(LoadCatalogFromJson("{\"actions\": [", catalog, error));
    EXPECT_FALSE(error.empty());

    // Missing "triggers".
    EXPECT_FALSE(LoadCatalogFromJson(R"({"actions": [{"intent": "help", "name": "x"}]})",
                                     catalog, error));
    EXPECT_EQ(catalog.ActionCount(), 0u);
}

TEST(CatalogLoaderTest, MissingFile) {
    PatternCatalog catalog;
    std::string error;
    EXPECT_FALSE(LoadCatalogFromFile("/nonexistent/catalog.json", catalog, error));
}

}  // namespace
}  // namespace nl_command
