#include "nl_command/catalog/default_catalog.h"

#include <cstdio>

namespace nl_command {

namespace {

SlotDescriptor PathSlot(const std::string& name,
                        bool required,
                        std::vector<std::string> keywords,
                        ContextFallback fallback = ContextFallback::kNone) {
    SlotDescriptor slot;
    slot.name = name;
    slot.type = SlotType::kPath;
    slot.strategy = ExtractionStrategy::kKeywordAdjacent;
    slot.required = required;
    slot.keywords = std::move(keywords);
    slot.context_fallback = fallback;
    return slot;
}

SlotDescriptor WordSlot(const std::string& name,
                        bool required,
                        std::vector<std::string> keywords) {
    SlotDescriptor slot;
    slot.name = name;
    slot.type = SlotType::kString;
    slot.strategy = ExtractionStrategy::kKeywordAdjacent;
    slot.required = required;
    slot.keywords = std::move(keywords);
    return slot;
}

SlotDescriptor FreeTextSlot(const std::string& name, bool required) {
    SlotDescriptor slot;
    slot.name = name;
    slot.type = SlotType::kString;
    slot.strategy = ExtractionStrategy::kRemainingText;
    slot.required = required;
    return slot;
}

SlotDescriptor IntegerSlot(const std::string& name,
                           bool required,
                           std::optional<int> min_value = std::nullopt,
                           std::optional<int> max_value = std::nullopt) {
    SlotDescriptor slot;
    slot.name = name;
    slot.type = SlotType::kInteger;
    slot.strategy = ExtractionStrategy::kFirstInteger;
    slot.required = required;
    slot.min_value = min_value;
    slot.max_value = max_value;
    return slot;
}

SlotDescriptor PrioritySlot(bool required) {
    SlotDescriptor slot;
    slot.name = "priority";
    slot.type = SlotType::kEnum;
    slot.strategy = ExtractionStrategy::kEnumLookup;
    slot.required = required;
    slot.enum_values = {"low", "medium", "high", "urgent"};
    slot.value_aliases = {
        {"critical", "urgent"}, {"asap", "urgent"}, {"immediately", "urgent"},
        {"important", "high"},
        {"normal", "medium"}, {"regular", "medium"},
        {"minor", "low"}, {"whenever", "low"}, {"later", "low"},
    };
    return slot;
}

SlotDescriptor LanguageSlot() {
    SlotDescriptor slot;
    slot.name = "language";
    slot.type = SlotType::kEnum;
    slot.strategy = ExtractionStrategy::kEnumLookup;
    slot.enum_values = {"python", "javascript", "typescript", "swift", "java",
                        "go", "rust", "cpp", "csharp"};
    slot.value_aliases = {
        {"py", "python"}, {"js", "javascript"}, {"node", "javascript"},
        {"ts", "typescript"}, {"ios", "swift"}, {"golang", "go"}, {"rs", "rust"},
        {"c++", "cpp"}, {"cxx", "cpp"}, {"c#", "csharp"},
    };
    return slot;
}

SlotDescriptor VolumeSlot() {
    SlotDescriptor slot = IntegerSlot("volume_level", true, 0, 100);
    slot.value_aliases = {
        {"mute", "0"}, {"silent", "0"},
        {"quiet", "25"}, {"low", "25"},
        {"loud", "100"}, {"max", "100"}, {"maximum", "100"},
    };
    return slot;
}

void RegisterSystemStatus(PatternCatalog& catalog, bool& ok) {
    const Intent intent = Intent::kSystemStatus;
    ok &= catalog.Register(intent, "health",
        {"show status", "system status", "check health", "health check",
         "is everything running", "status", "health"},
        {}, "Reports overall system health");
    ok &= catalog.Register(intent, "version",
        {"show version", "what version", "version"});
    ok &= catalog.Register(intent, "uptime",
        {"show uptime", "how long running", "uptime"});
    ok &= catalog.Register(intent, "performance",
        {"show performance", "check performance", "performance"});
    ok &= catalog.Register(intent, "memory",
        {"memory usage", "show memory", "memory"});
}

void RegisterFileOperations(PatternCatalog& catalog, bool& ok) {
    const Intent intent = Intent::kFileOperations;
    ok &= catalog.Register(intent, "list",
        {"list files", "show files", "list directory", "ls"},
        {PathSlot("directory", false, {"in", "directory", "folder", "under"},
                  ContextFallback::kCurrentDirectory)},
        "Lists files in a directory");
    ok &= catalog.Register(intent, "open",
        {"open file", "read file", "view file", "open"},
        {PathSlot("filename", true, {"file", "open", "read", "view"},
                  ContextFallback::kCurrentFile)},
        "Opens a file");
    ok &= catalog.Register(intent, "create",
        {"create file", "new file", "make file"},
        {PathSlot("filename", true, {"file", "called", "named"})},
        "Creates a file");
    ok &= catalog.Register(intent, "delete",
        {"delete file", "remove file"},
        {PathSlot("filename", true, {"file"}, ContextFallback::kCurrentFile)},
        "Deletes a file");
    ok &= catalog.Register(intent, "copy",
        {"copy file", "copy {filename} to {destination}"},
        {PathSlot("filename", true, {"file", "copy"}, ContextFallback::kCurrentFile),
         PathSlot("destination", false, {"to", "into"})},
        "Copies a file");
    ok &= catalog.Register(intent, "move",
        {"move file", "move {filename} to {destination}"},
        {PathSlot("filename", true, {"file", "move"}, ContextFallback::kCurrentFile),
         PathSlot("destination", false, {"to", "into"})},
        "Moves a file");
    ok &= catalog.Register(intent, "search",
        {"search files", "find file", "search for"},
        {FreeTextSlot("query", true)},
        "Searches files for text");
}

void RegisterProjectNavigation(PatternCatalog& catalog, bool& ok) {
    const Intent intent = Intent::kProjectNavigation;
    ok &= catalog.Register(intent, "current",
        {"where am i", "current directory", "show current location", "pwd"});
    ok &= catalog.Register(intent, "change",
        {"change directory", "navigate to", "switch directory", "navigate", "cd"},
        {PathSlot("path", true, {"to", "directory", "folder", "cd", "navigate"})},
        "Changes the working directory");
    ok &= catalog.Register(intent, "up",
        {"go up", "parent directory", "go back"});
    ok &= catalog.Register(intent, "home",
        {"go home", "project root", "home directory"});
    ok &= catalog.Register(intent, "list",
        {"list contents", "show contents"},
        {PathSlot("path", false, {"of", "in"}, ContextFallback::kCurrentDirectory)});
}

void RegisterCodeAnalysis(PatternCatalog& catalog, bool& ok) {
    const Intent intent = Intent::kCodeAnalysis;
    ok &= catalog.Register(intent, "analyze_file",
        {"analyze this file", "analyze file", "analyze code", "review file",
         "check code", "analyze"},
        {PathSlot("filename", true, {"file", "analyze", "review"},
                  ContextFallback::kCurrentFile),
         LanguageSlot()},
        "Analyzes a source file");
    ok &= catalog.Register(intent, "explain_function",
        {"explain function", "what does function", "explain"},
        {WordSlot("function_name", true, {"function", "method", "explain"})},
        "Explains what a function does");
    ok &= catalog.Register(intent, "explain_class",
        {"explain class", "describe class", "what does class"},
        {WordSlot("class_name", true, {"class", "object"})},
        "Explains what a class is for");
    ok &= catalog.Register(intent, "find_issues",
        {"find bugs", "find issues", "check for bugs", "find errors"},
        {PathSlot("filename", false, {"in", "file"}, ContextFallback::kCurrentFile),
         LanguageSlot()},
        "Looks for bugs");
    ok &= catalog.Register(intent, "suggestions",
        {"suggest improvements", "improve code", "optimize code"},
        {PathSlot("filename", false, {"in", "file"}, ContextFallback::kCurrentFile)});
    ok &= catalog.Register(intent, "complexity",
        {"code complexity", "code quality", "show metrics"});
    ok &= catalog.Register(intent, "dependencies",
        {"show dependencies", "list dependencies", "list imports"});
}

void RegisterTaskManagement(PatternCatalog& catalog, bool& ok) {
    const Intent intent = Intent::kTaskManagement;
    ok &= catalog.Register(intent, "list",
        {"list tasks", "show tasks", "my tasks"});
    ok &= catalog.Register(intent, "create",
        {"create task", "add task", "new task"},
        {FreeTextSlot("task_text", true), PrioritySlot(false)},
        "Creates a task");
    ok &= catalog.Register(intent, "update",
        {"update task", "modify task", "edit task"},
        {IntegerSlot("task_id", false, 1), FreeTextSlot("task_text", false)});
    ok &= catalog.Register(intent, "complete",
        {"complete task", "mark task complete", "finish task", "mark done"},
        {IntegerSlot("task_id", false, 1)});
    ok &= catalog.Register(intent, "delete",
        {"delete task", "remove task", "cancel task"},
        {IntegerSlot("task_id", false, 1)});
    ok &= catalog.Register(intent, "assign",
        {"assign task", "delegate task"},
        {WordSlot("assignee", true, {"to", "@"}), IntegerSlot("task_id", false, 1)},
        "Assigns a task to someone");
    ok &= catalog.Register(intent, "priority",
        {"set priority", "change priority"},
        {PrioritySlot(true), IntegerSlot("task_id", false, 1)});
}

void RegisterVoiceControl(PatternCatalog& catalog, bool& ok) {
    const Intent intent = Intent::kVoiceControl;
    ok &= catalog.Register(intent, "activate",
        {"activate voice", "start listening", "turn on voice", "voice on"});
    ok &= catalog.Register(intent, "deactivate",
        {"deactivate voice", "stop listening", "turn off voice", "voice off"});
    ok &= catalog.Register(intent, "volume",
        {"set volume", "change volume", "mute voice", "volume"},
        {VolumeSlot()},
        "Sets the voice feedback volume");
    ok &= catalog.Register(intent, "recognition",
        {"speech recognition", "voice recognition"});
    ok &= catalog.Register(intent, "commands",
        {"voice commands", "list voice commands"});
}

void RegisterHelp(PatternCatalog& catalog, bool& ok) {
    const Intent intent = Intent::kHelp;
    ok &= catalog.Register(intent, "general",
        {"help", "help me", "need help"});
    ok &= catalog.Register(intent, "commands",
        {"show commands", "available commands", "what can you do", "list commands"});
    ok &= catalog.Register(intent, "usage",
        {"how to use", "how do i use", "usage", "instructions"});
    ok &= catalog.Register(intent, "guide",
        {"user guide", "show guide", "tutorial", "manual"});
    ok &= catalog.Register(intent, "examples",
        {"show examples", "examples"});
}

void RegisterSynonyms(PatternCatalog& catalog) {
    catalog.AddSynonym("show", "display");
    catalog.AddSynonym("create", "make");
    catalog.AddSynonym("files", "documents");
    catalog.AddSynonym("directory", "folder");
    catalog.AddSynonym("tasks", "todos");
    catalog.AddSynonym("task", "todo");
    catalog.AddSynonym("analyze", "examine");
    catalog.AddSynonym("analyze", "inspect");
    catalog.AddSynonym("volume", "sound");
}

void RegisterPhraseRewrites(PatternCatalog& catalog, bool& ok) {
    ok &= catalog.AddPhraseRewrite("show me", "show");
    ok &= catalog.AddPhraseRewrite("give me", "show");
    ok &= catalog.AddPhraseRewrite("tell me", "show");
    ok &= catalog.AddPhraseRewrite("let me see", "show");
    ok &= catalog.AddPhraseRewrite("go to", "navigate");
    ok &= catalog.AddPhraseRewrite("move to", "navigate");
    ok &= catalog.AddPhraseRewrite("open up", "open");
    ok &= catalog.AddPhraseRewrite("look at", "analyze");
    ok &= catalog.AddPhraseRewrite("check out", "analyze");
}

}  // namespace

std::unique_ptr<PatternCatalog> BuildDefaultCatalog() {
    auto catalog = std::make_unique<PatternCatalog>();
    bool ok = true;

    RegisterSystemStatus(*catalog, ok);
    RegisterFileOperations(*catalog, ok);
    RegisterProjectNavigation(*catalog, ok);
    RegisterCodeAnalysis(*catalog, ok);
    RegisterTaskManagement(*catalog, ok);
    RegisterVoiceControl(*catalog, ok);
    RegisterHelp(*catalog, ok);
    RegisterSynonyms(*catalog);
    RegisterPhraseRewrites(*catalog, ok);

    if (!ok) {
        std::fprintf(stderr, "DefaultCatalog: some built-in actions failed to register\n");
    }
    return catalog;
}

}  // namespace nl_command
