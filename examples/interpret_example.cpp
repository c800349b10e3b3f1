/**
 * @file interpret_example.cpp
 * @brief Runs a batch of typed commands through the interpreter.
 *
 * Shows recognition, parameter extraction, typo tolerance, context
 * fallback, suggestions for low-confidence input and the metrics snapshot.
 */

#include <cstdio>
#include <string>
#include <vector>

#include "nl_command/interpreter.h"
#include "nl_command/testing/interpreter_tester.h"

using namespace nl_command;
using namespace nl_command::testing;

// Print test result in a formatted way
void PrintResult(const TestResult& result) {
    printf("\n----------------------------------------\n");
    printf("Input: \"%s\"\n", result.raw_text.c_str());

    if (result.recognized) {
        printf("Recognized: YES%s\n", result.from_cache ? " (cached)" : "");
        printf("Command: %s\n", result.canonical_form.c_str());
        printf("Confidence: %.2f\n", result.confidence);

        if (!result.params.empty()) {
            printf("Parameters:\n");
            for (const auto& [name, value] : result.params) {
                printf("  %s = \"%s\"\n", name.c_str(), value.c_str());
            }
        }
        for (const auto& missing : result.missing_params) {
            printf("  %s = <missing>\n", missing.c_str());
        }
    } else {
        printf("Recognized: NO\n");
        if (!result.error.empty()) {
            printf("Error: %s\n", result.error.c_str());
        }
    }

    if (!result.suggestions.empty()) {
        printf("Did you mean:\n");
        for (const auto& suggestion : result.suggestions) {
            printf("  %s\n", suggestion.c_str());
        }
    }
}

int main() {
    printf("=== Command Interpreter Example ===\n");

    InterpreterTester tester;
    if (!tester.Init()) {
        fprintf(stderr, "Failed to initialize InterpreterTester\n");
        return 1;
    }

    SessionContext context;
    context.current_file = "src/main.py";
    context.current_directory = "/home/user/project";
    tester.SetSessionContext(context);

    std::vector<std::string> inputs = {
        // Plain commands
        "show status",
        "list tasks",
        "what can you do",

        // Parameters
        "open file test.py",
        "set volume to 75",
        "create task \"fix the login bug\" high priority",
        "move notes.txt to archive/",

        // Typos
        "creat urgent tsk for code review",
        "opn file README.md",

        // Context fallback
        "analyze this file",
        "list files here",

        // Repeated input is served from the cache
        "show status",

        // Edge cases
        "open file",         // Missing parameter
        "random gibberish",  // Unrecognized
        "",                  // Empty input
    };

    printf("\n=== Running %zu inputs ===\n", inputs.size());

    auto results = tester.ProcessBatch(inputs);
    for (const auto& result : results) {
        PrintResult(result);
    }

    printf("\n=== Phrase completion for \"task\" ===\n");
    for (const auto& phrase : tester.GetInterpreter()->SuggestPhrases("task", 5)) {
        printf("  %s\n", phrase.c_str());
    }

    InterpreterMetrics metrics = tester.GetInterpreter()->GetMetrics();
    printf("\n=== Metrics ===\n");
    printf("Total processed: %zu\n", metrics.total_processed);
    printf("Cache hits: %zu (%.0f%%)\n", metrics.cache_hits, metrics.cache_hit_ratio * 100.0);
    printf("Average time: %.3f ms\n", metrics.average_processing_time_ms);
    printf("Catalog: %zu intents, %zu actions\n",
           metrics.supported_intents_count, metrics.supported_actions_count);

    return 0;
}
