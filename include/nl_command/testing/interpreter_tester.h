#ifndef NL_COMMAND_TESTING_INTERPRETER_TESTER_H_
#define NL_COMMAND_TESTING_INTERPRETER_TESTER_H_

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "nl_command/catalog/pattern_catalog.h"
#include "nl_command/context/session_context.h"
#include "nl_command/interpreter.h"
#include "nl_command/interpreter_config.h"

namespace nl_command::testing {

/**
 * @brief Flattened outcome of one utterance, convenient for assertions.
 */
struct TestResult {
    bool recognized = false;           ///< success and confidence >= min confidence
    std::string intent;                ///< "task_management" (empty if not recognized)
    std::string action;                ///< "create" (empty if not recognized)
    float confidence = 0.0f;           ///< Final confidence (0.0 - 1.0)
    std::unordered_map<std::string, std::string> params;  ///< Extracted parameters
    std::vector<std::string> missing_params;  ///< Unresolved required slots
    std::string canonical_form;        ///< "task_management.create(...)"
    bool low_confidence = false;
    bool from_cache = false;
    std::vector<std::string> suggestions;
    std::string raw_text;              ///< The input utterance
    std::string error;                 ///< Error message if not recognized
};

/**
 * @brief Runs utterances through a fresh Interpreter.
 *
 * Each tester owns its own interpreter, so cache and history never leak
 * between tests.
 *
 * ## Usage Example
 *
 * ```cpp
 * TEST(Tasks, CreateExtractsText) {
 *     nl_command::testing::InterpreterTester tester;
 *     ASSERT_TRUE(tester.Init());
 *
 *     auto result = tester.ProcessText("create task fix login bug");
 *
 *     EXPECT_TRUE(result.recognized);
 *     EXPECT_EQ(result.action, "create");
 *     EXPECT_EQ(result.params["task_text"], "fix login bug");
 * }
 * ```
 */
class InterpreterTester {
public:
    InterpreterTester();
    ~InterpreterTester();

    // Non-copyable, movable
    InterpreterTester(const InterpreterTester&) = delete;
    InterpreterTester& operator=(const InterpreterTester&) = delete;
    InterpreterTester(InterpreterTester&&) noexcept;
    InterpreterTester& operator=(InterpreterTester&&) noexcept;

    /**
     * @brief Initialize the underlying interpreter.
     *
     * @param config Interpreter configuration.
     * @param catalog Action catalog. If nullptr, the built-in catalog.
     * @return true if initialization succeeded, false otherwise.
     */
    bool Init(const InterpreterConfig& config = {},
              std::shared_ptr<const PatternCatalog> catalog = nullptr);

    /**
     * @brief The interpreter under test.
     */
    Interpreter* GetInterpreter();

    /**
     * @brief Session context sent with every subsequent ProcessText().
     */
    void SetSessionContext(SessionContext context);

    /**
     * @brief Session id sent with every subsequent ProcessText().
     */
    void SetSessionId(std::string session_id);

    /**
     * @brief Interpret one utterance.
     */
    TestResult ProcessText(const std::string& text);

    /**
     * @brief Interpret several utterances in order, in the same session.
     */
    std::vector<TestResult> ProcessBatch(const std::vector<std::string>& texts);

    /**
     * @brief Results below this confidence are reported as not recognized.
     *
     * Default is 0.5.
     */
    void SetMinConfidence(float threshold);

private:
    std::unique_ptr<Interpreter> interpreter_;
    SessionContext context_;
    std::string session_id_ = kDefaultSessionId;
    float min_confidence_ = 0.5f;
    bool initialized_ = false;
};

}  // namespace nl_command::testing

#endif  // NL_COMMAND_TESTING_INTERPRETER_TESTER_H_
