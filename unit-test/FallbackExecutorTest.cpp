#include <nlohmann/json.hpp>
#include "common/utils.hpp"
#include "grading/fallback_executor.hpp"
#include "grading/grading_service.hpp"
#include "gtest/gtest.h"
#include "test/assertions.hpp"

using namespace std;
using namespace grader;

class FallbackExecutorTest : public ::testing::Test {
protected:
    grader_config config;
    shared_ptr<const function_resolver> resolver = make_shared<last_public_callable_resolver>();
    unique_ptr<grading_service> service;

    void SetUp() override {
        config.fallback_timeout = chrono::milliseconds(1000);
        service = make_unique<grading_service>(config, false, nullptr,
                                               make_unique<fallback_executor>(config, resolver), resolver);
    }

    execution_result grade(const string &source, const nlohmann::json &cases) {
        vector<test_case> tests;
        for (auto &item : cases) tests.push_back(item.get<test_case>());
        return service->grade(source, tests);
    }
};

TEST_F(FallbackExecutorTest, AllPassed) {
    auto result = grade("def solution(n):\n    return n * 2\n",
                        R"([{"input": 2, "expected": 4}, {"input": 5, "expected": 10}])"_json);
    EXPECT_EQ(result.status, grade_status::SUCCESS);
    EXPECT_EQ(result.tests_passed, 2);
    EXPECT_EQ(result.tests_total, 2);
    EXPECT_TRUE(result.is_passed());
    EXPECT_FALSE(result.isolated);
    EXPECT_FALSE(result.memory_usage_mb.has_value());
}

TEST_F(FallbackExecutorTest, Partial) {
    auto result = grade("def solution(n):\n    return n * 2\n",
                        R"([{"input": 2, "expected": 4}, {"input": 2, "expected": 5}])"_json);
    EXPECT_EQ(result.status, grade_status::PARTIAL);
    EXPECT_EQ(result.tests_passed, 1);
    ASSERT_EQ(result.outcomes.size(), 2);
    EXPECT_EQ(result.outcomes[1].index, 2);
    EXPECT_EQ(result.outcomes[1].status, outcome_status::FAILED);
    EXPECT_JSON_EQ(*result.outcomes[1].expected, nlohmann::json(5));
    EXPECT_JSON_EQ(*result.outcomes[1].actual, nlohmann::json(4));
}

TEST_F(FallbackExecutorTest, SyntaxError) {
    auto result = grade("def solution(n)\n    return n\n",
                        R"([{"input": 1, "expected": 1}, {"input": 2, "expected": 2}])"_json);
    EXPECT_EQ(result.status, grade_status::ERROR);
    EXPECT_EQ(result.error, error_kind::COMPILATION);
    EXPECT_EQ(result.tests_passed, 0);
    EXPECT_EQ(result.tests_total, 2);
    EXPECT_TRUE(result.outcomes.empty());
    EXPECT_EQ(result.message.rfind("SyntaxError", 0), 0) << result.message;
}

TEST_F(FallbackExecutorTest, ModuleLevelException) {
    auto result = grade("raise RuntimeError('boom')\n", R"([{"input": 1, "expected": 1}])"_json);
    EXPECT_EQ(result.error, error_kind::COMPILATION);
    EXPECT_EQ(result.message, "RuntimeError: boom");
    EXPECT_NE(result.traceback.find("<submission>"), string::npos);
}

TEST_F(FallbackExecutorTest, NullByteIsCompilationError) {
    auto result = grade(string("def solution(n):\n    return n\0", 31), R"([{"input": 1, "expected": 1}])"_json);
    EXPECT_EQ(result.error, error_kind::COMPILATION);
}

TEST_F(FallbackExecutorTest, ErrorDoesNotAbortSiblings) {
    auto result = grade("def divide(pair):\n    return pair[0] // pair[1]\n",
                        R"([{"input": [4, 2], "expected": 2, "function": "divide"},
                            {"input": [1, 0], "expected": 0, "function": "divide"},
                            {"input": [9, 3], "expected": 3, "function": "divide"}])"_json);
    EXPECT_EQ(result.status, grade_status::PARTIAL);
    EXPECT_EQ(result.tests_passed, 2);
    ASSERT_EQ(result.outcomes.size(), 3);
    EXPECT_EQ(result.outcomes[1].status, outcome_status::ERRORED);
    EXPECT_EQ(result.outcomes[1].message.rfind("ZeroDivisionError", 0), 0);
    EXPECT_FALSE(result.outcomes[1].traceback.empty());
}

TEST_F(FallbackExecutorTest, UnpackInput) {
    auto result = grade("def add(a, b):\n    return a + b\n",
                        R"([{"input": [1, 2], "expected": 3, "function": "add", "unpack": true},
                            {"input": [1, 2], "expected": [1, 2, 1, 2], "function": "twice"}])"_json);
    ASSERT_EQ(result.outcomes.size(), 2);
    EXPECT_EQ(result.outcomes[0].status, outcome_status::PASSED);
    // twice 不存在，退回到最后定义的 add，一个参数调用会抛出 TypeError
    EXPECT_EQ(result.outcomes[1].status, outcome_status::ERRORED);
    EXPECT_EQ(result.outcomes[1].message.rfind("TypeError", 0), 0);
}

TEST_F(FallbackExecutorTest, ResolvesLastPublicCallable) {
    auto result = grade("def _helper(x):\n    return x + 1\n"
                        "def compute(x):\n    return _helper(x)\n",
                        R"([{"input": 1, "expected": 2}])"_json);
    EXPECT_EQ(result.status, grade_status::SUCCESS);
}

TEST_F(FallbackExecutorTest, NoCallableFound) {
    auto result = grade("VALUE = 1\ndef _hidden(x):\n    return x\n", R"([{"input": 1, "expected": 1}])"_json);
    EXPECT_EQ(result.status, grade_status::PARTIAL);
    ASSERT_EQ(result.outcomes.size(), 1);
    EXPECT_EQ(result.outcomes[0].status, outcome_status::ERRORED);
    EXPECT_EQ(result.outcomes[0].message.rfind("NameError", 0), 0);
}

TEST_F(FallbackExecutorTest, MainBlockIsNotExecuted) {
    auto result = grade("def solution(n):\n    return n\n"
                        "if __name__ == '__main__':\n    raise SystemExit(3)\n",
                        R"([{"input": 1, "expected": 1}])"_json);
    EXPECT_EQ(result.status, grade_status::SUCCESS);
}

TEST_F(FallbackExecutorTest, StructuralEquality) {
    auto result = grade("def solution(n):\n    return {'a': [1, 2.0, (3, 4)], 'b': None}\n",
                        R"([{"input": 0, "expected": {"a": [1, 2, [3, 4]], "b": null}}])"_json);
    // 元组与列表在 Python 中不相等
    EXPECT_EQ(result.outcomes[0].status, outcome_status::FAILED);
    EXPECT_JSON_EQ(*result.outcomes[0].actual, R"({"a": [1, 2.0, [3, 4]], "b": null})"_json);

    result = grade("def solution(n):\n    return {'a': [1, 2.0, [3, 4]], 'b': None, 'c': True}\n",
                   R"([{"input": 0, "expected": {"a": [1, 2, [3, 4]], "b": null, "c": true}}])"_json);
    EXPECT_EQ(result.status, grade_status::SUCCESS);
}

TEST_F(FallbackExecutorTest, UnserializableValueUsesRepr) {
    auto result = grade("def solution(n):\n    return {1, 2}\n", R"([{"input": 0, "expected": [1, 2]}])"_json);
    ASSERT_EQ(result.outcomes.size(), 1);
    EXPECT_EQ(result.outcomes[0].status, outcome_status::FAILED);
    EXPECT_JSON_EQ(*result.outcomes[0].actual, nlohmann::json("{1, 2}"));

    result = grade("def solution(n):\n    return float('nan')\n", R"([{"input": 0, "expected": 0}])"_json);
    EXPECT_JSON_EQ(*result.outcomes[0].actual, nlohmann::json("nan"));
}

TEST_F(FallbackExecutorTest, InfiniteLoopTimesOut) {
    elapsed_time timer;
    auto result = grade("def solution(n):\n    while True:\n        pass\n",
                        R"([{"input": 1, "expected": 1}, {"input": 2, "expected": 2}])"_json);
    EXPECT_EQ(result.status, grade_status::ERROR);
    EXPECT_EQ(result.error, error_kind::TIMEOUT);
    EXPECT_EQ(result.tests_passed, 0);
    EXPECT_EQ(result.tests_total, 2);
    EXPECT_FALSE(result.isolated);
    EXPECT_LT(timer.milliseconds(), 5000);
}

TEST_F(FallbackExecutorTest, Idempotent) {
    nlohmann::json cases = R"([{"input": 2, "expected": 4}, {"input": 2, "expected": 5}, {"input": "x", "expected": 0}])"_json;
    string source = "def solution(n):\n    return n * 2\n";
    nlohmann::json first = grade(source, cases);
    nlohmann::json second = grade(source, cases);
    first.erase("execution_time_ms");
    second.erase("execution_time_ms");
    EXPECT_JSON_EQ(first, second);
}

TEST_F(FallbackExecutorTest, CancelledBeforeExecution) {
    fallback_executor executor(config, resolver);
    execution_request request{"def solution(n):\n    return n\n", {}};
    request.test_cases.push_back(R"({"input": 1, "expected": 1})"_json.get<test_case>());
    cancellation_token token;
    token.cancel();

    last_public_callable_resolver default_resolver;
    execution_output output = executor.execute(request, compile_harness(request, default_resolver), token);
    EXPECT_FALSE(output.isolated);
    ASSERT_TRUE(output.failure.has_value());
    EXPECT_EQ(*output.failure, error_kind::UNKNOWN);
}

TEST_F(FallbackExecutorTest, UserDefinedExceptionName) {
    auto result = grade("class InvalidMove(Exception):\n    pass\n"
                        "def solution(n):\n    raise InvalidMove('bad move %d' % n)\n",
                        R"([{"input": 3, "expected": 0}])"_json);
    ASSERT_EQ(result.outcomes.size(), 1);
    EXPECT_EQ(result.outcomes[0].message, "InvalidMove: bad move 3");

    result = grade("import json\njson.loads('{')\n", R"([{"input": 1, "expected": 1}])"_json);
    EXPECT_EQ(result.error, error_kind::COMPILATION);
    EXPECT_EQ(result.message.rfind("JSONDecodeError: ", 0), 0) << result.message;
}

TEST_F(FallbackExecutorTest, LargeValueIsClipped) {
    auto result = grade("def solution(n):\n    return 'x' * 2000000\n", R"([{"input": 1, "expected": "ok"}])"_json);
    ASSERT_EQ(result.outcomes.size(), 1);
    EXPECT_EQ(result.outcomes[0].status, outcome_status::FAILED);
    string got = result.outcomes[0].actual->get<string>();
    EXPECT_LE(got.size(), VALUE_DISPLAY_LIMIT + string("...<truncated>").size());
    EXPECT_EQ(got.rfind("'xxx", 0), 0);
}

TEST_F(FallbackExecutorTest, ConcurrentGradingsHaveTheirOwnTimeLimit) {
    // 每次评测消耗 0.4 秒 CPU，同时运行时共用 GIL，若时限互相重叠则会超出 1 秒的时限
    string source = "import time\n"
                    "def solution(n):\n"
                    "    start = time.thread_time()\n"
                    "    while time.thread_time() - start < 0.4:\n"
                    "        pass\n"
                    "    return n\n";
    vector<grading_ticket> tickets;
    for (int i = 0; i < 3; ++i) {
        execution_request request;
        request.source_code = source;
        request.test_cases.push_back(R"({"input": 1, "expected": 1})"_json.get<test_case>());
        tickets.push_back(service->grade_async(move(request)));
    }
    for (auto &ticket : tickets) {
        execution_result result = ticket.result.get();
        EXPECT_EQ(result.status, grade_status::SUCCESS) << result.message;
    }
}
