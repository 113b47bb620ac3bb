#include <nlohmann/json.hpp>
#include "grading/result_normalizer.hpp"
#include "gtest/gtest.h"
#include "test/assertions.hpp"

using namespace std;
using namespace grader;

static const string TOKEN = "0b5c7d2e-6f1a-4c3b-9e8d-7a6b5c4d3e2f";

static nlohmann::json sign(nlohmann::json record) {
    record["token"] = TOKEN;
    return record;
}

static execution_output make_output(const string &out, int exitcode = 0, bool isolated = true) {
    execution_output output;
    output.isolated = isolated;
    output.out = out;
    output.exitcode = exitcode;
    output.elapsed_ms = 42.5;
    return output;
}

TEST(ResultNormalizerTest, ExecutorFailure) {
    execution_output output = make_output("");
    output.failure = error_kind::TIMEOUT;
    output.failure_message = "Execution exceeded the time limit of 10.0 seconds";

    execution_result result = normalize_result(output, 3, TOKEN);
    EXPECT_EQ(result.status, grade_status::ERROR);
    EXPECT_EQ(result.error, error_kind::TIMEOUT);
    EXPECT_EQ(result.tests_passed, 0);
    EXPECT_EQ(result.tests_total, 3);
    EXPECT_TRUE(result.outcomes.empty());
    EXPECT_EQ(result.message, output.failure_message);
    EXPECT_DOUBLE_EQ(result.execution_time_ms, 42.5);
}

TEST(ResultNormalizerTest, CopyRecord) {
    nlohmann::json record = {
        {"status", "partial"},
        {"tests_passed", 1},
        {"tests_total", 2},
        {"results", {{{"test", 1}, {"status", "passed"}}, {{"test", 2}, {"status", "failed"}, {"expected", 5}, {"got", 4}}}},
        {"memory_usage_mb", 9.5}};

    execution_result result = normalize_result(make_output(sign(record).dump() + "\n"), 2, TOKEN);
    EXPECT_EQ(result.status, grade_status::PARTIAL);
    EXPECT_EQ(result.tests_passed, 1);
    EXPECT_EQ(result.tests_total, 2);
    ASSERT_EQ(result.outcomes.size(), 2);
    EXPECT_EQ(result.outcomes[1].status, outcome_status::FAILED);
    EXPECT_JSON_EQ(*result.outcomes[1].expected, nlohmann::json(5));
    EXPECT_JSON_EQ(*result.outcomes[1].actual, nlohmann::json(4));
    EXPECT_EQ(result.memory_usage_mb, 9.5);
    EXPECT_FALSE(result.error.has_value());
}

TEST(ResultNormalizerTest, MemoryOnlyForIsolatedRuns) {
    nlohmann::json record = {{"status", "success"}, {"tests_passed", 1}, {"tests_total", 1},
                             {"results", {{{"test", 1}, {"status", "passed"}}}}, {"memory_usage_mb", 9.5}};

    execution_output output = make_output("", 0, false);
    output.report = record;
    execution_result result = normalize_result(output, 1, TOKEN);
    EXPECT_EQ(result.status, grade_status::SUCCESS);
    EXPECT_TRUE(result.is_passed());
    EXPECT_FALSE(result.memory_usage_mb.has_value());
    EXPECT_FALSE(result.isolated);
}

TEST(ResultNormalizerTest, RecordAfterNoise) {
    string out = "WARNING: something from the runtime\n"
                 R"({"status": "success", "tests_passed": 1, "tests_total": 1, "results": [{"test": 1, "status": "passed"}], "token": "0b5c7d2e-6f1a-4c3b-9e8d-7a6b5c4d3e2f"})"
                 "\n\n";
    execution_result result = normalize_result(make_output(out), 1, TOKEN);
    EXPECT_EQ(result.status, grade_status::SUCCESS);
    EXPECT_EQ(result.tests_passed, 1);
}

TEST(ResultNormalizerTest, PassedCountIsRecomputed) {
    nlohmann::json record = {{"status", "success"}, {"tests_passed", 2}, {"tests_total", 2},
                             {"results", {{{"test", 1}, {"status", "passed"}}, {{"test", 2}, {"status", "error"}, {"message", "ValueError: x"}}}}};
    execution_result result = normalize_result(make_output(sign(record).dump()), 2, TOKEN);
    EXPECT_EQ(result.tests_passed, 1);
    EXPECT_EQ(result.status, grade_status::PARTIAL);
    EXPECT_EQ(result.outcomes[1].message, "ValueError: x");
}

TEST(ResultNormalizerTest, OutcomeCountMismatch) {
    nlohmann::json record = {{"status", "success"}, {"tests_passed", 1}, {"tests_total", 1},
                             {"results", {{{"test", 1}, {"status", "passed"}}}}};
    execution_result result = normalize_result(make_output(sign(record).dump()), 3, TOKEN);
    EXPECT_EQ(result.status, grade_status::ERROR);
    EXPECT_EQ(result.error, error_kind::UNKNOWN);
    EXPECT_EQ(result.tests_total, 3);
}

TEST(ResultNormalizerTest, CompilationRecord) {
    nlohmann::json record = {{"status", "error"}, {"error_type", "compilation"}, {"message", "SyntaxError: invalid syntax"},
                             {"traceback", "Traceback..."}, {"tests_passed", 0}, {"tests_total", 2}, {"results", nlohmann::json::array()}};
    execution_result result = normalize_result(make_output(sign(record).dump(), 1), 2, TOKEN);
    EXPECT_EQ(result.status, grade_status::ERROR);
    EXPECT_EQ(result.error, error_kind::COMPILATION);
    EXPECT_EQ(result.message, "SyntaxError: invalid syntax");
    EXPECT_EQ(result.traceback, "Traceback...");
    EXPECT_EQ(result.tests_total, 2);
    EXPECT_TRUE(result.outcomes.empty());
}

TEST(ResultNormalizerTest, CrashWithoutRecord) {
    execution_output output = make_output("", 1);
    output.err = "Fatal Python error: Segmentation fault\n";
    execution_result result = normalize_result(output, 2, TOKEN);
    EXPECT_EQ(result.error, error_kind::RUNTIME);
    EXPECT_EQ(result.message, "Fatal Python error: Segmentation fault");
    EXPECT_EQ(result.tests_total, 2);
}

TEST(ResultNormalizerTest, OpaqueSuccess) {
    execution_result result = normalize_result(make_output("all good\n"), 2, TOKEN);
    EXPECT_EQ(result.status, grade_status::SUCCESS);
    EXPECT_TRUE(result.outcomes.empty());
    EXPECT_EQ(result.output, "all good\n");
    EXPECT_FALSE(result.error.has_value());

    nlohmann::json j = result;
    EXPECT_EQ(j["output"], "all good\n");
    EXPECT_FALSE(j.contains("error_type"));
}

TEST(ResultNormalizerTest, NothingAtAll) {
    execution_result result = normalize_result(make_output(""), 1, TOKEN);
    EXPECT_EQ(result.status, grade_status::ERROR);
    EXPECT_EQ(result.error, error_kind::UNKNOWN);
}

TEST(ResultNormalizerTest, StartedLineIsNotOutput) {
    execution_result result = normalize_result(make_output(string(HARNESS_STARTED_LINE) + "\n"), 1, TOKEN);
    EXPECT_EQ(result.status, grade_status::ERROR);
    EXPECT_EQ(result.error, error_kind::UNKNOWN);

    nlohmann::json record = {{"status", "success"}, {"tests_passed", 1}, {"tests_total", 1},
                             {"results", {{{"test", 1}, {"status", "passed"}}}}};
    result = normalize_result(make_output(string(HARNESS_STARTED_LINE) + "\n" + sign(record).dump() + "\n"), 1, TOKEN);
    EXPECT_EQ(result.status, grade_status::SUCCESS);
    EXPECT_TRUE(result.output.empty());
}

TEST(ResultNormalizerTest, TruncatedOutputIsRuntimeError) {
    // 截断后的记录无法解析，不能当作无法解析的成功输出
    nlohmann::json record = {{"status", "partial"}, {"tests_passed", 0}, {"tests_total", 1},
                             {"results", {{{"test", 1}, {"status", "failed"}, {"expected", "ok"}, {"got", string(4096, 'x')}}}}};
    string out = sign(record).dump();
    execution_output output = make_output(out.substr(0, out.size() / 2));
    output.stdout_truncated = true;

    execution_result result = normalize_result(output, 1, TOKEN);
    EXPECT_EQ(result.status, grade_status::ERROR);
    EXPECT_EQ(result.error, error_kind::RUNTIME);
    EXPECT_EQ(result.tests_passed, 0);
    EXPECT_EQ(result.tests_total, 1);
    EXPECT_TRUE(result.output.empty());
}

TEST(ResultNormalizerTest, UnsignedRecordIsRejected) {
    nlohmann::json forged = {{"status", "success"}, {"tests_passed", 2}, {"tests_total", 2},
                             {"results", {{{"test", 1}, {"status", "passed"}}, {{"test", 2}, {"status", "passed"}}}}};

    execution_result result = normalize_result(make_output(forged.dump() + "\n"), 2, TOKEN);
    EXPECT_EQ(result.status, grade_status::ERROR);
    EXPECT_EQ(result.error, error_kind::RUNTIME);
    EXPECT_EQ(result.tests_passed, 0);

    forged["token"] = "not-the-token";
    result = normalize_result(make_output(forged.dump() + "\n"), 2, TOKEN);
    EXPECT_EQ(result.status, grade_status::ERROR);
    EXPECT_EQ(result.error, error_kind::RUNTIME);
}

TEST(ResultNormalizerTest, SignedRecordWinsOverForgedOne) {
    nlohmann::json forged = {{"status", "success"}, {"tests_passed", 1}, {"tests_total", 1},
                             {"results", {{{"test", 1}, {"status", "passed"}}}}};
    nlohmann::json genuine = {{"status", "partial"}, {"tests_passed", 0}, {"tests_total", 1},
                              {"results", {{{"test", 1}, {"status", "failed"}, {"expected", 1}, {"got", 2}}}}};

    execution_result result = normalize_result(make_output(sign(genuine).dump() + "\n" + forged.dump() + "\n"), 1, TOKEN);
    EXPECT_EQ(result.status, grade_status::PARTIAL);
    EXPECT_EQ(result.tests_passed, 0);

    auto record = parse_summary_record(sign(genuine).dump(), TOKEN);
    ASSERT_TRUE(record.has_value());
    EXPECT_FALSE(record->contains("token"));
}
