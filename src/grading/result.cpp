#include "grading/result.hpp"
#include "common/json_utils.hpp"

namespace grader {
using namespace std;

bool execution_result::is_passed() const {
    return status == grade_status::SUCCESS && tests_passed == tests_total;
}

void to_json(nlohmann::json &j, const test_outcome &outcome) {
    j = {{"test", outcome.index},
         {"status", to_string(outcome.status)}};
    if (outcome.status == outcome_status::FAILED) {
        j["expected"] = outcome.expected.value_or(nlohmann::json());
        j["got"] = outcome.actual.value_or(nlohmann::json());
    } else if (outcome.status == outcome_status::ERRORED) {
        j["message"] = outcome.message;
        if (!outcome.traceback.empty()) j["traceback"] = outcome.traceback;
    }
}

void to_json(nlohmann::json &j, const execution_result &result) {
    j = {{"status", to_string(result.status)},
         {"tests_passed", result.tests_passed},
         {"tests_total", result.tests_total},
         {"results", result.outcomes},
         {"execution_time_ms", result.execution_time_ms},
         {"isolated", result.isolated}};
    if (result.memory_usage_mb) j["memory_usage_mb"] = *result.memory_usage_mb;
    if (result.error) j["error_type"] = to_string(*result.error);
    if (!result.message.empty()) j["message"] = result.message;
    if (!result.traceback.empty()) j["traceback"] = result.traceback;
    if (!result.output.empty()) j["output"] = result.output;
}

test_outcome parse_test_outcome(const nlohmann::json &j, size_t index) {
    if (!j.is_object())
        throw invalid_argument("test outcome must be a JSON object");

    test_outcome outcome;
    outcome.index = nlohmann::get_value_def<size_t>(j, index, "test");
    outcome.status = parse_outcome_status(nlohmann::get_value<string>(j, "status"));
    if (outcome.status == outcome_status::FAILED) {
        outcome.expected = j.value("expected", nlohmann::json());
        outcome.actual = j.value("got", nlohmann::json());
    } else if (outcome.status == outcome_status::ERRORED) {
        nlohmann::assign_optional(j, outcome.message, "message");
        nlohmann::assign_optional(j, outcome.traceback, "traceback");
    }
    return outcome;
}

}  // namespace grader
