#include "grading/result_normalizer.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <vector>
#include "common/json_utils.hpp"

namespace grader {
using namespace std;

execution_result make_error_result(error_kind kind, const string &message, size_t tests_total, bool isolated) {
    execution_result result;
    result.status = grade_status::ERROR;
    result.error = kind;
    result.message = message.empty() ? get_display_message(kind) : message;
    result.tests_passed = 0;
    result.tests_total = tests_total;
    result.isolated = isolated;
    return result;
}

/**
 * @brief 找出 stdout 中所有形如记录的行，最后一行在前
 */
static vector<nlohmann::json> find_records(const string &out) {
    vector<string> lines;
    vector<nlohmann::json> records;
    boost::split(lines, out, boost::is_any_of("\n"));
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        string line = boost::trim_copy(*it);
        if (line.empty()) continue;
        nlohmann::json record = nlohmann::json::parse(line, nullptr, false);
        if (!record.is_discarded() && record.is_object() && record.count("status"))
            records.push_back(move(record));
    }
    return records;
}

optional<nlohmann::json> parse_summary_record(const string &out, const string &token) {
    for (auto &record : find_records(out)) {
        auto it = record.find("token");
        string actual = it != record.end() && it->is_string() ? it->get<string>() : "";
        if (actual != token) continue;
        record.erase("token");
        return record;
    }
    return nullopt;
}

/**
 * @brief 从记录中复制各个字段
 * @throw std::invalid_argument 若记录格式不正确
 */
static execution_result copy_record(const nlohmann::json &record, size_t tests_total, bool isolated) {
    execution_result result;
    result.isolated = isolated;
    result.tests_total = tests_total;
    result.status = parse_grade_status(nlohmann::get_value<string>(record, "status"));

    if (result.status == grade_status::ERROR) {
        result.error = parse_error_kind(nlohmann::get_value_def<string>(record, "unknown", "error_type"));
        nlohmann::assign_optional(record, result.message, "message");
        nlohmann::assign_optional(record, result.traceback, "traceback");
        if (result.message.empty()) result.message = get_display_message(*result.error);
        return result;
    }

    if (nlohmann::exists(record, "results")) {
        auto &results = nlohmann::access(record, "results");
        if (!results.is_array()) throw invalid_argument("results must be an array");
        for (size_t i = 0; i < results.size(); ++i)
            result.outcomes.push_back(parse_test_outcome(results[i], i + 1));
    }
    if (result.outcomes.size() != tests_total)
        throw invalid_argument("record contains " + std::to_string(result.outcomes.size()) +
                               " test outcomes, expected " + std::to_string(tests_total));

    size_t passed = 0;
    for (auto &outcome : result.outcomes)
        if (outcome.status == outcome_status::PASSED) ++passed;
    size_t reported = nlohmann::get_value_def<size_t>(record, passed, "tests_passed");
    if (reported != passed)
        LOG(WARNING) << "Record reports " << reported << " passed tests but contains " << passed;
    result.tests_passed = passed;

    // 状态以逐个数据点的结果为准
    result.status = passed == tests_total ? grade_status::SUCCESS : grade_status::PARTIAL;
    return result;
}

execution_result normalize_result(const execution_output &output, size_t tests_total, const string &token) {
    execution_result result;

    if (output.failure) {
        result = make_error_result(*output.failure, output.failure_message, tests_total, output.isolated);
    } else if (!output.report && output.stdout_truncated) {
        LOG(WARNING) << "Execution output exceeded the limit and was truncated";
        result = make_error_result(error_kind::RUNTIME, "Output exceeded the size limit and was truncated", tests_total, output.isolated);
    } else {
        string out = strip_started_line(output.out);
        optional<nlohmann::json> record = output.report;
        if (!record) record = parse_summary_record(out, token);

        if (!record && !find_records(out).empty()) {
            LOG(WARNING) << "Execution output contains a record that was not written by the harness";
            result = make_error_result(error_kind::RUNTIME, "Submission wrote a summary record that was not produced by the grader", tests_total, output.isolated);
        } else if (record) {
            try {
                result = copy_record(*record, tests_total, output.isolated);
                if (output.isolated && record->count("memory_usage_mb") && (*record)["memory_usage_mb"].is_number())
                    result.memory_usage_mb = (*record)["memory_usage_mb"].get<double>();
            } catch (invalid_argument &ex) {
                LOG(WARNING) << "Malformed execution record: " << ex.what();
                result = make_error_result(error_kind::UNKNOWN, string("Malformed execution record: ") + ex.what(), tests_total, output.isolated);
            }
        } else if (output.exitcode != 0) {
            string err = boost::trim_copy(output.err);
            result = make_error_result(error_kind::RUNTIME, err.empty() ? "Process exited with code " + std::to_string(output.exitcode) : err, tests_total, output.isolated);
        } else if (!boost::trim_copy(out).empty()) {
            LOG(WARNING) << "Execution output cannot be parsed, treating it as an opaque success";
            result.status = grade_status::SUCCESS;
            result.tests_total = tests_total;
            result.tests_passed = 0;
            result.output = out;
            result.isolated = output.isolated;
        } else {
            result = make_error_result(error_kind::UNKNOWN, "Execution produced no output", tests_total, output.isolated);
        }
    }

    result.execution_time_ms = output.elapsed_ms;
    return result;
}

}  // namespace grader
