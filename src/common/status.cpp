#include "common/status.hpp"
#include <stdexcept>

namespace grader {
using namespace std;

const char *to_string(grade_status status) {
    switch (status) {
        case grade_status::SUCCESS: return "success";
        case grade_status::PARTIAL: return "partial";
        case grade_status::ERROR: return "error";
    }
    return "error";
}

const char *to_string(outcome_status status) {
    switch (status) {
        case outcome_status::PASSED: return "passed";
        case outcome_status::FAILED: return "failed";
        case outcome_status::ERRORED: return "error";
    }
    return "error";
}

const char *to_string(error_kind kind) {
    switch (kind) {
        case error_kind::VALIDATION: return "validation";
        case error_kind::COMPILATION: return "compilation";
        case error_kind::RUNTIME: return "runtime";
        case error_kind::TIMEOUT: return "timeout";
        case error_kind::SYSTEM: return "system";
        case error_kind::UNKNOWN: return "unknown";
    }
    return "unknown";
}

grade_status parse_grade_status(const string &name) {
    if (name == "success") return grade_status::SUCCESS;
    if (name == "partial") return grade_status::PARTIAL;
    if (name == "error") return grade_status::ERROR;
    throw invalid_argument("Unrecognized grading status " + name);
}

outcome_status parse_outcome_status(const string &name) {
    if (name == "passed") return outcome_status::PASSED;
    if (name == "failed") return outcome_status::FAILED;
    if (name == "error") return outcome_status::ERRORED;
    throw invalid_argument("Unrecognized test outcome " + name);
}

error_kind parse_error_kind(const string &name) {
    if (name == "validation") return error_kind::VALIDATION;
    if (name == "compilation") return error_kind::COMPILATION;
    if (name == "runtime") return error_kind::RUNTIME;
    if (name == "timeout") return error_kind::TIMEOUT;
    if (name == "system") return error_kind::SYSTEM;
    if (name == "unknown") return error_kind::UNKNOWN;
    throw invalid_argument("Unrecognized error type " + name);
}

const char *get_display_message(error_kind kind) {
    switch (kind) {
        case error_kind::VALIDATION: return "Invalid Request";
        case error_kind::COMPILATION: return "Compilation Error";
        case error_kind::RUNTIME: return "Runtime Error";
        case error_kind::TIMEOUT: return "Time Limit Exceeded";
        case error_kind::SYSTEM: return "System Error";
        case error_kind::UNKNOWN: return "Unknown Error";
    }
    return "Unknown Error";
}

}  // namespace grader
