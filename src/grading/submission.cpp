#include "grading/submission.hpp"
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace grader {
using namespace std;

void from_json(const nlohmann::json &j, test_case &tc) {
    if (!j.is_object())
        throw invalid_argument("test case must be a JSON object, got " + j.dump());
    tc.input = j.value("input", nlohmann::json());
    tc.expected = j.value("expected", nlohmann::json());
    nlohmann::assign_optional(j, tc.target_function, "function");
    nlohmann::assign_optional(j, tc.unpack_input, "unpack");
}

void to_json(nlohmann::json &j, const test_case &tc) {
    j = {{"input", tc.input},
         {"expected", tc.expected},
         {"function", tc.target_function},
         {"unpack", tc.unpack_input}};
}

execution_request parse_request(const nlohmann::json &j) {
    if (!j.is_object())
        throw invalid_request("request must be a JSON object");

    execution_request request;
    try {
        // 兼容两种字段名，code 是评测接口原有的写法
        if (nlohmann::exists(j, "code"))
            request.source_code = nlohmann::get_value<string>(j, "code");
        else
            nlohmann::assign_optional(j, request.source_code, "source_code");

        if (nlohmann::exists(j, "test_cases")) {
            const auto &cases = nlohmann::access(j, "test_cases");
            if (!cases.is_array())
                throw invalid_argument("test_cases must be an array");
            for (auto &item : cases)
                request.test_cases.push_back(item.get<test_case>());
        }
    } catch (invalid_argument &ex) {
        throw invalid_request(ex.what());
    }
    return request;
}

}  // namespace grader
