#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 一个测试数据点
 * 评测时调用选手代码中的函数，将返回值与期望值进行结构比较（Python 的 ==）
 */
struct test_case {
    /**
     * @brief 传给函数的参数，可以是任意 JSON 值
     */
    nlohmann::json input;

    /**
     * @brief 期望的返回值
     */
    nlohmann::json expected;

    /**
     * @brief 要调用的函数名
     * 如果选手代码中没有这个名字，将按照 function_resolver 的规则猜测入口函数
     */
    std::string target_function = "solution";

    /**
     * @brief 若为真且 input 是数组，则将数组展开为多个位置参数
     */
    bool unpack_input = false;
};

/**
 * @brief 一次评测请求：选手代码及所有的测试数据点
 * 代码不能为空（或只有空白字符），测试数据不能为空，否则请求会在分配任何执行资源之前被拒绝
 */
struct execution_request {
    std::string source_code;

    std::vector<test_case> test_cases;
};

/**
 * @brief 解析测试数据点
 * @code{.json}
 * {"input": [1, 2], "expected": 3, "function": "add", "unpack": true}
 * @endcode
 * function 缺省为 solution，unpack 缺省为 false
 */
void from_json(const nlohmann::json &j, test_case &tc);

void to_json(nlohmann::json &j, const test_case &tc);

/**
 * @brief 解析评测请求
 * @code{.json}
 * {"code": "def solution(n):\n    return n * 2", "test_cases": [{"input": 2, "expected": 4}]}
 * @endcode
 * 只检查字段类型，代码和测试数据是否为空由 grading_service 检查
 * @throw invalid_request 若请求格式不正确
 */
execution_request parse_request(const nlohmann::json &j);

}  // namespace grader
