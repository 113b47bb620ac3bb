#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"

namespace grader {

/**
 * @brief 单个测试数据点的评测结果
 */
struct test_outcome {
    /**
     * @brief 数据点编号，从 1 开始
     */
    size_t index = 0;

    outcome_status status = outcome_status::PASSED;

    /**
     * @brief 期望值，仅在 FAILED 时存在
     */
    std::optional<nlohmann::json> expected;

    /**
     * @brief 函数的实际返回值，仅在 FAILED 时存在
     * 无法序列化为 JSON 的返回值以 repr 字符串表示
     */
    std::optional<nlohmann::json> actual;

    /**
     * @brief 异常信息，仅在 ERRORED 时存在
     */
    std::string message;

    std::string traceback;
};

/**
 * @brief 整个评测请求的结果
 * 这是评测引擎对外唯一的结果格式，隔离执行和降级执行产生的结果形状相同
 */
struct execution_result {
    grade_status status = grade_status::ERROR;

    size_t tests_passed = 0;

    /**
     * @brief 测试数据点总数，总是等于请求中的测试数据点个数
     */
    size_t tests_total = 0;

    /**
     * @brief 逐个数据点的结果，编译错误或执行失败时为空
     */
    std::vector<test_outcome> outcomes;

    /**
     * @brief 执行耗时，包括容器启动时间
     */
    double execution_time_ms = 0;

    /**
     * @brief 评测程序的峰值内存，单位为 MB，只有隔离执行时才有
     */
    std::optional<double> memory_usage_mb;

    /**
     * @brief status 为 ERROR 时的错误原因
     */
    std::optional<error_kind> error;

    std::string message;

    std::string traceback;

    /**
     * @brief 无法解析的执行输出，只有宽松的 SUCCESS 结果会设置
     */
    std::string output;

    /**
     * @brief 选手代码是否在隔离环境中执行
     */
    bool isolated = false;

    /**
     * @brief 是否通过了所有数据点
     */
    bool is_passed() const;
};

/**
 * @brief 序列化为对外的结果格式
 * @code{.json}
 * {
 *     "status": "partial",
 *     "tests_passed": 1,
 *     "tests_total": 2,
 *     "results": [
 *         {"test": 1, "status": "passed"},
 *         {"test": 2, "status": "failed", "expected": 5, "got": 6}
 *     ],
 *     "execution_time_ms": 812.4,
 *     "memory_usage_mb": 9.3,
 *     "isolated": true
 * }
 * @endcode
 */
void to_json(nlohmann::json &j, const execution_result &result);

void to_json(nlohmann::json &j, const test_outcome &outcome);

/**
 * @brief 从评测程序输出的记录中解析单个数据点的结果
 * @param index 数据点编号，记录中没有 test 字段时使用
 * @throw std::invalid_argument 若记录格式不正确
 */
test_outcome parse_test_outcome(const nlohmann::json &j, size_t index);

}  // namespace grader
