#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include "config.hpp"
#include "grading/executor.hpp"
#include "grading/function_resolver.hpp"

namespace grader {

/**
 * @brief 单个数据点正常返回时的结果
 */
struct test_value {
    /**
     * @brief 返回值是否与期望值相等
     */
    bool equal = false;

    /**
     * @brief 返回值，仅在不相等时记录
     */
    nlohmann::json actual;
};

/**
 * @brief 单个数据点抛出异常时的结果
 */
struct execution_error {
    std::string message;

    std::string traceback;
};

using test_result = std::variant<test_value, execution_error>;

/**
 * @brief 在宿主进程内嵌入的 Python 解释器中运行选手代码
 *
 * 在 docker 不可用时使用，执行流程与评测程序完全相同：在新的命名空间中加载选手代码，
 * 用同样的策略查找函数，逐个运行数据点，生成与评测程序格式相同的记录。
 *
 * 这个执行器没有任何隔离，结果总是标记为 isolated = false，也不报告内存使用。
 * 超时是协作式的：看门狗线程在超时后不断向评测线程抛出 TimeoutError，
 * 只有当评测线程回到 Python 字节码时才能生效，阻塞在 C 函数中的代码无法被打断。
 * 时限是墙上时间，从取得解释器之后开始计算。所有降级评测共用一个解释器，
 * 因此同一时刻只运行一个，其余的排队等待，排队的时间不计入时限。
 * 取消只在数据点之间生效。
 *
 * 使用前必须已经创建 python_interpreter。
 */
class fallback_executor : public executor {
public:
    fallback_executor(grader_config config, std::shared_ptr<const function_resolver> resolver);

    std::string name() const override;

    bool isolated() const override;

    /**
     * @throw internal_error 若 Python 解释器没有初始化
     */
    execution_output execute(const execution_request &request, const compiled_harness &harness, const cancellation_token &token) const override;

private:
    grader_config config;
    std::shared_ptr<const function_resolver> resolver;
};

}  // namespace grader
