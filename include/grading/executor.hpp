#pragma once

#include <atomic>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "common/status.hpp"
#include "grading/harness.hpp"
#include "grading/submission.hpp"

namespace grader {

/**
 * @brief 取消一次评测
 * 可以在任意线程中调用 cancel，执行器会在下一次轮询时终止执行
 */
class cancellation_token {
public:
    void cancel() noexcept;

    bool cancelled() const noexcept;

private:
    std::atomic<bool> flag{false};
};

/**
 * @brief 执行器的原始输出，由 result_normalizer 转换为 execution_result
 */
struct execution_output {
    /**
     * @brief 选手代码是否在隔离环境中执行
     */
    bool isolated = false;

    /**
     * @brief 执行耗时，单位为毫秒
     */
    double elapsed_ms = 0;

    /**
     * @brief 降级执行器直接生成的记录，格式与评测程序输出的记录相同
     */
    std::optional<nlohmann::json> report;

    /**
     * @brief 评测程序的 stdout
     */
    std::string out;

    /**
     * @brief 评测程序的 stderr，包含选手代码的 print 输出
     */
    std::string err;

    /**
     * @brief stdout 是否超出了 output_limit 而被截断
     */
    bool stdout_truncated = false;

    int exitcode = 0;

    /**
     * @brief 执行器层面的失败（超时、后端缺失等），此时其他字段可能不完整
     */
    std::optional<error_kind> failure;

    std::string failure_message;
};

/**
 * @brief 执行器：负责运行选手代码
 * 执行器本身不保存与请求相关的状态，execute 可以被并发调用
 */
class executor {
public:
    virtual ~executor() = default;

    /**
     * @brief 执行器名称，用于日志
     */
    virtual std::string name() const = 0;

    /**
     * @brief 此执行器是否提供隔离
     */
    virtual bool isolated() const = 0;

    /**
     * @brief 执行一次评测
     * @param request 评测请求
     * @param harness 由 request 生成的评测程序
     * @param token 取消标记
     */
    virtual execution_output execute(const execution_request &request, const compiled_harness &harness, const cancellation_token &token) const = 0;
};

}  // namespace grader
