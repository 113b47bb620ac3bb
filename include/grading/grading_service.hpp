#pragma once

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <vector>
#include "config.hpp"
#include "grading/executor.hpp"
#include "grading/function_resolver.hpp"
#include "grading/result.hpp"
#include "grading/submission.hpp"
#include "worker.hpp"

namespace grader {

/**
 * @brief 一次评测经历的状态
 * IDLE -> VALIDATING -> REJECTED
 * IDLE -> VALIDATING -> COMPILING -> EXECUTING -> NORMALIZING -> DONE
 */
enum class grading_state {
    IDLE,
    VALIDATING,
    REJECTED,
    COMPILING,
    EXECUTING,
    NORMALIZING,
    DONE
};

const char *to_string(grading_state);

/**
 * @brief 异步评测的凭据
 */
struct grading_ticket {
    std::shared_future<execution_result> result;

    std::shared_ptr<cancellation_token> token;

    /**
     * @brief 取消评测
     * 隔离执行时会立即销毁容器；降级执行时在当前数据点结束后停止
     */
    void cancel() const;
};

/**
 * @brief 评测引擎的唯一入口
 *
 * 校验请求，生成评测程序，根据启动时探测到的隔离后端可用性选择执行器，
 * 最后将执行器的输出转换为统一的结果格式。
 * 评测是无状态的，grade 可以被并发调用。
 */
class grading_service {
public:
    using state_listener = std::function<void(grading_state)>;

    /**
     * @param config 评测配置
     * @param isolation_available 隔离后端是否可用，在启动时探测一次
     * @param isolated_executor 隔离执行器
     * @param fallback_executor 隔离后端不可用时使用的执行器
     * @param resolver 入口函数查找策略
     */
    grading_service(grader_config config,
                    bool isolation_available,
                    std::unique_ptr<executor> isolated_executor,
                    std::unique_ptr<executor> fallback_executor,
                    std::shared_ptr<const function_resolver> resolver);

    ~grading_service();

    /**
     * @brief 评测选手代码
     * @return 评测结果，不会为空
     */
    execution_result grade(const std::string &source_code, const std::vector<test_case> &test_cases) const;

    execution_result grade(const execution_request &request, const cancellation_token &token) const;

    /**
     * @brief 在 worker 线程池中评测，线程池在第一次调用时创建
     */
    grading_ticket grade_async(execution_request request) const;

    bool is_isolation_available() const;

    /**
     * @brief 注册状态监听器，用于观察评测的状态变化，必须在开始评测之前注册
     */
    void set_state_listener(state_listener listener);

private:
    grader_config config;
    bool isolation_available;
    std::unique_ptr<executor> isolated_executor;
    std::unique_ptr<executor> fallback_executor;
    std::shared_ptr<const function_resolver> resolver;
    state_listener listener;

    mutable std::once_flag pool_flag;
    mutable std::unique_ptr<worker_pool> pool;

    void transit(grading_state state) const;

    /**
     * @brief 检查请求是否合法
     * @return 不合法的原因，合法时返回空串
     */
    std::string validate(const execution_request &request) const;
};

/**
 * @brief 根据配置创建评测服务
 * 除非配置了 force_fallback，否则会探测 docker 是否可用
 */
std::unique_ptr<grading_service> make_grading_service(const grader_config &config);

}  // namespace grader
