#pragma once

#include <functional>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"

/**
 * 异步评测使用的 worker 线程池
 * 评测请求被包装成任务放入 task_queue，每个 worker 不断从队列中取出任务执行。
 * 评测本身是无状态的，worker 之间不共享任何与请求相关的数据。
 */
namespace grader {

class worker_pool {
public:
    /**
     * @brief 启动 worker 线程
     * @param size worker 数量，至少为 1
     */
    explicit worker_pool(size_t size);

    /**
     * @brief 停止接受新任务，等待队列中的任务执行完毕后回收所有线程
     */
    ~worker_pool();

    worker_pool(const worker_pool &) = delete;
    worker_pool &operator=(const worker_pool &) = delete;

    /**
     * @brief 提交一个任务
     * 任务抛出的异常会被记录到日志中，不会导致 worker 退出
     * @return false 若线程池已经停止
     */
    bool submit(std::function<void()> task);

    /**
     * @brief 停止接受新任务
     * 调用该函数后 worker 会继续执行队列中剩余的任务，然后退出
     */
    void stop();

    size_t size() const;

private:
    concurrent_queue<std::function<void()>> task_queue;
    std::vector<std::thread> workers;
};

}  // namespace grader
