#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace grader {

/**
 * @brief 超时后向评测线程抛出 TimeoutError
 *
 * 只有在评测线程处于 guard 作用域内（正在执行选手代码）时才会抛出异常，
 * 因此最后一个数据点完成之后、disarm 之前到期不会被误判为超时。
 * 抛出之后每隔一段时间重复一次，以防选手代码捕获了 TimeoutError。
 *
 * 时限是墙上时间，从构造时开始计算。
 * 必须在持有 GIL 的评测线程中构造、析构以及调用其他成员函数。
 */
class python_watchdog {
public:
    explicit python_watchdog(std::chrono::milliseconds timeout);

    ~python_watchdog();

    python_watchdog(const python_watchdog &) = delete;
    python_watchdog &operator=(const python_watchdog &) = delete;

    /**
     * @brief 标记评测线程正在执行选手代码，作用域结束时取消标记
     */
    class guard {
    public:
        explicit guard(python_watchdog &watchdog);
        ~guard();

        guard(const guard &) = delete;
        guard &operator=(const guard &) = delete;

    private:
        python_watchdog &watchdog;
    };

    /**
     * @brief 停止看门狗，并清除尚未被处理的 TimeoutError
     * 调用方持有 GIL，因此与看门狗线程中抛出异常的操作互斥
     */
    void disarm();

    /**
     * @brief 是否已经向评测线程抛出过 TimeoutError
     */
    bool expired() const;

    /**
     * @brief 是否已经超过时限，无论是否抛出过异常
     */
    bool overdue() const;

private:
    void run();

    bool is_finished();

    unsigned long thread_id;
    std::chrono::steady_clock::time_point deadline;
    std::mutex mut;
    std::condition_variable cond;
    bool finished = false;
    std::atomic<bool> guarded{false};
    std::atomic<bool> fired{false};
    std::thread worker;
};

}  // namespace grader
