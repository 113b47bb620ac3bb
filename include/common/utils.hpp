#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 调用外部程序时的限制
 */
struct process_options {
    /**
     * @brief 时钟时间限制，为 0 时不限制
     */
    std::chrono::milliseconds timeout{0};

    /**
     * @brief stdout 和 stderr 各自最多保留的字节数
     * 超出的部分仍然会被读出（避免子进程阻塞在写管道上），但会被丢弃
     */
    size_t output_limit = 1 << 20;

    /**
     * @brief 轮询期间若返回真，则终止子进程
     * 用于调用方已经不再关心结果的情况
     */
    std::function<bool()> should_stop;

    /**
     * @brief 超时或者被取消时，在杀死子进程之前调用
     * 子进程可能只是一个客户端（比如 docker run），真正需要销毁的资源在别处
     */
    std::function<void()> on_abort;
};

struct process_result {
    /**
     * @brief 子进程的返回值，如果子进程因为信号而结束，则为 -1
     */
    int exitcode = -1;

    /**
     * @brief 导致子进程结束的信号，正常退出时为 -1
     */
    int signal = -1;

    /**
     * @brief execvp 失败时的 errno，为 0 表示程序成功启动
     */
    int exec_errno = 0;

    bool timed_out = false;

    bool cancelled = false;

    bool stdout_truncated = false;

    bool stderr_truncated = false;

    std::string out;

    std::string err;

    /**
     * @brief 时钟时间，单位为毫秒
     */
    double wall_time = 0;
};

/**
 * @brief 执行外部命令，将 input 写入 stdin，并捕获 stdout 和 stderr
 * @note 与 system(cmd) 的区别是，这个函数不经过 shell，避免了转义导致的安全问题
 * @param argv 外部命令的路径 (argv[0]) 和参数
 * @param input 写入子进程 stdin 的内容，写完后关闭 stdin
 * @param options 时间限制、输出限制和取消条件
 * @return 子进程的运行信息
 * @throw std::system_error 若 pipe、fork 或 poll 失败
 *
 * 子进程运行在独立的进程组中，超时或取消时整个进程组都会被 SIGKILL。
 */
process_result run_process(const std::vector<std::string> &argv, const std::string &input, const process_options &options);

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 设置环境变量
 * @param key 环境变量的键
 * @param value 环境变量的值
 * @param replace 若为真，则覆盖已有的环境变量值
 */
void set_env(const std::string &key, const std::string &value, bool replace = true);

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    /**
     * @brief 经过的时间，单位为毫秒，保留小数部分
     */
    double milliseconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace grader
