#pragma once

#include <optional>
#include <string>
#include <vector>
#include "common/utils.hpp"
#include "config.hpp"
#include "grading/executor.hpp"

namespace grader {

/**
 * @brief 在一次性的 docker 容器中运行评测程序
 *
 * 评测程序通过 stdin 传给容器内的 python3 -，容器：
 * 1. 没有网络；
 * 2. 限制内存（swap 与内存使用相同的限制，即不允许使用 swap）、CPU 和进程数；
 * 3. 去掉所有 capabilities，禁止提权，以非特权用户运行，根文件系统只读；
 * 4. 使用 --rm 启动，超时、取消或者异常时还会主动 docker kill 与 docker rm -f。
 *
 * 镜像必须事先拉取好，评测时不会访问镜像仓库。
 */
class docker_executor : public executor {
public:
    explicit docker_executor(grader_config config);

    std::string name() const override;

    bool isolated() const override;

    execution_output execute(const execution_request &request, const compiled_harness &harness, const cancellation_token &token) const override;

    /**
     * @brief 生成 docker run 的命令行
     * @param container 容器名，用于超时后销毁容器
     */
    std::vector<std::string> build_command(const std::string &container) const;

private:
    grader_config config;

    void kill_container(const std::string &container) const;

    void remove_container(const std::string &container) const;
};

/**
 * @brief 根据 docker 客户端的退出情况判断是否是执行器层面的失败
 * @return 失败原因及说明；若不是执行器层面的失败（比如选手代码的运行时错误），返回 nullopt
 *
 * docker run 的返回值约定：
 * 125 表示 docker 守护进程本身出错（比如镜像不存在），
 * 126 表示容器内的命令无法执行，127 表示容器内的命令不存在，
 * 其他返回值为容器内进程的返回值，137 即进程被 SIGKILL（一般是超出了内存限制）。
 * 选手代码也可以用这些值退出，因此只有 stdout 中没有 HARNESS_STARTED_LINE 时，
 * 125、126、127 才被认为是 docker 的错误。
 */
std::optional<std::pair<error_kind, std::string>> classify_docker_failure(const process_result &result, const grader_config &config);

/**
 * @brief 探测 docker 是否可用
 * 在启动时调用一次，结果作为路由的依据注入 grading_service
 */
bool probe_docker(const grader_config &config);

}  // namespace grader
