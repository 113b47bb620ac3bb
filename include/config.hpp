#pragma once

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace grader {

/**
 * @brief 评测引擎的配置
 * 默认值可以直接使用，main 函数会依次从配置文件、环境变量和命令行参数中覆盖。
 * 配置在启动时确定，之后只读，所有评测请求共享同一份配置。
 */
struct grader_config {
    /**
     * @brief docker 命令行客户端的路径，会通过 PATH 查找
     */
    std::string docker = "docker";

    /**
     * @brief 运行评测程序的镜像，必须事先拉取好，评测时不会自动拉取
     */
    std::string image = "python:3.9-alpine";

    /**
     * @brief 镜像内的 Python 解释器
     */
    std::string python = "python3";

    /**
     * @brief 容器内运行评测程序的用户，默认为 nobody
     */
    std::string run_user = "65534:65534";

    /**
     * @brief 容器内存限制，单位为 MB，内存和 swap 使用同一个限制
     */
    int memory_limit = 128;

    /**
     * @brief 容器可以使用的 CPU 核心数，可以是小数
     */
    double cpu_limit = 0.5;

    /**
     * @brief 容器内最多的进程数，防止 fork 炸弹
     */
    int pids_limit = 64;

    /**
     * @brief 容器内 /tmp 的大小，单位为 MB
     */
    int tmpfs_size = 16;

    /**
     * @brief 隔离执行的时钟时间限制，包括容器启动时间
     */
    std::chrono::milliseconds timeout{10000};

    /**
     * @brief 降级执行时的协作式超时
     */
    std::chrono::milliseconds fallback_timeout{5000};

    /**
     * @brief 启动时探测 docker 是否可用的超时
     */
    std::chrono::milliseconds probe_timeout{5000};

    /**
     * @brief stdout、stderr 各自最多保留的字节数
     */
    size_t output_limit = 1 << 20;

    /**
     * @brief 异步评测的 worker 数量
     */
    size_t workers = 4;

    /**
     * @brief 以此前缀开头的名字被视为私有，不参与入口函数的猜测
     */
    std::string private_prefix = "_";

    /**
     * @brief 测试数据没有指定函数名时调用的函数
     */
    std::string default_function = "solution";

    /**
     * @brief 跳过 docker 探测，直接使用降级执行器
     */
    bool force_fallback = false;
};

/**
 * @brief 从 JSON 读取配置，缺少的字段保留原值
 * 时间相关的字段单位为秒，可以是小数，比如：
 * @code{.json}
 * {
 *     "image": "python:3.11-alpine",
 *     "memory_limit": 256,
 *     "cpu_limit": 1,
 *     "timeout": 5,
 *     "fallback_timeout": 2.5
 * }
 * @endcode
 * @throw std::invalid_argument 若字段类型不正确或者数值不合法
 */
void from_json(const nlohmann::json &j, grader_config &config);

void to_json(nlohmann::json &j, const grader_config &config);

/**
 * @brief 读取配置文件
 * @param path 配置文件路径，内容为 JSON
 * @param config 在此配置的基础上覆盖
 */
grader_config load_config(const std::filesystem::path &path, grader_config config = {});

/**
 * @brief 将秒数转换为毫秒，秒数必须为正
 */
std::chrono::milliseconds seconds_to_duration(double seconds);

}  // namespace grader
