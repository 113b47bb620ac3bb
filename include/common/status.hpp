#pragma once

#include <string>

namespace grader {

/**
 * @brief 表示整个评测请求的结果
 */
enum class grade_status {
    /**
     * @brief 所有测试数据点均通过
     * 对于无法解析的执行输出，也会宽松地返回 SUCCESS，但不包含逐个数据点的结果
     */
    SUCCESS = 0,

    /**
     * @brief 选手代码成功加载，但有数据点没有通过
     */
    PARTIAL = 1,

    /**
     * @brief 提交无法被完整评测，具体原因见 error_kind
     */
    ERROR = 2
};

/**
 * @brief 表示单个测试数据点的结果
 */
enum class outcome_status {
    PASSED = 0,

    /**
     * @brief 函数正常返回，但返回值和期望值不相等
     */
    FAILED = 1,

    /**
     * @brief 调用函数时抛出了异常，或者找不到要调用的函数
     */
    ERRORED = 2
};

/**
 * @brief 评测失败的原因
 * 只有 COMPILATION 和 RUNTIME 可以归咎于选手代码本身
 */
enum class error_kind {
    /**
     * @brief 请求不合法（代码为空、没有测试数据），没有执行任何代码
     */
    VALIDATION = 0,

    /**
     * @brief 选手代码无法加载（语法错误或者模块级代码抛出异常），没有运行任何数据点
     */
    COMPILATION = 1,

    /**
     * @brief 选手代码加载成功，但是执行进程非正常退出
     */
    RUNTIME = 2,

    /**
     * @brief 超出时钟时间限制
     */
    TIMEOUT = 3,

    /**
     * @brief 隔离后端配置错误或缺失（比如镜像不存在），需要运维处理
     */
    SYSTEM = 4,

    /**
     * @brief 无法分类的错误
     */
    UNKNOWN = 5
};

/**
 * @brief 序列化时使用的名称，如 "success"、"partial"、"error"
 */
const char *to_string(grade_status);

/**
 * @brief 序列化时使用的名称，如 "passed"、"failed"、"error"
 */
const char *to_string(outcome_status);

/**
 * @brief 序列化时使用的名称，如 "compilation"、"timeout"
 */
const char *to_string(error_kind);

/**
 * @brief 从序列化名称解析，名称不合法时抛出 std::invalid_argument
 */
grade_status parse_grade_status(const std::string &name);

outcome_status parse_outcome_status(const std::string &name);

error_kind parse_error_kind(const std::string &name);

/**
 * @brief 给人看的错误描述
 */
const char *get_display_message(error_kind);

}  // namespace grader
