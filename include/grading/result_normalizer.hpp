#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "grading/executor.hpp"
#include "grading/result.hpp"

namespace grader {

/**
 * @brief 将执行器的原始输出转换为对外的结果格式
 *
 * 按以下顺序处理：
 * 1. 执行器层面的失败（超时、后端缺失等）：错误结果，通过数为 0，保留数据点总数；
 * 2. 降级执行器的记录：复制各个字段，附上执行时间；
 * 3. stdout 被截断：运行时错误，截断的输出中不可能有完整的记录；
 * 4. stdout 中令牌匹配的记录：同 2；
 * 5. stdout 中有记录但令牌不匹配：运行时错误，记录是选手代码伪造的；
 * 6. 返回值非零但没有记录：运行时错误，附上 stderr；
 * 7. stdout 无法解析但非空：宽松地认为成功，原样附上输出，不包含逐个数据点的结果；
 * 8. 什么都没有：未知错误。
 *
 * 内存使用只有隔离执行时才保留。
 *
 * @param output 执行器的原始输出
 * @param tests_total 请求中的测试数据点个数
 * @param token 评测程序的令牌，见 compiled_harness::token
 */
execution_result normalize_result(const execution_output &output, size_t tests_total, const std::string &token);

/**
 * @brief 生成错误结果
 */
execution_result make_error_result(error_kind kind, const std::string &message, size_t tests_total, bool isolated);

/**
 * @brief 从评测程序的 stdout 中找到记录
 * 评测程序只输出一行记录，但容器运行时可能在前面打印警告，因此从最后一行非空行开始向前查找
 * @param token 记录的 token 字段必须与之相同，其他记录被忽略
 * @return 第一个可以解析为 JSON 对象、包含 status 字段且令牌匹配的行，令牌字段会被移除
 */
std::optional<nlohmann::json> parse_summary_record(const std::string &out, const std::string &token);

}  // namespace grader
