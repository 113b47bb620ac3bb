#pragma once

#include <map>
#include <string>
#include "grading/function_resolver.hpp"
#include "grading/submission.hpp"

namespace grader {

/**
 * @brief 评测结果中单个值（got、message、traceback）的最大长度
 * 超出的部分被截断并加上 "...<truncated>"，使得汇总记录的大小只与测试数据点个数有关
 */
const size_t VALUE_DISPLAY_LIMIT = 4096;

/**
 * @brief 评测程序在运行选手代码之前输出的第一行
 * stdout 中没有这一行说明评测程序根本没有启动（镜像或解释器缺失等）
 */
constexpr const char *HARNESS_STARTED_LINE = "#grader-started";

/**
 * @brief 去掉 stdout 开头的 HARNESS_STARTED_LINE
 */
std::string strip_started_line(const std::string &out);

/**
 * @brief 生成好的评测程序
 * 评测程序是一个自包含的 Python 脚本，不需要任何输入，运行结束时向 stdout
 * 输出恰好一行 JSON 记录，只有在选手代码无法加载时才以非零返回值退出。
 */
struct compiled_harness {
    std::string program;

    size_t tests_total = 0;

    /**
     * @brief 本次评测的随机令牌
     * 评测程序输出的汇总记录带有 "token" 字段，只有令牌相同的记录才会被采信。
     * 令牌保存在闭包中，选手代码无法通过全局变量直接读到它。
     */
    std::string token;
};

/**
 * @brief 将文本截断到 limit 字节以内（按 UTF-8 字符边界），被截断时追加 "...<truncated>"
 */
std::string clip_text(const std::string &text, size_t limit = VALUE_DISPLAY_LIMIT);

/**
 * @brief 将任意字节串转义为可以放进 Python 三引号字符串 """...""" 的内容
 * 所有的双引号都会被转义，因此内容中的 """ 不会提前结束字符串。
 * 反斜杠、回车、NUL 以及其他控制字符也会被转义，换行和制表符保持原样，
 * 非 ASCII 字节原样保留（评测程序本身以 UTF-8 编码）。
 */
std::string escape_python_string(const std::string &value);

/**
 * @brief 替换模板中形如 @NAME@ 的占位符
 * 只扫描一遍模板，替换进去的内容不会被再次展开；未知的占位符原样保留。
 */
std::string render_template(const std::string &tmpl, const std::map<std::string, std::string> &values);

/**
 * @brief 生成评测程序
 * @param request 评测请求，每个测试数据点的函数名必须已经确定
 * @param resolver 入口函数查找策略，其 Python 实现会被嵌入评测程序
 */
compiled_harness compile_harness(const execution_request &request, const function_resolver &resolver);

}  // namespace grader
