#pragma once

#include <filesystem>
#include <istream>
#include <string>

namespace grader {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw std::system_error 若文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取流中剩余的全部内容，比如 std::cin
 */
std::string read_stream_content(std::istream &in);

/**
 * @brief 检查字符串是否是合法的 UTF-8 编码
 * 选手代码会被原样嵌入评测程序中，非法的编码会导致评测程序本身无法解析
 */
bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 检查字符串是否只包含空白字符
 */
bool is_blank(const std::string &string);

}  // namespace grader
