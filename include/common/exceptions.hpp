#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace grader {

struct grader_exception : std::exception {
    grader_exception();
    explicit grader_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const grader_exception &ex);

    template <typename T>
    grader_exception operator<<(const T &t) const {
        return grader_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测引擎的内部错误
 * 一般是嵌入的 Python 解释器或者宿主环境本身的问题，与选手代码无关
 */
struct internal_error : public grader_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示评测请求的格式不正确
 * 比如请求 JSON 缺少 code 字段，或者测试数据的类型不对
 */
struct invalid_request : public grader_exception {
    invalid_request();
    explicit invalid_request(const std::string &message);
};

}  // namespace grader
