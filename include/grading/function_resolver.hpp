#pragma once

#include <optional>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 选手代码加载后命名空间中的一个名字
 * 按照定义的先后顺序排列（Python 的字典保持插入顺序）
 */
struct function_symbol {
    std::string name;

    /**
     * @brief 是否可以调用（函数、类、实现了 __call__ 的对象）
     */
    bool callable = false;
};

/**
 * @brief 决定调用选手代码中的哪个函数
 * 评测程序在容器中运行，无法回调宿主进程，因此策略需要同时提供
 * C++ 实现（供降级执行器使用）和等价的 Python 实现（嵌入评测程序中）。
 */
class function_resolver {
public:
    virtual ~function_resolver() = default;

    /**
     * @brief 根据测试数据指定的函数名和命名空间中的名字决定要调用的函数
     * @param target 测试数据指定的函数名
     * @param symbols 加载选手代码后命名空间中的名字，按定义顺序排列
     * @return 要调用的函数名，找不到时返回 nullopt
     */
    virtual std::optional<std::string> resolve(const std::string &target, const std::vector<function_symbol> &symbols) const = 0;

    /**
     * @brief 等价的 Python 实现
     * 必须定义函数 _judge_resolve(target, namespace)，返回函数名或者 None
     */
    virtual std::string python_source() const = 0;
};

/**
 * @brief 默认的函数查找策略
 * 优先使用指定的函数名；若不存在，则使用最后定义的、名字不以私有前缀开头的可调用对象。
 * 这只是一个尽力而为的猜测：选手把辅助函数定义在主函数之后时会猜错。
 */
class last_public_callable_resolver : public function_resolver {
public:
    explicit last_public_callable_resolver(std::string private_prefix = "_");

    std::optional<std::string> resolve(const std::string &target, const std::vector<function_symbol> &symbols) const override;

    std::string python_source() const override;

private:
    std::string private_prefix;
};

}  // namespace grader
