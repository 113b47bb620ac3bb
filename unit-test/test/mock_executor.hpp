#pragma once

#include <string>
#include "gmock/gmock.h"
#include "grading/executor.hpp"

namespace grader {

/**
 * @brief 用于测试 grading_service 的执行器
 */
class mock_executor : public executor {
public:
    explicit mock_executor(bool isolated = true) : is_isolated(isolated) {}

    std::string name() const override {
        return is_isolated ? "mock-isolated" : "mock-fallback";
    }

    bool isolated() const override {
        return is_isolated;
    }

    MOCK_METHOD(execution_output, execute, (const execution_request &, const compiled_harness &, const cancellation_token &), (const, override));

private:
    bool is_isolated;
};

}  // namespace grader
