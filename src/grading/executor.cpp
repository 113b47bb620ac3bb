#include "grading/executor.hpp"

namespace grader {

void cancellation_token::cancel() noexcept {
    flag = true;
}

bool cancellation_token::cancelled() const noexcept {
    return flag;
}

}  // namespace grader
