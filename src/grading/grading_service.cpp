#include "grading/grading_service.hpp"
#include <glog/logging.h>
#include "common/io_utils.hpp"
#include "grading/docker_executor.hpp"
#include "grading/fallback_executor.hpp"
#include "grading/harness.hpp"
#include "grading/result_normalizer.hpp"

namespace grader {
using namespace std;

const char *to_string(grading_state state) {
    switch (state) {
        case grading_state::IDLE: return "idle";
        case grading_state::VALIDATING: return "validating";
        case grading_state::REJECTED: return "rejected";
        case grading_state::COMPILING: return "compiling";
        case grading_state::EXECUTING: return "executing";
        case grading_state::NORMALIZING: return "normalizing";
        case grading_state::DONE: return "done";
    }
    return "unknown";
}

void grading_ticket::cancel() const {
    if (token) token->cancel();
}

grading_service::grading_service(grader_config config,
                                 bool isolation_available,
                                 unique_ptr<executor> isolated_executor,
                                 unique_ptr<executor> fallback_executor,
                                 shared_ptr<const function_resolver> resolver)
    : config(move(config)),
      isolation_available(isolation_available),
      isolated_executor(move(isolated_executor)),
      fallback_executor(move(fallback_executor)),
      resolver(move(resolver)) {
    if (!this->fallback_executor || !this->resolver)
        throw invalid_argument("grading service requires a fallback executor and a function resolver");
    if (this->isolation_available && !this->isolated_executor)
        throw invalid_argument("isolation is available but no isolated executor is given");
}

grading_service::~grading_service() = default;

void grading_service::transit(grading_state state) const {
    DLOG(INFO) << "Grading state: " << to_string(state);
    if (listener) listener(state);
}

void grading_service::set_state_listener(state_listener listener) {
    this->listener = move(listener);
}

bool grading_service::is_isolation_available() const {
    return isolation_available;
}

string grading_service::validate(const execution_request &request) const {
    if (request.source_code.empty() || is_blank(request.source_code))
        return "No code provided";
    if (request.test_cases.empty())
        return "No test cases provided";
    if (!utf8_check_is_valid(request.source_code))
        return "Code is not valid UTF-8";
    return "";
}

execution_result grading_service::grade(const string &source_code, const vector<test_case> &test_cases) const {
    cancellation_token token;
    return grade(execution_request{source_code, test_cases}, token);
}

execution_result grading_service::grade(const execution_request &request, const cancellation_token &token) const {
    size_t tests_total = request.test_cases.size();

    transit(grading_state::VALIDATING);
    string reason = validate(request);
    if (!reason.empty()) {
        LOG(INFO) << "Rejected grading request: " << reason;
        transit(grading_state::REJECTED);
        return make_error_result(error_kind::VALIDATION, reason, tests_total, isolation_available);
    }

    const executor &exec = isolation_available ? *isolated_executor : *fallback_executor;

    execution_output output;
    string record_token;
    try {
        transit(grading_state::COMPILING);
        execution_request normalized = request;
        for (auto &tc : normalized.test_cases)
            if (tc.target_function.empty()) tc.target_function = config.default_function;
        compiled_harness harness = compile_harness(normalized, *resolver);
        record_token = harness.token;

        transit(grading_state::EXECUTING);
        output = exec.execute(normalized, harness, token);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Executor " << exec.name() << " failed: " << ex.what();
        output = execution_output();
        output.failure = error_kind::UNKNOWN;
        output.failure_message = ex.what();
    }

    transit(grading_state::NORMALIZING);
    execution_result result = normalize_result(output, tests_total, record_token);
    result.isolated = exec.isolated();
    if (!result.isolated) result.memory_usage_mb.reset();

    LOG(INFO) << "Graded submission with " << exec.name() << ": " << to_string(result.status)
              << " (" << result.tests_passed << "/" << result.tests_total << ") in " << result.execution_time_ms << "ms";
    transit(grading_state::DONE);
    return result;
}

grading_ticket grading_service::grade_async(execution_request request) const {
    call_once(pool_flag, [this] { pool = make_unique<worker_pool>(config.workers); });

    grading_ticket ticket;
    ticket.token = make_shared<cancellation_token>();
    auto promise = make_shared<std::promise<execution_result>>();
    ticket.result = promise->get_future().share();

    size_t tests_total = request.test_cases.size();
    bool submitted = pool->submit([this, promise, token = ticket.token, request = move(request)] {
        try {
            promise->set_value(grade(request, *token));
        } catch (std::exception &ex) {
            LOG(ERROR) << "Asynchronous grading failed: " << ex.what();
            promise->set_value(make_error_result(error_kind::UNKNOWN, ex.what(), request.test_cases.size(), isolation_available));
        }
    });
    if (!submitted)
        promise->set_value(make_error_result(error_kind::UNKNOWN, "Grading service is shutting down", tests_total, isolation_available));
    return ticket;
}

unique_ptr<grading_service> make_grading_service(const grader_config &config) {
    auto resolver = make_shared<last_public_callable_resolver>(config.private_prefix);

    bool available = false;
    if (config.force_fallback)
        LOG(INFO) << "Isolation backend is disabled by configuration";
    else
        available = probe_docker(config);

    if (available)
        LOG(INFO) << "Submissions will be executed in docker image " << config.image;
    else
        LOG(WARNING) << "Isolation backend is unavailable, submissions will be executed in the host process without isolation";

    return make_unique<grading_service>(config, available,
                                        make_unique<docker_executor>(config),
                                        make_unique<fallback_executor>(config, resolver),
                                        resolver);
}

}  // namespace grader
