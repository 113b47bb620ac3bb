#include "grading/docker_executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cstring>
#include "common/defer.hpp"

namespace grader {
using namespace std;

const int DOCKER_DAEMON_ERROR = 125;
const int DOCKER_CANNOT_INVOKE = 126;
const int DOCKER_COMMAND_NOT_FOUND = 127;
const int DOCKER_KILLED = 137;

const chrono::milliseconds TEARDOWN_TIMEOUT(10000);

static string generate_container_name() {
    static thread_local boost::uuids::random_generator generator;
    return "grader-" + boost::uuids::to_string(generator());
}

docker_executor::docker_executor(grader_config config) : config(move(config)) {}

string docker_executor::name() const {
    return "docker";
}

bool docker_executor::isolated() const {
    return true;
}

vector<string> docker_executor::build_command(const string &container) const {
    string memory = fmt::format("{}m", config.memory_limit);
    return {config.docker, "run", "--rm", "-i",
            "--name", container,
            "--network", "none",
            "--memory", memory,
            "--memory-swap", memory,
            "--cpus", fmt::format("{}", config.cpu_limit),
            "--pids-limit", std::to_string(config.pids_limit),
            "--cap-drop", "ALL",
            "--security-opt", "no-new-privileges",
            "--user", config.run_user,
            "--read-only",
            "--tmpfs", fmt::format("/tmp:rw,size={}m", config.tmpfs_size),
            "--pull", "never",
            config.image,
            config.python, "-I", "-B", "-"};
}

void docker_executor::kill_container(const string &container) const {
    process_options options;
    options.timeout = TEARDOWN_TIMEOUT;
    process_result result = run_process({config.docker, "kill", container}, "", options);
    // 容器可能还没有创建或者已经退出，这时 docker kill 会失败，不需要处理
    if (result.exitcode != 0)
        DLOG(INFO) << "docker kill " << container << " exited with " << result.exitcode << ": " << result.err;
}

void docker_executor::remove_container(const string &container) const {
    process_options options;
    options.timeout = TEARDOWN_TIMEOUT;
    process_result result = run_process({config.docker, "rm", "-f", container}, "", options);
    if (result.exitcode != 0 && result.err.find("No such container") == string::npos)
        LOG(WARNING) << "Unable to remove container " << container << ": " << result.err;
}

execution_output docker_executor::execute(const execution_request &request, const compiled_harness &harness, const cancellation_token &token) const {
    execution_output output;
    output.isolated = true;

    string container = generate_container_name();
    bool clean_exit = false;

    try {
        defer {
            if (!clean_exit) remove_container(container);
        };

        process_options options;
        options.timeout = config.timeout;
        options.output_limit = config.output_limit;
        options.should_stop = [&token] { return token.cancelled(); };
        options.on_abort = [&] { kill_container(container); };

        LOG(INFO) << "Starting container " << container << " with " << request.test_cases.size() << " test cases";
        process_result result = run_process(build_command(container), harness.program, options);

        auto failure = classify_docker_failure(result, config);
        output.elapsed_ms = result.wall_time;
        output.exitcode = result.exitcode;
        output.out = move(result.out);
        output.err = move(result.err);
        output.stdout_truncated = result.stdout_truncated;

        if (failure) {
            output.failure = failure->first;
            output.failure_message = failure->second;
            LOG(WARNING) << "Container " << container << " failed (" << to_string(failure->first) << "): " << failure->second;
        }

        // docker 客户端没有启动时不会创建容器
        clean_exit = result.exec_errno != 0 ||
                     (!result.timed_out && !result.cancelled && result.exitcode != DOCKER_DAEMON_ERROR);
        LOG(INFO) << "Container " << container << " finished in " << result.wall_time << "ms with exit code " << result.exitcode;
    } catch (std::exception &ex) {
        LOG(ERROR) << "Docker executor crashed when running container " << container << ": " << ex.what();
        output.failure = error_kind::UNKNOWN;
        output.failure_message = ex.what();
    }
    return output;
}

optional<pair<error_kind, string>> classify_docker_failure(const process_result &result, const grader_config &config) {
    if (result.exec_errno != 0)
        return make_pair(error_kind::SYSTEM, fmt::format("Unable to execute {}: {}", config.docker, strerror(result.exec_errno)));
    if (result.timed_out)
        return make_pair(error_kind::TIMEOUT, fmt::format("Execution exceeded the time limit of {:.1f} seconds", config.timeout.count() / 1000.0));
    if (result.cancelled)
        return make_pair(error_kind::UNKNOWN, string("Execution was cancelled"));

    string err = boost::trim_copy(result.err);
    // 评测程序启动之后的返回值都来自选手代码，不能归咎于容器后端
    bool started = boost::contains(result.out, HARNESS_STARTED_LINE);
    switch (result.exitcode) {
        case DOCKER_DAEMON_ERROR:
            if (started) break;
            if (boost::contains(err, "No such image") || boost::contains(err, "Unable to find image") ||
                boost::contains(err, "pull access denied"))
                return make_pair(error_kind::SYSTEM, fmt::format("Execution image {} is not available: {}", config.image, err));
            return make_pair(error_kind::UNKNOWN, fmt::format("Container backend failed: {}", err));
        case DOCKER_CANNOT_INVOKE:
        case DOCKER_COMMAND_NOT_FOUND:
            if (!started)
                return make_pair(error_kind::SYSTEM, fmt::format("Python runtime {} is not available in image {}: {}", config.python, config.image, err));
            break;
        case DOCKER_KILLED:
            if (boost::trim_copy(strip_started_line(result.out)).empty())
                return make_pair(error_kind::RUNTIME, fmt::format("Process was killed, possibly exceeding the memory limit of {} MB. {}", config.memory_limit, err));
            break;
    }
    if (result.signal != -1)
        return make_pair(error_kind::UNKNOWN, fmt::format("Docker client was terminated by signal {}", result.signal));
    return nullopt;
}

bool probe_docker(const grader_config &config) {
    process_options options;
    options.timeout = config.probe_timeout;
    try {
        process_result result = run_process({config.docker, "info", "--format", "{{.ServerVersion}}"}, "", options);
        if (result.exec_errno != 0) {
            LOG(WARNING) << "Docker client " << config.docker << " is not available: " << strerror(result.exec_errno);
            return false;
        }
        if (result.timed_out || result.exitcode != 0) {
            LOG(WARNING) << "Docker daemon is not reachable: " << boost::trim_copy(result.err);
            return false;
        }
        LOG(INFO) << "Docker daemon " << boost::trim_copy(result.out) << " is available";
        return true;
    } catch (std::system_error &ex) {
        LOG(WARNING) << "Unable to probe docker: " << ex.what();
        return false;
    }
}

}  // namespace grader
