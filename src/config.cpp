#include "config.hpp"
#include <cmath>
#include <stdexcept>
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace grader {
using namespace std;

chrono::milliseconds seconds_to_duration(double seconds) {
    if (!(seconds > 0) || !isfinite(seconds))
        throw invalid_argument("time limit must be a positive number of seconds");
    return chrono::milliseconds(static_cast<long long>(llround(seconds * 1000)));
}

static void assign_duration(const nlohmann::json &j, chrono::milliseconds &value, const char *key) {
    double seconds = -1;
    nlohmann::assign_optional(j, seconds, key);
    if (seconds != -1) value = seconds_to_duration(seconds);
}

void from_json(const nlohmann::json &j, grader_config &config) {
    if (!j.is_object())
        throw invalid_argument("configuration must be a JSON object");

    nlohmann::assign_optional(j, config.docker, "docker");
    nlohmann::assign_optional(j, config.image, "image");
    nlohmann::assign_optional(j, config.python, "python");
    nlohmann::assign_optional(j, config.run_user, "run_user");
    nlohmann::assign_optional(j, config.memory_limit, "memory_limit");
    nlohmann::assign_optional(j, config.cpu_limit, "cpu_limit");
    nlohmann::assign_optional(j, config.pids_limit, "pids_limit");
    nlohmann::assign_optional(j, config.tmpfs_size, "tmpfs_size");
    assign_duration(j, config.timeout, "timeout");
    assign_duration(j, config.fallback_timeout, "fallback_timeout");
    assign_duration(j, config.probe_timeout, "probe_timeout");
    nlohmann::assign_optional(j, config.output_limit, "output_limit");
    nlohmann::assign_optional(j, config.workers, "workers");
    nlohmann::assign_optional(j, config.private_prefix, "private_prefix");
    nlohmann::assign_optional(j, config.default_function, "default_function");
    nlohmann::assign_optional(j, config.force_fallback, "force_fallback");

    if (config.memory_limit <= 0) throw invalid_argument("memory_limit must be positive");
    if (!(config.cpu_limit > 0)) throw invalid_argument("cpu_limit must be positive");
    if (config.pids_limit <= 0) throw invalid_argument("pids_limit must be positive");
    if (config.workers == 0) throw invalid_argument("workers must be positive");
    if (config.default_function.empty()) throw invalid_argument("default_function must not be empty");
}

void to_json(nlohmann::json &j, const grader_config &config) {
    j = {{"docker", config.docker},
         {"image", config.image},
         {"python", config.python},
         {"run_user", config.run_user},
         {"memory_limit", config.memory_limit},
         {"cpu_limit", config.cpu_limit},
         {"pids_limit", config.pids_limit},
         {"tmpfs_size", config.tmpfs_size},
         {"timeout", config.timeout.count() / 1000.0},
         {"fallback_timeout", config.fallback_timeout.count() / 1000.0},
         {"probe_timeout", config.probe_timeout.count() / 1000.0},
         {"output_limit", config.output_limit},
         {"workers", config.workers},
         {"private_prefix", config.private_prefix},
         {"default_function", config.default_function},
         {"force_fallback", config.force_fallback}};
}

grader_config load_config(const filesystem::path &path, grader_config config) {
    nlohmann::json j = nlohmann::json::parse(read_file_content(path));
    from_json(j, config);
    return config;
}

}  // namespace grader
