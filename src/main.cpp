#include <glog/logging.h>
#include <signal.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <atomic>
#include <fstream>
#include <iostream>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/python.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "grading/grading_service.hpp"
#include "grading/result_normalizer.hpp"
using namespace std;

// 当前正在进行的评测，收到 SIGINT 时取消
static atomic<grader::cancellation_token*> running_token{nullptr};

void sigintHandler(int /* signum */) {
    grader::cancellation_token* token = running_token.load();
    if (token) token->cancel();
}

/**
 * @brief 命令行参数优先，其次是环境变量
 */
template <typename T>
static bool read_option(const boost::program_options::variables_map& vm, const char* option, const char* env, T& value) {
    if (vm.count(option)) {
        value = vm[option].as<T>();
        return true;
    } else if (getenv(env)) {
        value = boost::lexical_cast<T>(getenv(env));
        return true;
    }
    return false;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("sandbox-grader options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "load configuration from the given JSON file. You can either pass it from environ GRADER_CONFIG")
        ("request", po::value<string>(), "read the grading request from the given JSON file, or from stdin if omitted or \"-\"")
        ("docker", po::value<string>(), "set the docker client executable. You can either pass it from environ GRADER_DOCKER")
        ("image", po::value<string>(), "set the image to run submissions in, which must be pulled in advance. You can either pass it from environ GRADER_IMAGE")
        ("timeout", po::value<double>(), "set wall-clock time limit in seconds for isolated execution, default to 10. You can either pass it from environ GRADER_TIMEOUT")
        ("fallback-timeout", po::value<double>(), "set cooperative time limit in seconds for execution without isolation, default to 5. You can either pass it from environ GRADER_FALLBACK_TIMEOUT")
        ("memory-limit", po::value<int>(), "set memory limit in MB of the container, default to 128. You can either pass it from environ GRADER_MEMORY_LIMIT")
        ("cpus", po::value<double>(), "set the number of CPUs the container can use, default to 0.5. You can either pass it from environ GRADER_CPUS")
        ("workers", po::value<size_t>(), "set the number of grading workers, default to 4. You can either pass it from environ GRADER_WORKERS")
        ("force-fallback", "do not probe docker and execute submissions in the host process without isolation. You can either pass it from environ GRADER_FORCE_FALLBACK")
        ("status", "print whether submissions will be executed with isolation and exit")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "SandboxGrader: grade Python submissions against test cases" << endl
             << "Request format: {\"code\": \"def solution(n): ...\", \"test_cases\": [{\"input\": 1, \"expected\": 2}]}" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "sandbox-grader 1.0" << endl;
        return EXIT_SUCCESS;
    }

    grader::grader_config config;
    try {
        string config_file;
        if (read_option(vm, "config", "GRADER_CONFIG", config_file)) {
            CHECK(filesystem::is_regular_file(config_file))
                << "Configuration file " << config_file << " does not exist";
            config = grader::load_config(config_file, config);
        }

        read_option(vm, "docker", "GRADER_DOCKER", config.docker);
        read_option(vm, "image", "GRADER_IMAGE", config.image);
        read_option(vm, "memory-limit", "GRADER_MEMORY_LIMIT", config.memory_limit);
        read_option(vm, "cpus", "GRADER_CPUS", config.cpu_limit);
        read_option(vm, "workers", "GRADER_WORKERS", config.workers);

        double seconds;
        if (read_option(vm, "timeout", "GRADER_TIMEOUT", seconds))
            config.timeout = grader::seconds_to_duration(seconds);
        if (read_option(vm, "fallback-timeout", "GRADER_FALLBACK_TIMEOUT", seconds))
            config.fallback_timeout = grader::seconds_to_duration(seconds);

        if (vm.count("force-fallback") || grader::get_env("GRADER_FORCE_FALLBACK", "0") != "0")
            config.force_fallback = true;

        // 重新走一遍校验
        nlohmann::json j = config;
        grader::from_json(j, config);
    } catch (std::exception& e) {
        LOG(ERROR) << "Invalid configuration: " << e.what();
        return EXIT_FAILURE;
    }

    grader::python_interpreter interpreter;
    unique_ptr<grader::grading_service> service = grader::make_grading_service(config);

    if (vm.count("status")) {
        bool available = service->is_isolation_available();
        nlohmann::json status = {{"isolation_available", available},
                                 {"mode", available ? "secure" : "best-effort"},
                                 {"config", config}};
        cout << status.dump(4) << endl;
        return EXIT_SUCCESS;
    }

    string content;
    string request_file = vm.count("request") ? vm["request"].as<string>() : "-";
    try {
        if (request_file == "-")
            content = grader::read_stream_content(cin);
        else
            content = grader::read_file_content(request_file);
    } catch (std::system_error& e) {
        LOG(ERROR) << "Unable to read grading request: " << e.what();
        return EXIT_FAILURE;
    }

    grader::execution_result result;
    try {
        nlohmann::json j = nlohmann::json::parse(content);
        grader::execution_request request = grader::parse_request(j);

        signal(SIGINT, sigintHandler);
        grader::grading_ticket ticket = service->grade_async(move(request));
        running_token = ticket.token.get();
        result = ticket.result.get();
        running_token = nullptr;
    } catch (nlohmann::json::parse_error& e) {
        result = grader::make_error_result(grader::error_kind::VALIDATION, string("Request is not valid JSON: ") + e.what(), 0, service->is_isolation_available());
    } catch (grader::invalid_request& e) {
        result = grader::make_error_result(grader::error_kind::VALIDATION, e.what(), 0, service->is_isolation_available());
    }

    cout << nlohmann::json(result).dump(4) << endl;
    return EXIT_SUCCESS;
}
