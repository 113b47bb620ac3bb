#include "grading/fallback_executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <map>
#include <mutex>
#include <optional>
#include "common/exceptions.hpp"
#include "common/python.hpp"
#include "common/utils.hpp"
#include "grading/harness.hpp"
#include "grading/python_watchdog.hpp"

namespace grader {
using namespace std;

static mutex execution_mutex;

namespace {

string format_error_message(const python_error &error) {
    return error.message.empty() ? error.type : error.type + ": " + error.message;
}

py_ref check(PyObject *obj, const char *what) {
    if (!obj) {
        python_error error = fetch_python_error();
        throw internal_error(fmt::format("{} failed: {}", what, format_error_message(error)));
    }
    return py_ref(obj);
}

/**
 * @brief 一次评测的 Python 状态，只能在持有 GIL 时使用
 */
class submission_runner {
public:
    explicit submission_runner(const function_resolver &resolver)
        : resolver(resolver),
          json_module(check(PyImport_ImportModule("json"), "import json")) {}

    /**
     * @brief 在新的命名空间中加载选手代码
     * @return 加载失败时的异常信息
     */
    optional<python_error> load(const string &source) {
        namespace_ = check(PyDict_New(), "PyDict_New");
        py_ref builtins = check(PyImport_ImportModule("builtins"), "import builtins");
        py_ref name = check(PyUnicode_FromString("__submission__"), "PyUnicode_FromString");
        if (PyDict_SetItemString(namespace_.get(), "__builtins__", builtins.get()) != 0 ||
            PyDict_SetItemString(namespace_.get(), "__name__", name.get()) != 0)
            check(nullptr, "PyDict_SetItemString");

        if (source.find('\0') != string::npos)
            return python_error{"SyntaxError", "source code cannot contain null bytes", ""};

        py_ref code(Py_CompileString(source.c_str(), "<submission>", Py_file_input));
        if (!code) return fetch_python_error();

        py_ref result(PyEval_EvalCode(code.get(), namespace_.get(), namespace_.get()));
        if (!result) return fetch_python_error();
        return nullopt;
    }

    test_result run_test(const test_case &tc) {
        auto name = resolve(tc.target_function);
        if (!name)
            return execution_error{fmt::format("NameError: no callable named '{}' found in submission", tc.target_function), ""};

        py_ref function = py_ref::borrow(PyDict_GetItemString(namespace_.get(), name->c_str()));
        if (!function)
            return execution_error{fmt::format("NameError: name '{}' is not defined", *name), ""};

        py_ref input = to_python(tc.input);
        py_ref actual;
        if (tc.unpack_input && tc.input.is_array()) {
            py_ref args = check(PySequence_Tuple(input.get()), "PySequence_Tuple");
            actual = py_ref(PyObject_Call(function.get(), args.get(), nullptr));
        } else {
            actual = py_ref(PyObject_CallFunctionObjArgs(function.get(), input.get(), nullptr));
        }
        if (!actual) return to_execution_error(fetch_python_error());

        py_ref expected = to_python(tc.expected);
        int equal = PyObject_RichCompareBool(actual.get(), expected.get(), Py_EQ);
        if (equal < 0) return to_execution_error(fetch_python_error());
        if (equal) return test_value{true, nullptr};
        return test_value{false, from_python(actual.get())};
    }

private:
    static execution_error to_execution_error(const python_error &error) {
        return execution_error{clip_text(format_error_message(error)), clip_text(error.traceback)};
    }

    /**
     * @brief 查找函数，每个函数名只查找一次
     */
    optional<string> resolve(const string &target) {
        auto it = resolved.find(target);
        if (it != resolved.end()) return it->second;

        vector<function_symbol> symbols;
        PyObject *key, *value;
        Py_ssize_t pos = 0;
        while (PyDict_Next(namespace_.get(), &pos, &key, &value)) {
            if (!PyUnicode_Check(key)) continue;
            symbols.push_back({to_utf8(key), PyCallable_Check(value) == 1});
        }
        auto name = resolver.resolve(target, symbols);
        resolved[target] = name;
        return name;
    }

    py_ref to_python(const nlohmann::json &value) {
        string text = value.dump();
        return check(PyObject_CallMethod(json_module.get(), "loads", "s#", text.data(), (Py_ssize_t)text.size()), "json.loads");
    }

    /**
     * @brief 将返回值转换为 JSON，无法转换时使用 repr
     */
    nlohmann::json from_python(PyObject *value) {
        py_ref dumps = check(PyObject_GetAttrString(json_module.get(), "dumps"), "json.dumps");
        py_ref args = check(PyTuple_Pack(1, value), "PyTuple_Pack");
        py_ref kwargs = check(Py_BuildValue("{s:O}", "allow_nan", Py_False), "Py_BuildValue");
        py_ref text(PyObject_Call(dumps.get(), args.get(), kwargs.get()));
        if (text) {
            string dumped = to_utf8(text.get());
            if (dumped.size() <= VALUE_DISPLAY_LIMIT && nlohmann::json::accept(dumped))
                return nlohmann::json::parse(dumped);
        }
        PyErr_Clear();

        py_ref repr(PyObject_Repr(value));
        if (!repr) {
            PyErr_Clear();
            return "<unrepresentable object>";
        }
        return clip_text(to_utf8(repr.get()));
    }

    const function_resolver &resolver;
    py_ref json_module;
    py_ref namespace_;
    map<string, optional<string>> resolved;
};

nlohmann::json make_outcome_record(size_t index, const test_case &tc, const test_result &result) {
    nlohmann::json record = {{"test", index}};
    if (auto value = get_if<test_value>(&result)) {
        if (value->equal) {
            record["status"] = "passed";
        } else {
            record["status"] = "failed";
            record["expected"] = tc.expected;
            record["got"] = value->actual;
        }
    } else {
        auto &error = get<execution_error>(result);
        record["status"] = "error";
        record["message"] = error.message;
        record["traceback"] = error.traceback;
    }
    return record;
}

}  // namespace

fallback_executor::fallback_executor(grader_config config, shared_ptr<const function_resolver> resolver)
    : config(move(config)), resolver(move(resolver)) {}

string fallback_executor::name() const {
    return "embedded-python";
}

bool fallback_executor::isolated() const {
    return false;
}

execution_output fallback_executor::execute(const execution_request &request, const compiled_harness &harness, const cancellation_token &token) const {
    if (!Py_IsInitialized())
        throw internal_error("Embedded Python interpreter is not initialized");

    execution_output output;
    output.isolated = false;

    // 所有评测共用一个解释器，一次只运行一个，保证每次评测的时限都只用于自己的代码
    unique_lock<mutex> serial(execution_mutex);
    LOG(INFO) << "Running " << harness.tests_total << " test cases in embedded Python without isolation";

    elapsed_time timer;
    GIL_guard gil;
    python_watchdog watchdog(config.fallback_timeout);
    bool overdue = false;
    try {
        size_t total = request.test_cases.size();
        optional<submission_runner> runner;
        optional<python_error> load_error;
        {
            python_watchdog::guard guard(watchdog);
            runner.emplace(*resolver);
            load_error = runner->load(request.source_code);
        }

        if (load_error) {
            output.exitcode = 1;
            output.report = nlohmann::json{{"status", "error"},
                                           {"error_type", "compilation"},
                                           {"message", clip_text(format_error_message(*load_error))},
                                           {"traceback", clip_text(load_error->traceback)},
                                           {"tests_passed", 0},
                                           {"tests_total", total},
                                           {"results", nlohmann::json::array()}};
        } else {
            nlohmann::json results = nlohmann::json::array();
            size_t passed = 0;
            for (size_t i = 0; i < total; ++i) {
                if (token.cancelled()) {
                    output.failure = error_kind::UNKNOWN;
                    output.failure_message = "Execution was cancelled";
                    break;
                }
                if (watchdog.overdue()) {
                    overdue = true;
                    break;
                }
                const test_case &tc = request.test_cases[i];
                test_result result = [&] {
                    python_watchdog::guard guard(watchdog);
                    return runner->run_test(tc);
                }();
                if (auto value = get_if<test_value>(&result); value && value->equal) ++passed;
                results.push_back(make_outcome_record(i + 1, tc, result));
            }
            output.report = nlohmann::json{{"status", passed == total ? "success" : "partial"},
                                           {"tests_passed", passed},
                                           {"tests_total", total},
                                           {"results", move(results)}};
        }
    } catch (internal_error &ex) {
        if (!watchdog.expired()) {
            LOG(ERROR) << "Embedded Python failed: " << ex;
            output.failure = error_kind::UNKNOWN;
            output.failure_message = ex.what();
        }
    }

    // 只有在选手代码执行期间超时才算超时，所有数据点都完成后到期不影响结果
    watchdog.disarm();
    if (overdue || watchdog.expired()) {
        output.report.reset();
        output.failure = error_kind::TIMEOUT;
        output.failure_message = fmt::format("Execution exceeded the time limit of {:.1f} seconds", config.fallback_timeout.count() / 1000.0);
        // 异步异常可能已经被设置但尚未被处理
        PyErr_Clear();
    }

    output.elapsed_ms = timer.milliseconds();
    return output;
}

}  // namespace grader
