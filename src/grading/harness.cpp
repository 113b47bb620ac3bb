#include "grading/harness.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace grader {
using namespace std;

static const char *HARNESS_TEMPLATE = R"PY(import sys
import json
import os
import traceback

try:
    import resource
except ImportError:
    resource = None


@RESOLVER@

_JUDGE_VALUE_LIMIT = @VALUE_LIMIT@


def _judge_memory_usage():
    if resource is None:
        return None
    return round(resource.getrusage(resource.RUSAGE_SELF).ru_maxrss / 1024.0, 2)


def _judge_clip(text):
    if len(text) <= _JUDGE_VALUE_LIMIT:
        return text
    return text[:_JUDGE_VALUE_LIMIT] + "...<truncated>"


def _judge_value(value):
    try:
        text = json.dumps(value, allow_nan=False)
    except (TypeError, ValueError, OverflowError, RecursionError):
        return _judge_clip(repr(value))
    if len(text) <= _JUDGE_VALUE_LIMIT:
        return value
    return _judge_clip(repr(value))


def _judge_make_emit(token, stdout):
    def emit(record, code):
        memory = _judge_memory_usage()
        if memory is not None:
            record["memory_usage_mb"] = memory
        record["token"] = token
        stdout.write(json.dumps(record) + "\n")
        stdout.flush()
        sys.stderr.flush()
        os._exit(code)
    return emit


_judge_emit = _judge_make_emit("@TOKEN@", sys.stdout)
del _judge_make_emit
sys.stdout.write("@STARTED@\n")
sys.stdout.flush()
sys.stdout = sys.stderr

_judge_source = """@SOURCE@"""
_judge_tests = json.loads("""@TESTS@""")
_judge_namespace = {"__builtins__": __builtins__, "__name__": "__submission__"}

try:
    exec(compile(_judge_source, "<submission>", "exec"), _judge_namespace)
except BaseException as e:
    _judge_emit({
        "status": "error",
        "error_type": "compilation",
        "message": _judge_clip("%s: %s" % (type(e).__name__, e)),
        "traceback": _judge_clip(traceback.format_exc()),
        "tests_passed": 0,
        "tests_total": len(_judge_tests),
        "results": [],
    }, 1)

_judge_resolved = {}
_judge_results = []
_judge_passed = 0

for _judge_index, _judge_case in enumerate(_judge_tests, 1):
    try:
        _judge_target = _judge_case["function"]
        if _judge_target not in _judge_resolved:
            _judge_resolved[_judge_target] = _judge_resolve(_judge_target, _judge_namespace)
        _judge_name = _judge_resolved[_judge_target]
        if _judge_name is None:
            raise NameError("no callable named %r found in submission" % _judge_target)
        _judge_function = _judge_namespace[_judge_name]
        _judge_input = _judge_case["input"]
        if _judge_case["unpack"] and isinstance(_judge_input, list):
            _judge_actual = _judge_function(*_judge_input)
        else:
            _judge_actual = _judge_function(_judge_input)
        if bool(_judge_actual == _judge_case["expected"]):
            _judge_passed += 1
            _judge_results.append({"test": _judge_index, "status": "passed"})
        else:
            _judge_results.append({
                "test": _judge_index,
                "status": "failed",
                "expected": _judge_case["expected"],
                "got": _judge_value(_judge_actual),
            })
    except BaseException as e:
        _judge_results.append({
            "test": _judge_index,
            "status": "error",
            "message": _judge_clip("%s: %s" % (type(e).__name__, e)),
            "traceback": _judge_clip(traceback.format_exc()),
        })

_judge_emit({
    "status": "success" if _judge_passed == len(_judge_tests) else "partial",
    "tests_passed": _judge_passed,
    "tests_total": len(_judge_tests),
    "results": _judge_results,
}, 0)
)PY";

string escape_python_string(const string &value) {
    string result;
    result.reserve(value.size());
    for (char ch : value) {
        unsigned char c = static_cast<unsigned char>(ch);
        switch (c) {
            case '\\': result += "\\\\"; break;
            case '"': result += "\\\""; break;
            case '\r': result += "\\r"; break;
            case '\n':
            case '\t':
                result += ch;
                break;
            default:
                if (c < 0x20 || c == 0x7f)
                    result += fmt::format("\\x{:02x}", c);
                else
                    result += ch;
        }
    }
    return result;
}

string render_template(const string &tmpl, const map<string, string> &values) {
    string result;
    result.reserve(tmpl.size());
    size_t pos = 0;
    while (pos < tmpl.size()) {
        size_t begin = tmpl.find('@', pos);
        if (begin == string::npos) break;
        size_t end = tmpl.find('@', begin + 1);
        if (end == string::npos) break;

        auto it = values.find(tmpl.substr(begin + 1, end - begin - 1));
        if (it == values.end()) {
            // 不是占位符，保留第一个 @，从第二个 @ 开始继续匹配
            result.append(tmpl, pos, end - pos);
            pos = end;
        } else {
            result.append(tmpl, pos, begin - pos);
            result += it->second;
            pos = end + 1;
        }
    }
    result.append(tmpl, pos, string::npos);
    return result;
}

string clip_text(const string &text, size_t limit) {
    if (text.size() <= limit) return text;
    size_t end = limit;
    // 不能从一个 UTF-8 字符的中间截断
    while (end > 0 && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) --end;
    return text.substr(0, end) + "...<truncated>";
}

string strip_started_line(const string &out) {
    string line = string(HARNESS_STARTED_LINE) + "\n";
    if (boost::starts_with(out, line)) return out.substr(line.size());
    return out;
}

static string generate_token() {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

compiled_harness compile_harness(const execution_request &request, const function_resolver &resolver) {
    nlohmann::json tests = request.test_cases;

    compiled_harness harness;
    harness.tests_total = request.test_cases.size();
    harness.token = generate_token();
    harness.program = render_template(HARNESS_TEMPLATE, {{"RESOLVER", resolver.python_source()},
                                                         {"VALUE_LIMIT", std::to_string(VALUE_DISPLAY_LIMIT)},
                                                         {"TOKEN", harness.token},
                                                         {"STARTED", HARNESS_STARTED_LINE},
                                                         {"SOURCE", escape_python_string(request.source_code)},
                                                         {"TESTS", escape_python_string(tests.dump())}});
    return harness;
}

}  // namespace grader
