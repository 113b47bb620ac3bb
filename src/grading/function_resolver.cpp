#include "grading/function_resolver.hpp"
#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace grader {
using namespace std;

last_public_callable_resolver::last_public_callable_resolver(string private_prefix)
    : private_prefix(move(private_prefix)) {}

optional<string> last_public_callable_resolver::resolve(const string &target, const vector<function_symbol> &symbols) const {
    for (auto &symbol : symbols)
        if (symbol.name == target)
            return target;

    for (auto it = symbols.rbegin(); it != symbols.rend(); ++it) {
        if (!it->callable) continue;
        if (!private_prefix.empty() && it->name.compare(0, private_prefix.size(), private_prefix) == 0) continue;
        return it->name;
    }
    return nullopt;
}

string last_public_callable_resolver::python_source() const {
    // JSON 字符串字面量同时也是合法的 Python 字符串字面量
    return fmt::format(R"(def _judge_resolve(target, namespace):
    if target in namespace:
        return target
    prefix = {0}
    for name in reversed(list(namespace.keys())):
        if prefix and name.startswith(prefix):
            continue
        if callable(namespace[name]):
            return name
    return None
)",
                       nlohmann::json(private_prefix).dump());
}

}  // namespace grader
