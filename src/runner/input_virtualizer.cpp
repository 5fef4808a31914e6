#include "runner/input_virtualizer.hpp"
#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace tutor {
using namespace std;
using namespace nlohmann;

// 以 UTF-8 原样输出非 ASCII 字符，控制字符转义为 \n、\u001b 等 Python 也能识别的形式。
// 不能使用 \uXXXX 形式的代理对，Python 会把它解析成两个独立的代理字符。
static string to_python_literal(const json &value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

static constexpr const char *BOOTSTRAP = R"(# -*- coding: utf-8 -*-
class _QueuedInput:
    def __init__(self, values):
        self._values = values
        self._index = 0

    def read(self, prompt=""):
        if self._index < len(self._values):
            value = self._values[self._index]
            self._index += 1
            return value
        return ""


_source = {source}
_namespace = {{
    "__name__": "__main__",
    "__builtins__": __builtins__,
    "input": _QueuedInput({inputs}).read,
}}
exec(compile(_source, "<submission>", "exec"), _namespace)
)";

string virtualize_input(const string &source, const vector<string> &inputs) {
    return fmt::format(BOOTSTRAP,
                       fmt::arg("source", to_python_literal(source)),
                       fmt::arg("inputs", to_python_literal(inputs)));
}

}  // namespace tutor
