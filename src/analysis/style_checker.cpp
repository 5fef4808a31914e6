#include <fmt/core.h>
#include <algorithm>
#include <regex>
#include "analysis/static_analyzer.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace tutor {
using namespace std;

const size_t MAX_LINE_LENGTH = 100;

style_findings check_style(const string &code) {
    style_findings style;

    vector<string> lines = split_lines(code);
    for (size_t i = 0; i < lines.size(); ++i) {
        string &line = lines[i];
        // CRLF 换行
        if (!line.empty() && line.back() == '\r') line.pop_back();
        string stripped = trim_whitespace(line);
        if (stripped.empty()) continue;

        size_t length = utf8_length(line);
        if (length > MAX_LINE_LENGTH)
            style.style_issues.push_back(fmt::format("Line {} is too long ({} characters)", i + 1, length));

        if (stripped[0] == '#')
            style.good_practices.push_back(fmt::format("Good use of comments on line {}", i + 1));
    }

    // 赋值语句的目标，排除 == 比较
    static const regex assignment(R"(\b([A-Za-z_][A-Za-z0-9_]*)\s*=(?!=))");
    for (sregex_iterator it(code.begin(), code.end(), assignment), end; it != end; ++it) {
        string name = (*it)[1];
        if (name.size() > 2 && name[0] != '_') {
            style.good_practices.push_back("Uses meaningful variable names");
            break;
        }
    }

    style.readability_score = clamp(10 - (int)style.style_issues.size(), 1, 10);
    return style;
}

}  // namespace tutor
