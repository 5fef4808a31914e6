#include "feedback/feedback_synthesizer.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/split.hpp>
#include <algorithm>
#include <regex>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace tutor {
using namespace std;

const size_t MAX_HINTS = 3;
const size_t MAX_LOGIC_HINTS = 2;

feedback_synthesizer::feedback_synthesizer(text_generator *generator)
    : generator(generator) {}

string feedback_synthesizer::build_prompt(const feedback_context &context) {
    const learner_profile &learner = context.learner;
    const execution_response &execution = context.execution;

    string interests = learner.interests.empty() ? "various topics" : boost::algorithm::join(learner.interests, ", ");
    string errors = execution.runtime_errors.empty() ? "None" : boost::algorithm::join(execution.runtime_errors, "; ");
    string concepts = context.expected_concepts.empty() ? "None" : boost::algorithm::join(context.expected_concepts, ", ");

    return fmt::format(R"(Analyze this Python code from a {age}-year-old student named {name}
with {experience} programming experience. They are interested in {interests}.

STUDENT CODE:
```python
{code}
```

EXECUTION RESULTS:
- Tests: {passed}/{total} tests passed
- Errors: {errors}

LESSON CONTEXT:
- Lesson ID: {lesson}
- Expected concepts: {concepts}

Please provide educational feedback in the following format, one section per heading:

CONCEPT_MASTERY: Rate understanding of each expected concept (0-5), as "concept: score" pairs
FEEDBACK: Encouraging, age-appropriate feedback paragraph
STRENGTHS: List specific things the student did well, one per line starting with "-"
IMPROVEMENTS: Specific, actionable suggestions for improvement, one per line starting with "-"
NEXT_STEPS: What they should learn next, one per line starting with "-"
ENCOURAGEMENT: Personal, motivating message using their name and interests
)",
                       fmt::arg("age", learner.age),
                       fmt::arg("name", learner.name),
                       fmt::arg("experience", learner.experience),
                       fmt::arg("interests", interests),
                       fmt::arg("code", context.code),
                       fmt::arg("passed", execution.passed_tests),
                       fmt::arg("total", execution.total_tests),
                       fmt::arg("errors", errors),
                       fmt::arg("lesson", context.lesson_id),
                       fmt::arg("concepts", concepts));
}

feedback_content feedback_synthesizer::fallback(const learner_profile &learner) {
    feedback_content content;
    content.feedback = "Keep practicing and learning!";
    content.strengths = {"Attempting the challenge"};
    content.improvements = {"Review the lesson concepts"};
    content.next_steps = {"Practice more examples"};
    content.encouragement = fmt::format("You're doing great, {}!", learner.name);
    content.degraded = true;
    return content;
}

/**
 * @brief 去掉列表项前的 "-"、"*"、"•"、"1." 等标记
 */
static string strip_bullet(const string &line) {
    static const regex bullet(R"(^\s*(?:-|\*|•|\d+[.)])\s*)");
    return trim_whitespace(regex_replace(line, bullet, "", regex_constants::format_first_only));
}

static map<string, int> parse_concept_mastery(const vector<string> &lines) {
    static const regex rating(R"(^\s*\**\s*([A-Za-z][A-Za-z0-9_ ]*?)\s*\**\s*(?::|=|-|\()\s*([0-5])(?![0-9]))");
    map<string, int> mastery;
    for (auto &line : lines) {
        vector<string> items;
        string stripped = strip_bullet(line);
        boost::split(items, stripped, [](char c) { return c == ',' || c == ';'; });
        for (auto &item : items) {
            smatch match;
            if (regex_search(item, match, rating))
                mastery[trim_whitespace(match[1])] = stoi(match[2]);
        }
    }
    return mastery;
}

static vector<string> parse_list(const vector<string> &lines) {
    vector<string> items;
    for (auto &line : lines) {
        string item = strip_bullet(line);
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

static string parse_paragraph(const vector<string> &lines) {
    vector<string> parts;
    for (auto &line : lines) {
        string part = trim_whitespace(line);
        if (!part.empty()) parts.push_back(part);
    }
    return boost::algorithm::join(parts, " ");
}

feedback_content feedback_synthesizer::parse_response(const string &text, const learner_profile &learner) {
    // 兼容 "**FEEDBACK:**"、"## Next Steps:" 等常见的 Markdown 写法
    static const regex header(R"(^[\s#*]*(CONCEPT[_ ]MASTERY|FEEDBACK|STRENGTHS|IMPROVEMENTS|NEXT[_ ]STEPS|ENCOURAGEMENT)[\s*]*:[\s*]*(.*)$)",
                              regex::icase);

    map<string, vector<string>> sections;
    string current;
    for (string line : split_lines(text)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        smatch match;
        if (regex_match(line, match, header)) {
            current = boost::algorithm::to_upper_copy(string(match[1]));
            boost::algorithm::replace_all(current, " ", "_");
            auto &section = sections[current];
            if (!trim_whitespace(match[2]).empty()) section.push_back(match[2]);
        } else if (!current.empty() && !trim_whitespace(line).empty()) {
            sections[current].push_back(line);
        }
    }

    feedback_content result = fallback(learner);
    result.degraded = false;
    auto use = [&result](auto value, auto &field) {
        if (value.empty())
            result.degraded = true;
        else
            field = move(value);
    };

    result.concept_mastery = parse_concept_mastery(sections["CONCEPT_MASTERY"]);
    use(parse_paragraph(sections["FEEDBACK"]), result.feedback);
    use(parse_list(sections["STRENGTHS"]), result.strengths);
    use(parse_list(sections["IMPROVEMENTS"]), result.improvements);
    use(parse_list(sections["NEXT_STEPS"]), result.next_steps);
    use(parse_paragraph(sections["ENCOURAGEMENT"]), result.encouragement);
    return result;
}

feedback_content feedback_synthesizer::synthesize(const feedback_context &context) {
    if (!generator) {
        DLOG(INFO) << "No text generation service configured, using fallback feedback";
        return fallback(context.learner);
    }

    try {
        string reply = generator->generate(build_prompt(context));
        feedback_content content = parse_response(reply, context.learner);
        if (content.degraded)
            LOG(WARNING) << "Lesson " << context.lesson_id << ": feedback reply is incomplete, filled with fallback content";
        return content;
    } catch (collaborator_error &e) {
        LOG(WARNING) << "Lesson " << context.lesson_id << ": text generation failed, " << e.what();
    } catch (std::exception &e) {
        LOG(ERROR) << "Lesson " << context.lesson_id << ": unable to generate feedback, " << e.what();
    }
    return fallback(context.learner);
}

/**
 * @brief 逻辑问题对应的提示
 */
static const char *logic_hint(const string &issue) {
    if (issue.find("Variable not defined") != string::npos)
        return "Make sure to define all variables before using them";
    if (issue.find("data type") != string::npos)
        return "Check if you're using the right data types (strings, numbers, etc.)";
    if (issue.find("indentation") != string::npos)
        return "Check that your code blocks are indented consistently";
    return nullptr;
}

vector<string> generate_hints(const structural_facts &syntax, const logic_findings &logic,
                              const execution_response &execution, const learner_profile &learner) {
    vector<string> hints;

    if (!syntax.is_valid) {
        hints.push_back("Check your syntax - make sure all parentheses and brackets are closed");
    } else {
        vector<string> issues;
        for (auto &issue : logic.logic_issues) {
            if (issues.size() >= MAX_LOGIC_HINTS) break;
            if (find(issues.begin(), issues.end(), issue) == issues.end()) issues.push_back(issue);
        }
        for (auto &issue : issues)
            if (const char *hint = logic_hint(issue)) hints.push_back(hint);
    }

    size_t failed = execution.total_tests > execution.passed_tests ? execution.total_tests - execution.passed_tests : 0;
    if (failed > 0)
        hints.push_back(fmt::format("Try testing your code with the examples - {} test(s) didn't pass", failed));

    if (learner.age <= 10)
        hints.push_back("Take your time and break the problem into small steps!");
    else
        hints.push_back("Consider edge cases and different input scenarios");

    if (hints.size() > MAX_HINTS) hints.resize(MAX_HINTS);
    return hints;
}

}  // namespace tutor
