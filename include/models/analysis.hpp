#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

/**
 * 这个头文件包含代码分析报告的数据结构及其 JSON 序列化函数
 */
namespace tutor {

/**
 * @brief 通过解析代码得到的结构信息
 */
struct structural_facts {
    /**
     * @brief 代码能否被 Python 解析
     */
    bool is_valid = false;

    /**
     * @brief 语法错误信息，代码合法时为空
     * @code{.json}
     * ["Syntax error at line 3: invalid syntax"]
     * @endcode
     */
    std::vector<std::string> syntax_errors;

    /**
     * @brief 语法错误所在行，从 1 开始；代码合法或行号未知时为 0
     */
    int syntax_error_line = 0;

    int functions_defined = 0;
    int classes_defined = 0;

    /**
     * @brief for 和 while 循环的个数
     */
    int loops_used = 0;

    /**
     * @brief if 语句的个数（elif 在语法树中也是 If 节点）
     */
    int conditionals_used = 0;

    /**
     * @brief 赋值语句的个数，不包括增量赋值和带类型标注的赋值
     */
    int variables_assigned = 0;

    /**
     * @brief import 和 from ... import 语句的个数
     */
    int imports_used = 0;

    /**
     * @brief 近似的圈复杂度，最小为 1
     */
    int complexity_score = 1;
};

/**
 * @brief 代码风格检查结果
 */
struct style_findings {
    std::vector<std::string> style_issues;
    std::vector<std::string> good_practices;

    /**
     * @brief 可读性评分，1~10
     */
    int readability_score = 10;
};

/**
 * @brief 根据执行结果推测的逻辑问题
 */
struct logic_findings {
    std::size_t tests_passed = 0;
    std::size_t tests_failed = 0;

    /**
     * @brief 根据错误信息识别出的问题类型，比如 "Variable not defined before use"
     */
    std::vector<std::string> logic_issues;

    /**
     * @brief 输出不一致的测试用例的说明，比如 "Expected '25' but got '10'"
     */
    std::vector<std::string> output_patterns;

    bool execution_successful = false;
};

/**
 * @brief 学生信息，用于生成个性化的反馈
 */
struct learner_profile {
    std::string name;

    /**
     * @brief 年龄，8~18 岁
     */
    int age = 12;

    /**
     * @brief 编程经验：beginner, some, advanced
     */
    std::string experience = "beginner";

    /**
     * @brief 学习方式：visual, text, mixed
     */
    std::string learning_style = "mixed";

    std::vector<std::string> interests;
};

/**
 * @brief 一次代码分析的完整报告，构造之后不再修改
 */
struct analysis_report {
    /**
     * @brief 总分，0~100
     */
    int overall_score = 0;

    /**
     * @brief 每个期望掌握的概念的掌握程度，0~5
     */
    std::map<std::string, int> concept_mastery;

    structural_facts syntax;
    logic_findings logic;
    style_findings style;

    /**
     * @brief 最多 3 条提示，按优先级排列
     */
    std::vector<std::string> adaptive_hints;

    std::string personalized_feedback;
    std::vector<std::string> strengths;
    std::vector<std::string> areas_for_improvement;
    std::vector<std::string> next_steps;
    std::string encouragement;

    /**
     * @brief 反馈内容是否使用了通用的备用内容（文本生成服务不可用）
     */
    bool feedback_degraded = false;
};

void from_json(const nlohmann::json &j, structural_facts &facts);
void to_json(nlohmann::json &j, const structural_facts &facts);

void from_json(const nlohmann::json &j, style_findings &style);
void to_json(nlohmann::json &j, const style_findings &style);

void from_json(const nlohmann::json &j, logic_findings &logic);
void to_json(nlohmann::json &j, const logic_findings &logic);

void from_json(const nlohmann::json &j, learner_profile &profile);
void to_json(nlohmann::json &j, const learner_profile &profile);

void to_json(nlohmann::json &j, const analysis_report &report);

}  // namespace tutor
