#pragma once

#include <map>
#include <string>
#include <vector>
#include "feedback/text_generator.hpp"
#include "models/analysis.hpp"
#include "models/execution.hpp"

namespace tutor {

/**
 * @brief 个性化反馈内容
 */
struct feedback_content {
    std::map<std::string, int> concept_mastery;
    std::string feedback;
    std::vector<std::string> strengths;
    std::vector<std::string> improvements;
    std::vector<std::string> next_steps;
    std::string encouragement;

    /**
     * @brief 是否使用了通用的备用内容
     */
    bool degraded = false;
};

/**
 * @brief 生成反馈所需的上下文
 */
struct feedback_context {
    const std::string &code;
    const std::string &lesson_id;
    const execution_response &execution;
    const learner_profile &learner;
    const std::vector<std::string> &expected_concepts;
};

/**
 * @brief 调用文本生成服务，为学生生成个性化的反馈
 * 
 * 文本生成服务的回复按 CONCEPT_MASTERY、FEEDBACK、STRENGTHS、IMPROVEMENTS、
 * NEXT_STEPS、ENCOURAGEMENT 分节解析，缺少的节使用通用的备用内容。
 * 服务调用失败或者超时时，所有内容都使用备用内容，degraded 为 true。
 * synthesize 不会抛出异常。
 */
class feedback_synthesizer {
public:
    /**
     * @param generator 文本生成服务，为 nullptr 时总是使用备用内容
     */
    explicit feedback_synthesizer(text_generator *generator);

    feedback_content synthesize(const feedback_context &context);

    static std::string build_prompt(const feedback_context &context);

    /**
     * @brief 解析文本生成服务的回复
     * @param text 服务返回的文本
     * @param learner 用于生成备用的鼓励语
     */
    static feedback_content parse_response(const std::string &text, const learner_profile &learner);

    /**
     * @brief 服务不可用时使用的备用内容，所有字段都非空
     */
    static feedback_content fallback(const learner_profile &learner);

private:
    text_generator *generator;
};

/**
 * @brief 根据分析结果生成最多 3 条提示，不依赖文本生成服务
 * 提示按以下优先级排列：
 * 1. 代码无法解析时，提示检查语法；否则最多 2 条与逻辑问题对应的提示；
 * 2. 有测试用例未通过时，提示未通过的个数；
 * 3. 一条与年龄相符的通用提示（10 岁及以下使用更简单的说法）。
 */
std::vector<std::string> generate_hints(const structural_facts &syntax, const logic_findings &logic,
                                        const execution_response &execution, const learner_profile &learner);

}  // namespace tutor
