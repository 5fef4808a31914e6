#pragma once

#include <string>
#include <vector>
#include "feedback/feedback_synthesizer.hpp"
#include "models/analysis.hpp"
#include "models/execution.hpp"

namespace tutor {

/**
 * @brief 代码分析服务
 * 依次进行结构分析、风格检查、逻辑问题匹配、评分，最后生成提示和个性化反馈。
 */
class code_analyzer {
public:
    /**
     * @param generator 文本生成服务，可以为 nullptr，生命周期必须长于 code_analyzer
     */
    explicit code_analyzer(text_generator *generator);

    /**
     * @brief 分析一份代码
     * 不会抛出异常：任何内部错误都会得到一份完整的报告，
     * 反馈内容使用备用内容，feedback_degraded 为 true。
     * 
     * @param code 选手提交的代码
     * @param lesson_id 课程 id
     * @param execution 代码的执行结果
     * @param learner 学生信息
     * @param expected_concepts 这节课期望掌握的概念
     */
    analysis_report analyze(const std::string &code, const std::string &lesson_id, const execution_response &execution,
                            const learner_profile &learner, const std::vector<std::string> &expected_concepts);

private:
    feedback_synthesizer synthesizer;
};

}  // namespace tutor
