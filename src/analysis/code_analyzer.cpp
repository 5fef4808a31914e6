#include "analysis/code_analyzer.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "analysis/logic_matcher.hpp"
#include "analysis/scorer.hpp"
#include "analysis/static_analyzer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace tutor {
using namespace std;

code_analyzer::code_analyzer(text_generator *generator)
    : synthesizer(generator) {}

static void apply_feedback(analysis_report &report, feedback_content &&content) {
    report.concept_mastery = move(content.concept_mastery);
    report.personalized_feedback = move(content.feedback);
    report.strengths = move(content.strengths);
    report.areas_for_improvement = move(content.improvements);
    report.next_steps = move(content.next_steps);
    report.encouragement = move(content.encouragement);
    report.feedback_degraded = content.degraded;
}

analysis_report code_analyzer::analyze(const string &code, const string &lesson_id, const execution_response &execution,
                                       const learner_profile &learner, const vector<string> &expected_concepts) {
    elapsed_time timer;
    analysis_report report;
    try {
        report.style = check_style(code);
        report.logic = match_logic(execution);
        report.syntax = analyze_structure(code);
        report.overall_score = compute_score(execution, report.syntax, report.style);
        report.adaptive_hints = generate_hints(report.syntax, report.logic, execution, learner);

        apply_feedback(report, synthesizer.synthesize({code, lesson_id, execution, learner, expected_concepts}));
    } catch (std::exception &e) {
        LOG(ERROR) << "Lesson " << lesson_id << ": code analysis failed, " << boost::diagnostic_information(e);

        // 已经得到的分析结果保留，缺少的部分使用默认值
        if (report.adaptive_hints.empty())
            report.adaptive_hints = generate_hints(report.syntax, report.logic, execution, learner);
        report.overall_score = compute_score(execution, report.syntax, report.style);
        apply_feedback(report, feedback_synthesizer::fallback(learner));
    }

    LOG(INFO) << "Lesson " << lesson_id << ": analyzed code of " << learner.name << ", score " << report.overall_score
              << (report.feedback_degraded ? " (fallback feedback)" : "") << " in " << timer.milliseconds() << "ms";
    return report;
}

}  // namespace tutor
