#include "models/analysis.hpp"
#include <stdexcept>
#include "common/json_utils.hpp"

namespace tutor {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, structural_facts &facts) {
    j.at("isValid").get_to(facts.is_valid);
    facts.syntax_errors = get_value_def<vector<string>>(j, {}, "syntaxErrors");
    facts.syntax_error_line = get_value_def<int>(j, 0, "syntaxErrorLine");
    const json &structure = access(j, "structure");
    structure.at("functionsDefined").get_to(facts.functions_defined);
    structure.at("classesDefined").get_to(facts.classes_defined);
    structure.at("loopsUsed").get_to(facts.loops_used);
    structure.at("conditionalsUsed").get_to(facts.conditionals_used);
    structure.at("variablesAssigned").get_to(facts.variables_assigned);
    structure.at("importsUsed").get_to(facts.imports_used);
    j.at("complexityScore").get_to(facts.complexity_score);
}

void to_json(json &j, const structural_facts &facts) {
    j = {{"isValid", facts.is_valid},
         {"syntaxErrors", facts.syntax_errors},
         {"syntaxErrorLine", facts.syntax_error_line},
         {"structure", {{"functionsDefined", facts.functions_defined},
                        {"classesDefined", facts.classes_defined},
                        {"loopsUsed", facts.loops_used},
                        {"conditionalsUsed", facts.conditionals_used},
                        {"variablesAssigned", facts.variables_assigned},
                        {"importsUsed", facts.imports_used}}},
         {"complexityScore", facts.complexity_score}};
}

void from_json(const json &j, style_findings &style) {
    style.style_issues = get_value_def<vector<string>>(j, {}, "styleIssues");
    style.good_practices = get_value_def<vector<string>>(j, {}, "goodPractices");
    j.at("readabilityScore").get_to(style.readability_score);
}

void to_json(json &j, const style_findings &style) {
    j = {{"styleIssues", style.style_issues},
         {"goodPractices", style.good_practices},
         {"readabilityScore", style.readability_score}};
}

void from_json(const json &j, logic_findings &logic) {
    j.at("testsPassed").get_to(logic.tests_passed);
    j.at("testsFailed").get_to(logic.tests_failed);
    logic.logic_issues = get_value_def<vector<string>>(j, {}, "logicIssues");
    logic.output_patterns = get_value_def<vector<string>>(j, {}, "outputPatterns");
    j.at("executionSuccessful").get_to(logic.execution_successful);
}

void to_json(json &j, const logic_findings &logic) {
    j = {{"testsPassed", logic.tests_passed},
         {"testsFailed", logic.tests_failed},
         {"logicIssues", logic.logic_issues},
         {"outputPatterns", logic.output_patterns},
         {"executionSuccessful", logic.execution_successful}};
}

void from_json(const json &j, learner_profile &profile) {
    profile.name = get_value_def<string>(j, "", "name");
    profile.age = get_value_def<int>(j, 12, "age");
    if (profile.age < 8 || profile.age > 18)
        throw out_of_range("Learner age must be between 8 and 18, got " + to_string(profile.age));
    profile.experience = get_value_def<string>(j, "beginner", "experience");
    if (profile.experience != "beginner" && profile.experience != "some" && profile.experience != "advanced")
        throw out_of_range("Unrecognized experience level " + profile.experience);
    profile.learning_style = get_value_def<string>(j, "mixed", "learningStyle");
    profile.interests = get_value_def<vector<string>>(j, {}, "interests");
}

void to_json(json &j, const learner_profile &profile) {
    j = {{"name", profile.name},
         {"age", profile.age},
         {"experience", profile.experience},
         {"learningStyle", profile.learning_style},
         {"interests", profile.interests}};
}

void to_json(json &j, const analysis_report &report) {
    j = {{"overallScore", report.overall_score},
         {"conceptMastery", report.concept_mastery},
         {"codeQuality", {{"syntax", report.syntax},
                          {"logic", report.logic},
                          {"style", report.style}}},
         {"personalizedFeedback", report.personalized_feedback},
         {"adaptiveHints", report.adaptive_hints},
         {"nextSteps", report.next_steps},
         {"encouragement", report.encouragement},
         {"areasForImprovement", report.areas_for_improvement},
         {"strengths", report.strengths},
         {"feedbackDegraded", report.feedback_degraded}};
}

}  // namespace tutor
