#include "analysis/scorer.hpp"
#include <algorithm>

namespace tutor {
using namespace std;

int compute_score(const execution_response &response, const structural_facts &syntax, const style_findings &style) {
    double test_score = 40.0 * response.passed_tests / max<size_t>(response.total_tests, 1);
    double syntax_score = syntax.is_valid ? 30 : 0;
    double execution_score = response.success ? 20 : 10;
    double style_score = min<size_t>(10, style.good_practices.size() * 2);
    int score = (int)(test_score + syntax_score + execution_score + style_score);
    return clamp(score, 0, 100);
}

}  // namespace tutor
