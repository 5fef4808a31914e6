#include "analysis/scorer.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace tutor;

static execution_response make_response(bool success, size_t passed, size_t total) {
    execution_response response;
    response.success = success;
    response.passed_tests = passed;
    response.total_tests = total;
    return response;
}

static structural_facts make_syntax(bool valid) {
    structural_facts facts;
    facts.is_valid = valid;
    return facts;
}

static style_findings make_style(size_t good_practices) {
    style_findings style;
    style.good_practices.assign(good_practices, "practice");
    return style;
}

TEST(ScorerTest, WeightedScoreTest) {
    // 40 * 2/4 + 30 + 20 + 2 * 3
    EXPECT_EQ(compute_score(make_response(true, 2, 4), make_syntax(true), make_style(3)), 76);
    // 40 * 1/3 = 13.33 向下取整
    EXPECT_EQ(compute_score(make_response(true, 1, 3), make_syntax(true), make_style(0)), 63);
}

TEST(ScorerTest, BoundsTest) {
    EXPECT_EQ(compute_score(make_response(true, 5, 5), make_syntax(true), make_style(8)), 100);
    EXPECT_EQ(compute_score(make_response(false, 0, 0), make_syntax(false), make_style(0)), 10);
}

TEST(ScorerTest, StyleCapTest) {
    EXPECT_EQ(compute_score(make_response(false, 0, 1), make_syntax(false), make_style(5)), 20);
    EXPECT_EQ(compute_score(make_response(false, 0, 1), make_syntax(false), make_style(50)), 20);
}

TEST(ScorerTest, DeterministicTest) {
    execution_response response = make_response(true, 7, 9);
    structural_facts syntax = make_syntax(true);
    style_findings style = make_style(2);
    int first = compute_score(response, syntax, style);
    for (int i = 0; i < 100; ++i)
        ASSERT_EQ(compute_score(response, syntax, style), first);
}
