#pragma once

#include <nlohmann/json.hpp>
#include "gtest/gtest.h"

/**
 * @brief 比较两个 JSON 值，失败时输出两边的内容和 JSON Patch 形式的差异
 * 报告中的数组和嵌套对象比较长，直接用 EXPECT_EQ 很难看出哪个字段不同
 */
inline ::testing::AssertionResult json_equal(const char *actual_expression,
                                             const char *expected_expression,
                                             const nlohmann::json &actual,
                                             const nlohmann::json &expected) {
    if (actual == expected)
        return ::testing::AssertionSuccess();
    return ::testing::AssertionFailure()
           << actual_expression << " is" << std::endl << actual.dump(2) << std::endl
           << expected_expression << " is" << std::endl << expected.dump(2) << std::endl
           << "Difference:" << std::endl << nlohmann::json::diff(actual, expected).dump(2);
}

#define EXPECT_JSON_EQ(actual, expected) EXPECT_PRED_FORMAT2(json_equal, actual, expected)
