#pragma once

#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "gtest/gtest.h"

/**
 * @brief 比较两个 JSON 值，失败时输出两者的格式化文本和 JSON Patch 形式的差异
 * 比较使用 nlohmann::json 的 operator==，1 和 1.0 视为相等；
 * 需要区分整数和浮点数时使用 strict_equal
 */
inline ::testing::AssertionResult json_equal(const char *actual_expression,
                                             const char *expected_expression,
                                             const nlohmann::json &actual,
                                             const nlohmann::json &expected) {
    if (actual == expected) return ::testing::AssertionSuccess();

    std::stringstream ss;
    ss << std::endl
       << "  " << actual_expression << ":" << std::endl
       << actual.dump(2) << std::endl
       << "  " << expected_expression << ":" << std::endl
       << expected.dump(2) << std::endl
       << "  Difference:" << std::endl
       << nlohmann::json::diff(actual, expected).dump(2);
    return ::testing::AssertionFailure() << ss.str();
}

#define EXPECT_JSON_EQ(actual, expected) \
    EXPECT_PRED_FORMAT2(json_equal, actual, expected)

#define ASSERT_JSON_EQ(actual, expected) \
    ASSERT_PRED_FORMAT2(json_equal, actual, expected)
