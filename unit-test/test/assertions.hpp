#pragma once

#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "gtest/gtest.h"

/**
 * @brief 比较两个 JSON，不相等时输出两边的内容以及 JSON Patch 形式的差异
 */
inline ::testing::AssertionResult jsonEqual(const char *lhs_expression,
                                            const char *rhs_expression,
                                            const nlohmann::json &lhs,
                                            const nlohmann::json &rhs) {
    if (lhs == rhs) return ::testing::AssertionSuccess();

    std::stringstream ss;
    ss << std::endl
       << "      Expected: " << lhs_expression << std::endl
       << lhs.dump(2) << std::endl
       << "To be equal to: " << rhs_expression << std::endl
       << rhs.dump(2) << std::endl
       << "    Difference: " << std::endl
       << nlohmann::json::diff(lhs, rhs).dump(2);
    return ::testing::AssertionFailure() << ss.str();
}

#define EXPECT_JSON_EQ(obj1, obj2) \
    EXPECT_TRUE(jsonEqual(#obj1, #obj2, obj1, obj2))

#define ASSERT_JSON_EQ(obj1, obj2) \
    ASSERT_TRUE(jsonEqual(#obj1, #obj2, obj1, obj2))
