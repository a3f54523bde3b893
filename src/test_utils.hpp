#pragma once

#include <utility>

#include <gtest/gtest.h>

#include "error.hpp"

#define SUITER_CONCAT_INNER(a, b) a##b
#define SUITER_CONCAT(a, b) SUITER_CONCAT_INNER(a, b)

#define SUITER_ASSIGN_OR_FAIL_INNER(tmp, var, val)                      \
    auto tmp = val;                                                     \
    ASSERT_TRUE(tmp.has_value()) << errorMsg(tmp.error());              \
    var = std::move(tmp).value()

// Assign the value of an expected to “var”, or fail the test with
// the error.
#define ASSIGN_OR_FAIL(var, val)                                        \
    SUITER_ASSIGN_OR_FAIL_INNER(SUITER_CONCAT(assign_or_fail_tmp_,      \
                                              __COUNTER__), var, val)

// Fail the test with “code” unless “val” is an error with that code.
#define EXPECT_ERRC(val, errc)                                          \
    {                                                                   \
        auto result = val;                                              \
        ASSERT_FALSE(result.has_value());                               \
        EXPECT_EQ(result.error().code, errc) << result.error().msg;     \
    }
