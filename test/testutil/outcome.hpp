/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_BLOCKSWAP_TESTUTIL_OUTCOME_HPP
#define CPP_BLOCKSWAP_TESTUTIL_OUTCOME_HPP

#include <gtest/gtest.h>

#include "common/outcome.hpp"

#define PP_CAT(a, b) PP_CAT_I(a, b)
#define PP_CAT_I(a, b) PP_CAT_II(~, a##b)
#define PP_CAT_II(p, res) res

#define UNIQUE_NAME(base) PP_CAT(base, __LINE__)

#define EXPECT_OUTCOME_TRUE_void(var, expr) \
  auto &&var = expr;                        \
  EXPECT_TRUE(var) << "Line " << __LINE__ << ": " << var.error().message();

#define EXPECT_OUTCOME_TRUE_name(var, val, expr)                            \
  auto &&var = expr;                                                        \
  EXPECT_TRUE(var) << "Line " << __LINE__ << ": " << var.error().message(); \
  auto &&val = var.value();

#define EXPECT_OUTCOME_FALSE_void(var, expr) \
  auto &&var = expr;                         \
  EXPECT_FALSE(var) << "Line " << __LINE__;

#define EXPECT_OUTCOME_FALSE_name(var, val, expr) \
  auto &&var = expr;                              \
  EXPECT_FALSE(var) << "Line " << __LINE__;       \
  auto &&val = var.error();

/// Evaluates expr, expects success and binds value to name
#define EXPECT_OUTCOME_TRUE(val, expr) \
  EXPECT_OUTCOME_TRUE_name(UNIQUE_NAME(_r), val, expr)

/// Evaluates expr, expects failure and binds error to name
#define EXPECT_OUTCOME_FALSE(val, expr) \
  EXPECT_OUTCOME_FALSE_name(UNIQUE_NAME(_f), val, expr)

#define EXPECT_OUTCOME_TRUE_1(expr) \
  EXPECT_OUTCOME_TRUE_void(UNIQUE_NAME(_v), expr)

#define EXPECT_OUTCOME_FALSE_1(expr) \
  EXPECT_OUTCOME_FALSE_void(UNIQUE_NAME(_v), expr)

#define EXPECT_OUTCOME_EQ(expr, value)                       \
  {                                                          \
    auto &&_result = expr;                                   \
    ASSERT_TRUE(_result) << _result.error().message();       \
    EXPECT_EQ(_result.value(), value);                       \
  }

#define EXPECT_OUTCOME_ERROR(error, expr) \
  {                                       \
    auto &&_result = expr;                \
    ASSERT_FALSE(_result);                \
    EXPECT_EQ(_result.error(), error);    \
  }

#endif  // CPP_BLOCKSWAP_TESTUTIL_OUTCOME_HPP
