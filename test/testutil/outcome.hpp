#ifndef CHUNKSYNC_TEST_TESTUTIL_OUTCOME_HPP
#define CHUNKSYNC_TEST_TESTUTIL_OUTCOME_HPP

#include <gtest/gtest.h>
#include <boost/preprocessor/cat.hpp>

#include "outcome/outcome.hpp"

#define OUTCOME_UNIQUE_NAME(base) BOOST_PP_CAT(base, __LINE__)

/// asserts the result holds a value and binds it to val
#define EXPECT_OUTCOME_TRUE_name(var, val, expr)                            \
  auto &&var = expr;                                                        \
  ASSERT_TRUE(var) << "Line " << __LINE__ << ": " << var.error().message(); \
  auto &&val = var.value();

#define EXPECT_OUTCOME_TRUE_void(var, expr) \
  auto &&var = expr;                        \
  ASSERT_TRUE(var) << "Line " << __LINE__ << ": " << var.error().message();

/// asserts the result holds an error and binds it to val
#define EXPECT_OUTCOME_FALSE_name(var, val, expr) \
  auto &&var = expr;                              \
  ASSERT_FALSE(var) << "Line " << __LINE__;       \
  auto &&val = var.error();

#define EXPECT_OUTCOME_TRUE(val, expr) \
  EXPECT_OUTCOME_TRUE_name(OUTCOME_UNIQUE_NAME(_r_), val, expr)

#define EXPECT_OUTCOME_TRUE_1(expr) \
  EXPECT_OUTCOME_TRUE_void(OUTCOME_UNIQUE_NAME(_v_), expr)

#define EXPECT_OUTCOME_FALSE(val, expr) \
  EXPECT_OUTCOME_FALSE_name(OUTCOME_UNIQUE_NAME(_f_), val, expr)

#define EXPECT_OUTCOME_FALSE_1(expr)                   \
  {                                                    \
    auto &&_e_ = expr;                                 \
    ASSERT_FALSE(_e_) << "Line " << __LINE__;          \
  }

/// asserts the result holds exactly the expected error
#define EXPECT_OUTCOME_ERROR(get_res, expr, expected) \
  auto &&get_res = expr;                              \
  ASSERT_FALSE(get_res) << "Line " << __LINE__;       \
  ASSERT_EQ(get_res.error(), make_error_code(expected));

#endif  // CHUNKSYNC_TEST_TESTUTIL_OUTCOME_HPP
