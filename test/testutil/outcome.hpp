/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <system_error>

#include <boost/outcome/try.hpp>
#include <gtest/gtest.h>

#include "common/outcome.hpp"

// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _EXPECT_OUTCOME_TRUE_NAME(var, val, expr) \
  auto &&(var) = (expr);                          \
  EXPECT_TRUE(var) << "Line " << __LINE__ << ": " \
                   << (var).error().message();    \
  auto &&(val) = (var).value();

/// Expects success and binds value to val
#define EXPECT_OUTCOME_TRUE(val, expr) \
  _EXPECT_OUTCOME_TRUE_NAME(BOOST_OUTCOME_TRY_UNIQUE_NAME, val, expr)

/// Expects success
#define EXPECT_OUTCOME_TRUE_1(expr)                                   \
  {                                                                   \
    auto &&_r = (expr);                                               \
    EXPECT_TRUE(_r) << "Line " << __LINE__ << ": "                    \
                    << _r.error().message();                          \
  }

/// Expects failure
#define EXPECT_OUTCOME_FALSE_1(expr)                                    \
  {                                                                     \
    auto &&_r = (expr);                                                 \
    EXPECT_FALSE(_r) << "Line " << __LINE__ << ": expected failure";    \
  }

/// Expects success with value equal to expected
#define EXPECT_OUTCOME_EQ(expr, expected)                              \
  {                                                                    \
    auto &&_r = (expr);                                                \
    EXPECT_TRUE(_r) << "Line " << __LINE__ << ": "                     \
                    << _r.error().message();                           \
    if (_r) {                                                          \
      EXPECT_EQ(_r.value(), expected);                                 \
    }                                                                  \
  }

/// Expects failure with given error
#define EXPECT_OUTCOME_ERROR(expected_error, expr)                    \
  {                                                                   \
    auto &&_r = (expr);                                               \
    EXPECT_FALSE(_r) << "Line " << __LINE__ << ": expected failure";  \
    if (!_r) {                                                        \
      EXPECT_EQ(_r.error(), std::error_code(expected_error))          \
          << "Line " << __LINE__ << ": " << _r.error().message();     \
    }                                                                 \
  }

/// Expects statement to raise std::system_error with given error
#define EXPECT_OUTCOME_RAISE(expected_error, statement)               \
  try {                                                               \
    statement;                                                        \
    ADD_FAILURE() << "Line " << __LINE__                              \
                  << ": " #expected_error " not raised";              \
  } catch (std::system_error & _e) {                                  \
    EXPECT_EQ(_e.code(), std::error_code(expected_error))             \
        << "Line " << __LINE__ << ": " << _e.code().message();        \
  }
