/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/outcome.hpp"

#include <gtest/gtest.h>

#include "codec/cbor/cbor_errors.hpp"
#include "testutil/outcome.hpp"

namespace dcbor {
  using codec::cbor::CborDecodeError;

  const int ret = 42;

  outcome::result<void> funcSuccess() {
    return outcome::success();
  }

  outcome::result<void> funcFailure() {
    return CborDecodeError::kTruncated;
  }

  outcome::result<int> funcSuccessReturn() {
    return ret;
  }

  outcome::result<int> funcFailureReturn() {
    return CborDecodeError::kTruncated;
  }

  outcome::result<int> funcTry(bool fail) {
    OUTCOME_TRY(fail ? funcFailure() : funcSuccess());
    OUTCOME_TRY(value, funcSuccessReturn());
    return value + 1;
  }

  /**
   * No throw on success result with no value
   */
  TEST(OutcomeExcept, OneArgNoExcept) {
    EXPECT_NO_THROW(OUTCOME_EXCEPT(funcSuccess()));
  }

  /**
   * Throw on failure result with no value
   */
  TEST(OutcomeExcept, OneArgExcept) {
    EXPECT_THROW(OUTCOME_EXCEPT(funcFailure()), std::system_error);
  }

  /**
   * No throw on success result with value returned
   */
  TEST(OutcomeExcept, ValueReturnedNoExcept) {
    OUTCOME_EXCEPT(res, funcSuccessReturn());
    EXPECT_EQ(res, ret);
  }

  /**
   * Throw on failure result with value returned
   */
  TEST(OutcomeExcept, ValueReturnedExcept) {
    EXPECT_THROW(OUTCOME_EXCEPT(funcFailureReturn()), std::system_error);
  }

  /**
   * Error propagated, value bound on success
   */
  TEST(OutcomeTry, Propagate) {
    auto ok{funcTry(false)};
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), ret + 1);
    auto failed{funcTry(true)};
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error(), std::error_code(CborDecodeError::kTruncated));
  }

  /**
   * Registered category gives message of enum value
   */
  TEST(OutcomeRegister, Message) {
    const std::error_code error{CborDecodeError::kTruncated};
    EXPECT_EQ(error.message(),
              make_error_code(CborDecodeError::kTruncated).message());
    EXPECT_FALSE(error.message().empty());
    EXPECT_EQ(&error.category(),
              &make_error_code(CborDecodeError::kWrongType).category());
    EXPECT_THROW(outcome::raise(CborDecodeError::kWrongType),
                 std::system_error);
  }

  /**
   * @given failing result and raising statement
   * @when checked against enum error literal
   * @then matched by error code
   */
  TEST(OutcomeTestMacros, EnumLiteral) {
    EXPECT_OUTCOME_ERROR(CborDecodeError::kTruncated, funcFailureReturn());
    EXPECT_OUTCOME_ERROR(CborDecodeError::kTruncated, funcFailure());
    EXPECT_OUTCOME_RAISE(CborDecodeError::kWrongType,
                         outcome::raise(CborDecodeError::kWrongType));
    EXPECT_OUTCOME_EQ(funcTry(false), ret + 1);
  }
}  // namespace dcbor
