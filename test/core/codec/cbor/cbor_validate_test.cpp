/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_validate.hpp"

#include <gtest/gtest.h>
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using dcbor::Bytes;
using dcbor::BytesIn;
using dcbor::codec::cbor::CborDecodeError;
using dcbor::codec::cbor::CborDecodeLimits;
using dcbor::codec::cbor::CborValidator;

struct CborValidatorTest : testing::Test {
  CborValidator validator;
};

/**
 * @given Canonical items
 * @when Validate
 * @then Accepted
 */
TEST_F(CborValidatorTest, Valid) {
  EXPECT_OUTCOME_TRUE_1(validator.validate("00"_unhex));
  EXPECT_OUTCOME_TRUE_1(validator.validate("80"_unhex));
  EXPECT_OUTCOME_TRUE_1(validator.validate("A0"_unhex));
  EXPECT_OUTCOME_TRUE_1(validator.validate("C11A514B67B0"_unhex));
  EXPECT_OUTCOME_TRUE_1(validator.validate("A26161016162820203"_unhex));
  EXPECT_OUTCOME_TRUE_1(validator.validate("62C3BC"_unhex));
  EXPECT_OUTCOME_TRUE_1(validator.validate("F8FF"_unhex));
}

/**
 * @given Item followed by more bytes
 * @when Read nested item
 * @then Item bytes returned and input advanced
 */
TEST_F(CborValidatorTest, ReadNested) {
  const auto bytes{"820102F6"_unhex};
  BytesIn input{bytes};
  BytesIn nested;
  EXPECT_OUTCOME_TRUE_1(validator.readNested(nested, input));
  EXPECT_EQ(Bytes(nested.begin(), nested.end()), "820102"_unhex);
  EXPECT_EQ(Bytes(input.begin(), input.end()), "F6"_unhex);
}

/// Sequence of zero or more items
TEST_F(CborValidatorTest, Sequence) {
  EXPECT_OUTCOME_TRUE_1(validator.validateSequence(""_unhex));
  EXPECT_OUTCOME_TRUE_1(validator.validateSequence("0102F6"_unhex));
  EXPECT_OUTCOME_ERROR(CborDecodeError::kTruncated,
                       validator.validateSequence("0182"_unhex));
  EXPECT_OUTCOME_ERROR(CborDecodeError::kTrailingBytes,
                       validator.validate("0102"_unhex));
}

/**
 * @given Invalid item nested deep inside
 * @when Validate
 * @then Offset of offending item reported
 */
TEST_F(CborValidatorTest, Offset) {
  EXPECT_OUTCOME_ERROR(CborDecodeError::kNonMinimalInt,
                       validator.validate("8301021817"_unhex));
  EXPECT_EQ(validator.offset(), 3);
  EXPECT_OUTCOME_ERROR(CborDecodeError::kUnsortedMapKey,
                       validator.validate("A2616201616102"_unhex));
  EXPECT_EQ(validator.offset(), 4);
  EXPECT_OUTCOME_ERROR(CborDecodeError::kInvalidUtf8,
                       validator.validate("82636162636261FF"_unhex));
  // header of text item, not the bad byte in its payload
  EXPECT_EQ(validator.offset(), 5);
  EXPECT_OUTCOME_ERROR(CborDecodeError::kTrailingBytes,
                       validator.validate("0000"_unhex));
  EXPECT_EQ(validator.offset(), 1);
}

/// Limits are independent per validator
TEST(CborValidator, Limits) {
  CborDecodeLimits limits;
  limits.max_depth = 1;
  CborValidator validator{limits};
  EXPECT_OUTCOME_TRUE_1(validator.validate("8101"_unhex));
  EXPECT_OUTCOME_ERROR(CborDecodeError::kDepthLimitExceeded,
                       validator.validate("8180"_unhex));
  EXPECT_EQ(validator.offset(), 1);
  EXPECT_OUTCOME_ERROR(CborDecodeError::kDepthLimitExceeded,
                       validator.validate("C1C101"_unhex));
}

/// Free function logs and reports error of single item
TEST(CborValidator, Validate) {
  EXPECT_OUTCOME_TRUE_1(dcbor::codec::cbor::validate("A0"_unhex));
  EXPECT_OUTCOME_ERROR(CborDecodeError::kIndefiniteLength,
                       dcbor::codec::cbor::validate("9FFF"_unhex));
  EXPECT_OUTCOME_ERROR(CborDecodeError::kNonCanonicalFloat,
                       dcbor::codec::cbor::validate("FB3FF0000000000000"_unhex));
  EXPECT_OUTCOME_ERROR(CborDecodeError::kInvalidUtf8,
                       dcbor::codec::cbor::validate("62FFFE"_unhex));
}
