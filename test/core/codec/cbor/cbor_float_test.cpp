/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_float.hpp"

#include <cmath>
#include <limits>

#include <boost/optional/optional_io.hpp>
#include <gtest/gtest.h>
#include "codec/cbor/cbor_codec.hpp"
#include "testutil/cbor.hpp"

using dcbor::codec::cbor::CborDecodeError;
using dcbor::codec::cbor::CborFloat;
using dcbor::codec::cbor::checkCanonicalFloat;
using dcbor::codec::cbor::decode;
using dcbor::codec::cbor::encode;
using dcbor::codec::cbor::kExtraFloat16;
using dcbor::codec::cbor::kExtraFloat32;
using dcbor::codec::cbor::kExtraFloat64;
using dcbor::codec::cbor::toDouble;
using dcbor::codec::cbor::toHalf;
using dcbor::codec::cbor::toSingle;

/**
 * @given Floats exactly representable in narrower widths
 * @when Encode
 * @then Narrowest exact width is used
 */
TEST(CborFloat, Narrowest) {
  EXPECT_OUTCOME_EQ(encode(0.0), "F90000"_unhex);
  EXPECT_OUTCOME_EQ(encode(1.0), "F93C00"_unhex);
  EXPECT_OUTCOME_EQ(encode(1.5), "F93E00"_unhex);
  EXPECT_OUTCOME_EQ(encode(-4.0), "F9C400"_unhex);
  EXPECT_OUTCOME_EQ(encode(65504.0), "F97BFF"_unhex);
  EXPECT_OUTCOME_EQ(encode(100000.0), "FA47C35000"_unhex);
  EXPECT_OUTCOME_EQ(encode(3.4028234663852886e+38), "FA7F7FFFFF"_unhex);
  EXPECT_OUTCOME_EQ(encode(1.1), "FB3FF199999999999A"_unhex);
  EXPECT_OUTCOME_EQ(encode(1.0e+300), "FB7E37E43C8800759C"_unhex);
  EXPECT_OUTCOME_EQ(encode(1.0f), "F93C00"_unhex);
}

/// Half precision subnormals
TEST(CborFloat, Subnormal) {
  EXPECT_OUTCOME_EQ(encode(5.960464477539063e-8), "F90001"_unhex);
  EXPECT_OUTCOME_EQ(encode(0.00006103515625), "F90400"_unhex);
  EXPECT_OUTCOME_EQ(decode<double>("F90001"_unhex), 5.960464477539063e-8);
  // below half subnormal range, single is exact
  EXPECT_OUTCOME_EQ(encode(2.9802322387695312e-8), "FA33000000"_unhex);
}

/// Sign of zero is kept
TEST(CborFloat, NegativeZero) {
  EXPECT_OUTCOME_EQ(encode(-0.0), "F98000"_unhex);
  EXPECT_OUTCOME_TRUE(zero, decode<double>("F98000"_unhex));
  EXPECT_EQ(zero, 0.0);
  EXPECT_TRUE(std::signbit(zero));
}

/// Infinities are half precision
TEST(CborFloat, Infinity) {
  const auto inf{std::numeric_limits<double>::infinity()};
  EXPECT_OUTCOME_EQ(encode(inf), "F97C00"_unhex);
  EXPECT_OUTCOME_EQ(encode(-inf), "F9FC00"_unhex);
  EXPECT_OUTCOME_EQ(decode<double>("F97C00"_unhex), inf);
  EXPECT_OUTCOME_EQ(decode<double>("F9FC00"_unhex), -inf);
}

/**
 * @given NaN with any payload
 * @when Encode
 * @then Single canonical NaN
 */
TEST(CborFloat, NaN) {
  EXPECT_OUTCOME_EQ(encode(std::numeric_limits<double>::quiet_NaN()),
                    "F97E00"_unhex);
  EXPECT_OUTCOME_EQ(encode(-std::numeric_limits<double>::quiet_NaN()),
                    "F97E00"_unhex);
  EXPECT_OUTCOME_EQ(encode(std::numeric_limits<float>::signaling_NaN()),
                    "F97E00"_unhex);
  EXPECT_OUTCOME_TRUE(nan, decode<double>("F97E00"_unhex));
  EXPECT_TRUE(std::isnan(nan));
}

/**
 * @given Floats wider than needed or non-canonical NaN
 * @when Decode
 * @then Rejected
 */
TEST(CborFloat, DecodeErrors) {
  expectRejected<double>("FB3FF0000000000000"_unhex,
                         CborDecodeError::kNonCanonicalFloat);
  expectRejected<double>("FA3F800000"_unhex,
                         CborDecodeError::kNonCanonicalFloat);
  expectRejected<double>("FB40F86A0000000000"_unhex,
                         CborDecodeError::kNonCanonicalFloat);
  expectRejected<double>("FA7F800000"_unhex,
                         CborDecodeError::kNonCanonicalFloat);
  expectRejected<double>("FB8000000000000000"_unhex,
                         CborDecodeError::kNonCanonicalFloat);
  expectRejected<double>("F97E01"_unhex, CborDecodeError::kNonCanonicalNaN);
  expectRejected<double>("F9FE00"_unhex, CborDecodeError::kNonCanonicalNaN);
  expectRejected<double>("F97C01"_unhex, CborDecodeError::kNonCanonicalNaN);
  expectRejected<double>("FA7FC00000"_unhex,
                         CborDecodeError::kNonCanonicalNaN);
  expectRejected<double>("FB7FF8000000000000"_unhex,
                         CborDecodeError::kNonCanonicalNaN);
}

/// Exact conversions only
TEST(CborFloat, Conversions) {
  EXPECT_EQ(toHalf(1.0), uint16_t{0x3C00});
  EXPECT_FALSE(toHalf(65520.0));
  EXPECT_FALSE(toHalf(1.1));
  EXPECT_EQ(toSingle(100000.0), uint32_t{0x47C35000});
  EXPECT_FALSE(toSingle(1.1));
  EXPECT_EQ(toDouble(CborFloat{kExtraFloat16, 0x3E00}), 1.5);
  EXPECT_EQ(toDouble(CborFloat{kExtraFloat32, 0x47C35000}), 100000.0);
  EXPECT_EQ(toDouble(CborFloat{kExtraFloat64, 0x3FF199999999999A}), 1.1);
  EXPECT_OUTCOME_TRUE_1(checkCanonicalFloat(CborFloat{kExtraFloat16, 0x7E00}));
  EXPECT_OUTCOME_ERROR(CborDecodeError::kNonCanonicalFloat,
                       checkCanonicalFloat(CborFloat{kExtraFloat32, 0}));
}
