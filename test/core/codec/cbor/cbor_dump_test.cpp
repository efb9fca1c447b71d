/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_dump.hpp"

#include <gtest/gtest.h>
#include "testutil/literals.hpp"

using dcbor::codec::cbor::dumpCbor;

/**
 * @given Canonical items
 * @when Dump
 * @then Diagnostic notation
 */
TEST(CborDump, Items) {
  EXPECT_EQ(dumpCbor("00"_unhex), "0");
  EXPECT_EQ(dumpCbor("1BFFFFFFFFFFFFFFFF"_unhex), "18446744073709551615");
  EXPECT_EQ(dumpCbor("20"_unhex), "-1");
  EXPECT_EQ(dumpCbor("3BFFFFFFFFFFFFFFFF"_unhex), "-18446744073709551616");
  EXPECT_EQ(dumpCbor("42CAFE"_unhex), "h'cafe'");
  EXPECT_EQ(dumpCbor("6461225C62"_unhex), R"("a\"\\b")");
  EXPECT_EQ(dumpCbor("F93C00"_unhex), "1.0");
  EXPECT_EQ(dumpCbor("F93E00"_unhex), "1.5");
  EXPECT_EQ(dumpCbor("F98000"_unhex), "-0.0");
  EXPECT_EQ(dumpCbor("F97E00"_unhex), "NaN");
  EXPECT_EQ(dumpCbor("F9FC00"_unhex), "-Infinity");
  EXPECT_EQ(dumpCbor("F4"_unhex), "false");
  EXPECT_EQ(dumpCbor("F6"_unhex), "null");
  EXPECT_EQ(dumpCbor("F7"_unhex), "undefined");
  EXPECT_EQ(dumpCbor("F0"_unhex), "simple(16)");
}

/// Containers, tags and sequences
TEST(CborDump, Nested) {
  EXPECT_EQ(dumpCbor("83010203"_unhex), "[1, 2, 3]");
  EXPECT_EQ(dumpCbor("A26161016162820203"_unhex), R"({"a": 1, "b": [2, 3]})");
  EXPECT_EQ(dumpCbor("C11A514B67B0"_unhex), "1(1363896240)");
  EXPECT_EQ(dumpCbor("0102"_unhex), "1, 2");
}

/// Rejected input
TEST(CborDump, Errors) {
  EXPECT_EQ(dumpCbor(""_unhex), "(empty)");
  EXPECT_EQ(dumpCbor("9FFF"_unhex), "(error:9fff)");
  EXPECT_EQ(dumpCbor("1817"_unhex), "(error:1817)");
}
