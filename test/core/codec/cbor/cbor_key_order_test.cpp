/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_key_order.hpp"

#include <algorithm>

#include <gtest/gtest.h>
#include "testutil/literals.hpp"

using dcbor::Bytes;
using dcbor::codec::cbor::compareKeys;
using dcbor::codec::cbor::LessCborKey;

/**
 * @given Encoded keys
 * @when Compare
 * @then Bytewise order, prefix first
 */
TEST(CborKeyOrder, Compare) {
  EXPECT_EQ(compareKeys("01"_unhex, "01"_unhex), 0);
  EXPECT_LT(compareKeys("01"_unhex, "02"_unhex), 0);
  EXPECT_GT(compareKeys("20"_unhex, "1818"_unhex), 0);
  EXPECT_LT(compareKeys("6161"_unhex, "616161"_unhex), 0);
  EXPECT_GT(compareKeys("626161"_unhex, "6162"_unhex), 0);
  EXPECT_EQ(compareKeys(""_unhex, ""_unhex), 0);
}

/// Keys of mixed types sorted by encoding
TEST(CborKeyOrder, Sort) {
  std::vector<Bytes> keys{
      "6161"_unhex, "20"_unhex, "F4"_unhex, "1818"_unhex, "0A"_unhex};
  std::sort(keys.begin(), keys.end(), LessCborKey{});
  EXPECT_EQ(keys,
            (std::vector<Bytes>{"0A"_unhex,
                                "1818"_unhex,
                                "20"_unhex,
                                "6161"_unhex,
                                "F4"_unhex}));
}
