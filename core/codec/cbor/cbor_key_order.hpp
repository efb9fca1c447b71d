/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <cstring>

#include "common/bytes.hpp"

namespace dcbor::codec::cbor {
  /**
   * Compares canonical encodings of two map keys bytewise, regardless of key
   * type. Prefix sorts first.
   * @return negative, zero or positive
   */
  inline int compareKeys(BytesIn lhs, BytesIn rhs) {
    const auto n{std::min<size_t>(lhs.size(), rhs.size())};
    if (n != 0) {
      if (auto cmp{std::memcmp(lhs.data(), rhs.data(), n)}) {
        return cmp;
      }
    }
    if (lhs.size() == rhs.size()) {
      return 0;
    }
    return lhs.size() < rhs.size() ? -1 : 1;
  }

  struct LessCborKey {
    bool operator()(BytesIn lhs, BytesIn rhs) const {
      return compareKeys(lhs, rhs) < 0;
    }
  };
}  // namespace dcbor::codec::cbor
