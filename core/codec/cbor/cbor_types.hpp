/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

namespace dcbor::codec::cbor {
  /** Negative integer `-1 - magnitude`, covers [-2^64, -1] */
  struct CborNegative {
    uint64_t magnitude{};
  };

  /** Tag header, followed by exactly one inner item */
  struct CborTag {
    uint64_t number{};
  };

  struct CborUndefined {};

  /** Simple value of major type 7, except floats */
  struct CborSimple {
    uint8_t value{};
  };

  inline bool operator==(const CborNegative &l, const CborNegative &r) {
    return l.magnitude == r.magnitude;
  }
  inline bool operator==(const CborTag &l, const CborTag &r) {
    return l.number == r.number;
  }
  inline bool operator==(const CborUndefined &, const CborUndefined &) {
    return true;
  }
  inline bool operator==(const CborSimple &l, const CborSimple &r) {
    return l.value == r.value;
  }
}  // namespace dcbor::codec::cbor
