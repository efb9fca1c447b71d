/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>

#include "codec/cbor/cbor_common.hpp"
#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace dcbor::codec::cbor {
  /** Float as written on wire: width as additional information and bits */
  struct CborFloat {
    uint8_t extra{kExtraFloat64};
    uint64_t bits{};
  };

  /**
   * Selects narrowest of half, single and double precision which holds the
   * exact value. Every NaN is written as kCanonicalNaN.
   */
  CborFloat canonicalFloat(double value);

  /// Exact half precision bits of value, if any
  boost::optional<uint16_t> toHalf(double value);

  /// Exact single precision bits of value, if any
  boost::optional<uint32_t> toSingle(double value);

  /// Widens wire float to double, always exact
  double toDouble(const CborFloat &value);

  /**
   * Checks that wire float is the canonical encoding of its value.
   * @return kNonCanonicalNaN or kNonCanonicalFloat on violation
   */
  outcome::result<void> checkCanonicalFloat(const CborFloat &value);

  /// Appends canonical float item
  void writeFloat(Bytes &out, double value);
}  // namespace dcbor::codec::cbor
