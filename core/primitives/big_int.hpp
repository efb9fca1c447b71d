/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <limits>

#include <boost/multiprecision/cpp_int.hpp>

#include "codec/cbor/cbor_errors.hpp"
#include "codec/cbor/cbor_types.hpp"
#include "codec/cbor/streams_annotation.hpp"

namespace dcbor::primitives {
  using BigInt = boost::multiprecision::cpp_int;

  /// Largest integer representable as CBOR integer item, 2^64 - 1
  inline const BigInt kMaxCborInt{std::numeric_limits<uint64_t>::max()};
  /// Smallest integer representable as CBOR integer item, -2^64
  inline const BigInt kMinCborInt{-1 - kMaxCborInt};
}  // namespace dcbor::primitives

namespace boost::multiprecision {
  /// Encodes as plain integer item, fails outside [-2^64, 2^64 - 1]
  CBOR_ENCODE(cpp_int, big_int) {
    using dcbor::codec::cbor::CborEncodeError;
    if (big_int > dcbor::primitives::kMaxCborInt
        || big_int < dcbor::primitives::kMinCborInt) {
      dcbor::outcome::raise(CborEncodeError::kIntOutOfRange);
    }
    if (big_int < 0) {
      const cpp_int magnitude{-1 - big_int};
      return s << dcbor::codec::cbor::CborNegative{
                 magnitude.convert_to<uint64_t>()};
    }
    return s << big_int.convert_to<uint64_t>();
  }

  CBOR_DECODE(cpp_int, big_int) {
    if (s.isNegative()) {
      dcbor::codec::cbor::CborNegative negative;
      s >> negative;
      big_int = -1 - cpp_int{negative.magnitude};
    } else {
      uint64_t value{};
      s >> value;
      big_int = value;
    }
    return s;
  }
}  // namespace boost::multiprecision
