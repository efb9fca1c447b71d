/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace dcbor::codec::cbor {
  enum class CborEncodeError {
    kExpectedMapKeySingle = 1,
    kExpectedMapValueSingle,
    kExpectedTagValueSingle,
    kExpectedSingleItem,
    kDuplicateMapKey,
    kInvalidUtf8,
    kInvalidSimple,
    kIntOutOfRange,
    kDepthLimitExceeded,
  };

  enum class CborDecodeError {
    kInvalidCbor = 1,
    kTruncated,
    kWrongType,
    kIntOverflow,
    kWrongSize,
    kKeyNotFound,
    kNonMinimalInt,
    kIndefiniteLength,
    kNonCanonicalFloat,
    kNonCanonicalNaN,
    kUnsortedMapKey,
    kDuplicateMapKey,
    kInvalidUtf8,
    kInvalidSimple,
    kDepthLimitExceeded,
    kLengthLimitExceeded,
    kTrailingBytes,
    kPrecisionLoss,
  };
}  // namespace dcbor::codec::cbor

OUTCOME_HPP_DECLARE_ERROR(dcbor::codec::cbor, CborEncodeError);
OUTCOME_HPP_DECLARE_ERROR(dcbor::codec::cbor, CborDecodeError);
