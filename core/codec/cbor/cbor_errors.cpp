/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_errors.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(dcbor::codec::cbor, CborEncodeError, e) {
  using dcbor::codec::cbor::CborEncodeError;
  switch (e) {
    case CborEncodeError::kExpectedMapKeySingle:
      return "Expected map key single";
    case CborEncodeError::kExpectedMapValueSingle:
      return "Expected map value single";
    case CborEncodeError::kExpectedTagValueSingle:
      return "Expected tag value single";
    case CborEncodeError::kExpectedSingleItem:
      return "Expected single top-level item";
    case CborEncodeError::kDuplicateMapKey:
      return "Duplicate map key";
    case CborEncodeError::kInvalidUtf8:
      return "Text is not valid UTF-8";
    case CborEncodeError::kInvalidSimple:
      return "Reserved simple value";
    case CborEncodeError::kIntOutOfRange:
      return "Integer out of CBOR range";
    case CborEncodeError::kDepthLimitExceeded:
      return "Nesting depth limit exceeded";
    default:
      return "Unknown error";
  }
}

OUTCOME_CPP_DEFINE_CATEGORY(dcbor::codec::cbor, CborDecodeError, e) {
  using dcbor::codec::cbor::CborDecodeError;
  switch (e) {
    case CborDecodeError::kInvalidCbor:
      return "Invalid CBOR";
    case CborDecodeError::kTruncated:
      return "Truncated CBOR";
    case CborDecodeError::kWrongType:
      return "Wrong type";
    case CborDecodeError::kIntOverflow:
      return "Int overflow";
    case CborDecodeError::kWrongSize:
      return "Wrong size";
    case CborDecodeError::kKeyNotFound:
      return "Key not found";
    case CborDecodeError::kNonMinimalInt:
      return "Non-minimal integer or length encoding";
    case CborDecodeError::kIndefiniteLength:
      return "Indefinite length item";
    case CborDecodeError::kNonCanonicalFloat:
      return "Float encoded wider than necessary";
    case CborDecodeError::kNonCanonicalNaN:
      return "Non-canonical NaN";
    case CborDecodeError::kUnsortedMapKey:
      return "Map keys are not sorted";
    case CborDecodeError::kDuplicateMapKey:
      return "Duplicate map key";
    case CborDecodeError::kInvalidUtf8:
      return "Text is not valid UTF-8";
    case CborDecodeError::kInvalidSimple:
      return "Invalid simple value";
    case CborDecodeError::kDepthLimitExceeded:
      return "Nesting depth limit exceeded";
    case CborDecodeError::kLengthLimitExceeded:
      return "Length limit exceeded";
    case CborDecodeError::kTrailingBytes:
      return "Trailing bytes after item";
    case CborDecodeError::kPrecisionLoss:
      return "Float precision loss";
    default:
      return "Unknown error";
  }
}
