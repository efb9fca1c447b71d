/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/cbor/cbor_decode_stream.hpp"
#include "codec/cbor/cbor_encode_stream.hpp"
#include "codec/cbor/cbor_validate.hpp"

namespace dcbor::codec::cbor {
  /**
   * @brief CBOR encoding to byte-vector
   * @tparam Type to be encoded
   * @param arg data to be encoded, must produce exactly one item
   * @param limits - nesting limit
   * @return canonical encoding
   */
  template <typename T>
  outcome::result<Bytes> encode(const T &arg,
                                const CborEncodeLimits &limits = {}) {
    try {
      CborEncodeStream encoder;
      encoder << arg;
      if (encoder.count() != 1) {
        return outcome::failure(CborEncodeError::kExpectedSingleItem);
      }
      if (encoder.depth() > limits.max_depth) {
        return outcome::failure(CborEncodeError::kDepthLimitExceeded);
      }
      return encoder.data();
    } catch (std::system_error &e) {
      return outcome::failure(e.code());
    }
  }

  /**
   * @brief CBOR decoding from byte-vector
   * @tparam T - type of the value to decode
   * @param input - exactly one canonical item
   * @param limits - resource limits for untrusted input
   * @return operation result
   * @see cbor_errors.hpp for possible error cases
   */
  template <typename T>
  outcome::result<T> decode(BytesIn input,
                            const CborDecodeLimits &limits = {}) {
    try {
      T data{};
      CborDecodeStream decoder(input, limits);
      if (decoder.done()) {
        return outcome::failure(CborDecodeError::kTruncated);
      }
      decoder >> data;
      if (!decoder.done()) {
        return outcome::failure(CborDecodeError::kTrailingBytes);
      }
      return data;
    } catch (std::system_error &e) {
      return outcome::failure(e.code());
    }
  }
}  // namespace dcbor::codec::cbor
