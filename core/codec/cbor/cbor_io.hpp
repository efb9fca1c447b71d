/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <istream>
#include <ostream>

#include "codec/cbor/cbor_codec.hpp"

namespace dcbor::codec::cbor {
  /**
   * Encodes value and writes it to stream.
   * Nothing is written if encoding fails.
   */
  template <typename T>
  outcome::result<void> encodeTo(std::ostream &os,
                                 const T &value,
                                 const CborEncodeLimits &limits = {}) {
    OUTCOME_TRY(bytes, encode(value, limits));
    os.write(reinterpret_cast<const char *>(bytes.data()),
             static_cast<std::streamsize>(bytes.size()));
    if (!os) {
      return std::make_error_code(std::errc::io_error);
    }
    return outcome::success();
  }

  /**
   * Reads exactly one item from stream, does not read past its end.
   * @return validated bytes of item, kTruncated if stream ends before item
   */
  outcome::result<Bytes> readItem(std::istream &is,
                                  const CborDecodeLimits &limits = {});

  /// Reads and decodes exactly one item from stream
  template <typename T>
  outcome::result<T> decodeFrom(std::istream &is,
                                const CborDecodeLimits &limits = {}) {
    OUTCOME_TRY(bytes, readItem(is, limits));
    return decode<T>(bytes, limits);
  }
}  // namespace dcbor::codec::cbor
