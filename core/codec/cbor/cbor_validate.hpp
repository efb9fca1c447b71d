/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "codec/cbor/cbor_limits.hpp"
#include "codec/cbor/cbor_token.hpp"

namespace dcbor::codec::cbor {
  /**
   * Strict single pass validator of canonical CBOR items.
   * Walks nested items with explicit stack, so nesting depth is bounded by
   * limits and not by call stack.
   */
  class CborValidator {
   public:
    explicit CborValidator(const CborDecodeLimits &limits = {});

    /**
     * Validates one complete item at the beginning of input.
     * @param[out] nested - bytes of the item
     * @param input - advanced past the item on success
     */
    outcome::result<void> readNested(BytesIn &nested, BytesIn &input);

    /**
     * Validates that input is exactly one complete item.
     */
    outcome::result<void> validate(BytesIn input);

    /**
     * Validates that input is sequence of zero or more complete items.
     */
    outcome::result<void> validateSequence(BytesIn input);

    /// Offset of offending item relative to input of the last failed call
    size_t offset() const;

   private:
    struct Frame {
      /// Items left, keys and values for maps
      uint64_t more{};
      bool map{};
      /// Start of the item being read
      const uint8_t *child{};
      /// Previous key of map
      BytesIn prev_key;
    };

    outcome::result<void> fail(const uint8_t *at, std::error_code error);

    outcome::result<void> readItem(BytesIn &input);

    outcome::result<void> completeItem(const uint8_t *end);

    CborDecodeLimits limits_;
    const uint8_t *begin_{};
    size_t offset_{};
    std::vector<Frame> stack_;
  };

  /**
   * Validates that input is exactly one canonical CBOR item.
   * Logs offset of offending item.
   */
  outcome::result<void> validate(BytesIn input,
                                 const CborDecodeLimits &limits = {});
}  // namespace dcbor::codec::cbor
