/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

namespace dcbor::codec::cbor {
  /// Default limit of nested arrays, maps and tags
  constexpr size_t kDefaultMaxDepth{256};

  /** Resource limits for untrusted input */
  struct CborDecodeLimits {
    /// Max number of arrays, maps and tags enclosing each other
    size_t max_depth{kDefaultMaxDepth};
    /// Max claimed byte/text length or element count of one item
    uint64_t max_length{std::numeric_limits<uint64_t>::max()};
    /// Max size of whole input
    size_t max_input{std::numeric_limits<size_t>::max()};
  };

  struct CborEncodeLimits {
    size_t max_depth{kDefaultMaxDepth};
  };
}  // namespace dcbor::codec::cbor
