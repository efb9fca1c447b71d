/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "common/bytes.hpp"

namespace dcbor::codec {
  /// Splits first `n` bytes of input into `out`, fails if input is shorter
  inline bool read(BytesIn &out, BytesIn &input, size_t n) {
    if (static_cast<size_t>(input.size()) < n) {
      out = {};
      return false;
    }
    out = input.first(n);
    input = input.subspan(n);
    return true;
  }

  inline std::optional<BytesIn> read(BytesIn &input, size_t n) {
    BytesIn out;
    if (read(out, input, n)) {
      return out;
    }
    return {};
  }
}  // namespace dcbor::codec
