/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "common/bytes.hpp"

namespace dcbor::common::span {
  template <typename To, typename From>
  constexpr auto cast(From *ptr) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return reinterpret_cast<To *>(ptr);
  }

  inline BytesIn cbytes(std::string_view str) {
    return BytesIn(cast<const uint8_t>(str.data()), str.size());
  }

  inline std::string_view bytestr(BytesIn span) {
    return std::string_view(cast<const char>(span.data()), span.size());
  }
}  // namespace dcbor::common::span
