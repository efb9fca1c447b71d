/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

namespace dcbor::codec::cbor {
  constexpr uint8_t kExtraUint8{24};
  constexpr uint8_t kExtraUint16{25};
  constexpr uint8_t kExtraUint32{26};
  constexpr uint8_t kExtraUint64{27};
  constexpr uint8_t kExtraIndefinite{31};

  constexpr uint64_t kExtraFalse{20};
  constexpr uint64_t kExtraTrue{21};
  constexpr uint64_t kExtraNull{22};
  constexpr uint64_t kExtraUndefined{23};

  /// Simple value in follow-on byte must not be below this
  constexpr uint64_t kMinSimple8{32};

  constexpr uint8_t kExtraFloat16{kExtraUint16};
  constexpr uint8_t kExtraFloat32{kExtraUint32};
  constexpr uint8_t kExtraFloat64{kExtraUint64};

  /// The only NaN allowed, half precision quiet NaN
  constexpr uint16_t kCanonicalNaN{0x7E00};
}  // namespace dcbor::codec::cbor
