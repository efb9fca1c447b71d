/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include "common/bytes.hpp"

namespace dcbor::codec::cbor {
  std::string dumpBytes(BytesIn bytes);

  /**
   * Renders canonical items in diagnostic notation (RFC 8949 section 8),
   * items of sequence are separated with ", ".
   * Input rejected by validation renders as "(error:<hex>)".
   */
  std::string dumpCbor(BytesIn bytes);
}  // namespace dcbor::codec::cbor
