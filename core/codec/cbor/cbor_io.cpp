/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_io.hpp"

#include <algorithm>

#include "codec/cbor/cbor_buffering.hpp"
#include "common/logger.hpp"

namespace dcbor::codec::cbor {
  namespace {
    /// Max bytes requested from stream at once
    constexpr size_t kReadChunk{4096};

    auto log() {
      static common::Logger logger = common::createLogger("cbor");
      return logger.get();
    }
  }  // namespace

  outcome::result<Bytes> readItem(std::istream &is,
                                  const CborDecodeLimits &limits) {
    CborBuffering buffering{limits};
    buffering.reset();
    Bytes item;
    while (!buffering.done()) {
      const auto more{std::min(buffering.moreBytes(), kReadChunk)};
      if (more > limits.max_input - item.size()) {
        return CborDecodeError::kLengthLimitExceeded;
      }
      const auto size{item.size()};
      item.resize(size + more);
      is.read(reinterpret_cast<char *>(item.data() + size),
              static_cast<std::streamsize>(more));
      const auto read{static_cast<size_t>(is.gcount())};
      item.resize(size + read);
      if (read == 0) {
        log()->debug("stream ended after {} bytes of item", size);
        return CborDecodeError::kTruncated;
      }
      auto consumed{buffering.consume(BytesIn(item.data() + size, read))};
      if (!consumed) {
        log()->debug("rejected CBOR in bytes from offset {}: {}",
                     size,
                     consumed.error().message());
        return consumed.error();
      }
    }
    OUTCOME_TRY(validate(item, limits));
    return item;
  }
}  // namespace dcbor::codec::cbor
