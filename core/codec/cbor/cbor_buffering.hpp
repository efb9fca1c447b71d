/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <boost/optional.hpp>

#include "codec/cbor/cbor_limits.hpp"
#include "codec/cbor/cbor_token.hpp"

namespace dcbor::codec::cbor {
  /**
   * Incrementally decodes length of cbor object bytes.
   * Headers are checked as soon as they are complete, so indefinite
   * lengths, non-minimal headers and limit overruns are reported before
   * payload arrives.
   * Does not check text and map key order, item must be validated after it
   * is framed.
   */
  struct CborBuffering {
    explicit CborBuffering(const CborDecodeLimits &limits = {});

    /// Was object fully read
    bool done() const;

    /// Reset state to read next object
    void reset();

    /// How many bytes are required to continue reading
    size_t moreBytes() const;

    /**
     * Continue reading, return bytes consumed.
     * Never consumes bytes past the end of object.
     * @return CborDecodeError of malformed header or exceeded limit
     */
    outcome::result<size_t> consume(BytesIn input);

    CborDecodeLimits limits;
    std::vector<uint64_t> more_nested;
    uint64_t more_bytes{};
    boost::optional<CborTokenDecoder> partial_head;

   private:
    outcome::result<void> nest(uint64_t count);
  };
}  // namespace dcbor::codec::cbor
