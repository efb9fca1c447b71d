/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_buffering.hpp"

#include <algorithm>
#include <limits>

namespace dcbor::codec::cbor {
  using Type = CborToken::Type;

  CborBuffering::CborBuffering(const CborDecodeLimits &limits)
      : limits{limits} {}

  bool CborBuffering::done() const {
    return moreBytes() == 0 && more_nested.empty();
  }

  void CborBuffering::reset() {
    assert(done());
    more_nested.push_back(1);
  }

  size_t CborBuffering::moreBytes() const {
    return more_bytes != 0     ? static_cast<size_t>(more_bytes)
           : more_nested.empty() ? 0
                                 : 1;
  }

  outcome::result<size_t> CborBuffering::consume(BytesIn input) {
    assert(!done());
    const auto size{static_cast<size_t>(input.size())};
    size_t consumed{};
    if (!partial_head && more_bytes != 0) {
      const auto partial{std::min<uint64_t>(more_bytes, size)};
      more_bytes -= partial;
      consumed += partial;
    }
    while (consumed < size && !more_nested.empty()) {
      if (!partial_head) {
        partial_head.emplace();
      }
      while (consumed < size && partial_head->more != 0) {
        partial_head->update(input[consumed]);
        ++consumed;
        if (partial_head->error) {
          const auto error{partial_head->error};
          partial_head.reset();
          return error;
        }
      }
      if (partial_head->more != 0) {
        break;
      }
      const auto head{partial_head->value};
      partial_head.reset();
      --more_nested.back();
      switch (head.type) {
        case Type::BYTES:
        case Type::STR: {
          if (head.extra > limits.max_length) {
            return CborDecodeError::kLengthLimitExceeded;
          }
          const auto partial{std::min<uint64_t>(head.extra, size - consumed)};
          consumed += partial;
          more_bytes = head.extra - partial;
          break;
        }
        case Type::LIST: {
          if (head.extra > limits.max_length) {
            return CborDecodeError::kLengthLimitExceeded;
          }
          OUTCOME_TRY(nest(head.extra));
          break;
        }
        case Type::MAP: {
          if (head.extra > limits.max_length
              || head.extra > std::numeric_limits<uint64_t>::max() / 2) {
            return CborDecodeError::kLengthLimitExceeded;
          }
          OUTCOME_TRY(nest(head.extra));
          // keys and values
          more_nested.back() += head.extra;
          break;
        }
        case Type::TAG: {
          OUTCOME_TRY(nest(1));
          break;
        }
        default:
          break;
      }
      while (!more_nested.empty() && more_nested.back() == 0) {
        more_nested.pop_back();
      }
    }
    return consumed;
  }

  outcome::result<void> CborBuffering::nest(uint64_t count) {
    // root slot is not a container
    if (more_nested.size() > limits.max_depth) {
      return CborDecodeError::kDepthLimitExceeded;
    }
    more_nested.push_back(count);
    return outcome::success();
  }
}  // namespace dcbor::codec::cbor
