/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_validate.hpp"

#include <utf8/core.h>

#include "codec/cbor/cbor_key_order.hpp"
#include "common/logger.hpp"
#include "common/span.hpp"

namespace dcbor::codec::cbor {
  using Type = CborToken::Type;

  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("cbor");
      return logger.get();
    }
  }  // namespace

  CborValidator::CborValidator(const CborDecodeLimits &limits)
      : limits_{limits} {}

  outcome::result<void> CborValidator::readNested(BytesIn &nested,
                                                  BytesIn &input) {
    begin_ = input.data();
    offset_ = 0;
    nested = {};
    if (static_cast<size_t>(input.size()) > limits_.max_input) {
      return fail(begin_, CborDecodeError::kLengthLimitExceeded);
    }
    OUTCOME_TRY(readItem(input));
    nested = BytesIn(begin_, distance(begin_, input.data()));
    return outcome::success();
  }

  outcome::result<void> CborValidator::validate(BytesIn input) {
    BytesIn nested;
    OUTCOME_TRY(readNested(nested, input));
    if (!input.empty()) {
      return fail(input.data(), CborDecodeError::kTrailingBytes);
    }
    return outcome::success();
  }

  outcome::result<void> CborValidator::validateSequence(BytesIn input) {
    begin_ = input.data();
    offset_ = 0;
    if (static_cast<size_t>(input.size()) > limits_.max_input) {
      return fail(begin_, CborDecodeError::kLengthLimitExceeded);
    }
    while (!input.empty()) {
      OUTCOME_TRY(readItem(input));
    }
    return outcome::success();
  }

  size_t CborValidator::offset() const {
    return offset_;
  }

  outcome::result<void> CborValidator::fail(const uint8_t *at,
                                            std::error_code error) {
    offset_ = distance(begin_, at);
    return outcome::failure(error);
  }

  outcome::result<void> CborValidator::readItem(BytesIn &input) {
    stack_.clear();
    do {
      const auto item{input.data()};
      if (!stack_.empty()) {
        stack_.back().child = item;
      }
      auto _token{readToken(input)};
      if (!_token) {
        return fail(item, _token.error());
      }
      const auto &token{_token.value()};
      switch (token.type) {
        case Type::BYTES:
        case Type::STR: {
          if (token.extra > limits_.max_length) {
            return fail(item, CborDecodeError::kLengthLimitExceeded);
          }
          BytesIn payload;
          if (!codec::read(payload, input, token.extra)) {
            return fail(item, CborDecodeError::kTruncated);
          }
          if (token.type == Type::STR) {
            const auto str{common::span::bytestr(payload)};
            if (!utf8::is_valid(str.begin(), str.end())) {
              return fail(item, CborDecodeError::kInvalidUtf8);
            }
          }
          break;
        }
        case Type::LIST:
        case Type::MAP:
        case Type::TAG: {
          if (stack_.size() >= limits_.max_depth) {
            return fail(item, CborDecodeError::kDepthLimitExceeded);
          }
          if (token.type != Type::TAG) {
            if (token.extra > limits_.max_length) {
              return fail(item, CborDecodeError::kLengthLimitExceeded);
            }
            // every nested item takes at least one byte
            const uint64_t remaining{static_cast<uint64_t>(input.size())};
            if (token.extra
                > (token.type == Type::MAP ? remaining / 2 : remaining)) {
              return fail(item, CborDecodeError::kTruncated);
            }
          }
          if (token.anyCount() != 0) {
            stack_.push_back(
                Frame{token.anyCount(), token.type == Type::MAP, item, {}});
            continue;
          }
          break;
        }
        default:
          break;
      }
      OUTCOME_TRY(completeItem(input.data()));
    } while (!stack_.empty());
    return outcome::success();
  }

  outcome::result<void> CborValidator::completeItem(const uint8_t *end) {
    while (!stack_.empty()) {
      auto &top{stack_.back()};
      if (top.map && top.more % 2 == 0) {
        const BytesIn key(top.child, distance(top.child, end));
        if (!top.prev_key.empty()) {
          const auto cmp{compareKeys(top.prev_key, key)};
          if (cmp == 0) {
            return fail(top.child, CborDecodeError::kDuplicateMapKey);
          }
          if (cmp > 0) {
            return fail(top.child, CborDecodeError::kUnsortedMapKey);
          }
        }
        top.prev_key = key;
      }
      if (--top.more != 0) {
        return outcome::success();
      }
      stack_.pop_back();
    }
    return outcome::success();
  }

  outcome::result<void> validate(BytesIn input,
                                 const CborDecodeLimits &limits) {
    CborValidator validator{limits};
    auto res{validator.validate(input)};
    if (!res) {
      log()->debug("rejected CBOR at offset {}: {}",
                   validator.offset(),
                   res.error().message());
    }
    return res;
  }
}  // namespace dcbor::codec::cbor
