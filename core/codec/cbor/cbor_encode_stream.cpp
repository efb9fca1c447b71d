/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_encode_stream.hpp"

#include <algorithm>

#include <utf8/core.h>

#include "codec/cbor/cbor_errors.hpp"
#include "codec/cbor/cbor_key_order.hpp"
#include "common/logger.hpp"
#include "common/span.hpp"

namespace dcbor::codec::cbor {
  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("cbor");
      return logger.get();
    }

    [[noreturn]] void raise(CborEncodeError error) {
      log()->debug("encode failed: {}", make_error_code(error).message());
      outcome::raise(error);
    }
  }  // namespace

  CborEncodeStream &CborMap::operator[](std::string_view key) {
    return add(CborEncodeStream{} << key);
  }

  CborEncodeStream &CborMap::add(CborEncodeStream key) {
    emplace_back(std::move(key), CborEncodeStream{});
    return back().second;
  }

  CborEncodeStream &CborEncodeStream::operator<<(const Bytes &bytes) {
    return *this << BytesIn(bytes.data(), bytes.size());
  }

  CborEncodeStream &CborEncodeStream::operator<<(BytesIn bytes) {
    addCount(1);
    writeBytes(data_, bytes.size());
    append(data_, bytes);
    return *this;
  }

  CborEncodeStream &CborEncodeStream::operator<<(std::string_view str) {
    if (!utf8::is_valid(str.begin(), str.end())) {
      raise(CborEncodeError::kInvalidUtf8);
    }
    addCount(1);
    writeStr(data_, str.size());
    append(data_, common::span::cbytes(str));
    return *this;
  }

  CborEncodeStream &CborEncodeStream::operator<<(const char *str) {
    return *this << std::string_view{str};
  }

  CborEncodeStream &CborEncodeStream::operator<<(double value) {
    addCount(1);
    writeFloat(data_, value);
    return *this;
  }

  CborEncodeStream &CborEncodeStream::operator<<(float value) {
    return *this << static_cast<double>(value);
  }

  CborEncodeStream &CborEncodeStream::operator<<(
      const CborNegative &negative) {
    addCount(1);
    writeNegative(data_, negative.magnitude);
    return *this;
  }

  CborEncodeStream &CborEncodeStream::operator<<(const CborUndefined &) {
    addCount(1);
    writeUndefined(data_);
    return *this;
  }

  CborEncodeStream &CborEncodeStream::operator<<(const CborSimple &simple) {
    // 24..31 are reserved, 25..27 would collide with floats
    if (simple.value >= kExtraUint8 && simple.value < kMinSimple8) {
      raise(CborEncodeError::kInvalidSimple);
    }
    addCount(1);
    writeSimple(data_, simple.value);
    return *this;
  }

  CborEncodeStream &CborEncodeStream::operator<<(
      const CborEncodeStream &other) {
    if (other.tag_ && other.count_ != 1) {
      raise(CborEncodeError::kExpectedTagValueSingle);
    }
    addCount(other.items());
    if (other.is_list_) {
      writeList(data_, other.count_);
    } else if (other.tag_) {
      writeTag(data_, *other.tag_);
    }
    append(data_, other.data_);
    depth_ = std::max(depth_, other.depth());
    return *this;
  }

  CborEncodeStream &CborEncodeStream::operator<<(const CborMap &map) {
    std::vector<std::pair<Bytes, const CborEncodeStream *>> sorted;
    sorted.reserve(map.size());
    size_t depth{0};
    for (const auto &[key, value] : map) {
      if (key.items() != 1) {
        raise(CborEncodeError::kExpectedMapKeySingle);
      }
      if (value.items() != 1) {
        raise(CborEncodeError::kExpectedMapValueSingle);
      }
      sorted.emplace_back(key.data(), &value);
      depth = std::max({depth, key.depth(), value.depth()});
    }
    std::sort(sorted.begin(), sorted.end(), [](auto &l, auto &r) {
      return LessCborKey{}(l.first, r.first);
    });
    const auto duplicate{std::adjacent_find(
        sorted.begin(), sorted.end(), [](auto &l, auto &r) {
          return compareKeys(l.first, r.first) == 0;
        })};
    if (duplicate != sorted.end()) {
      raise(CborEncodeError::kDuplicateMapKey);
    }
    addCount(1);
    writeMap(data_, sorted.size());
    for (const auto &[key, value] : sorted) {
      append(data_, key);
      append(data_, value->data());
    }
    depth_ = std::max(depth_, depth + 1);
    return *this;
  }

  CborEncodeStream &CborEncodeStream::operator<<(std::nullptr_t) {
    addCount(1);
    writeNull(data_);
    return *this;
  }

  Bytes CborEncodeStream::data() const {
    Bytes result;
    if (is_list_) {
      writeList(result, count_);
    } else if (tag_) {
      if (count_ != 1) {
        raise(CborEncodeError::kExpectedTagValueSingle);
      }
      writeTag(result, *tag_);
    }
    append(result, data_);
    return result;
  }

  size_t CborEncodeStream::count() const {
    return count_;
  }

  size_t CborEncodeStream::depth() const {
    return depth_ + (isContainer() ? 1 : 0);
  }

  CborEncodeStream CborEncodeStream::list() {
    CborEncodeStream stream;
    stream.is_list_ = true;
    return stream;
  }

  CborMap CborEncodeStream::map() {
    return {};
  }

  CborEncodeStream CborEncodeStream::tag(uint64_t number) {
    CborEncodeStream stream;
    stream.tag_ = number;
    return stream;
  }

  void CborEncodeStream::addCount(size_t count) {
    count_ += count;
  }

  size_t CborEncodeStream::items() const {
    return isContainer() ? 1 : count_;
  }

  bool CborEncodeStream::isContainer() const {
    return is_list_ || tag_.has_value();
  }
}  // namespace dcbor::codec::cbor
