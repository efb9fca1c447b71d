/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_decode_stream.hpp"

#include <cmath>

#include "codec/cbor/cbor_validate.hpp"
#include "common/logger.hpp"
#include "common/span.hpp"

namespace dcbor::codec::cbor {
  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("cbor");
      return logger.get();
    }
  }  // namespace

  CborDecodeStream::CborDecodeStream(BytesIn data,
                                     const CborDecodeLimits &limits) {
    CborValidator validator{limits};
    if (auto res{validator.validateSequence(data)}; !res) {
      log()->debug("rejected CBOR at offset {}: {}",
                   validator.offset(),
                   res.error().message());
      outcome::raise(res.error());
    }
    partial = data;
    readToken();
  }

  CborDecodeStream::CborDecodeStream(BytesIn data, Validated)
      : partial{data} {
    readToken();
  }

  CborDecodeStream &CborDecodeStream::operator>>(BytesOut bytes) {
    auto size = bytesLength();
    if (static_cast<size_t>(bytes.size()) != size) {
      outcome::raise(CborDecodeError::kWrongSize);
    }
    BytesIn _bytes;
    if (!codec::read(_bytes, partial, size)) {
      outcome::raise(CborDecodeError::kInvalidCbor);
    }
    std::copy(_bytes.begin(), _bytes.end(), bytes.begin());
    readToken();
    return *this;
  }

  CborDecodeStream &CborDecodeStream::operator>>(Bytes &bytes) {
    bytes.resize(bytesLength());
    return *this >> BytesOut(bytes.data(), bytes.size());
  }

  CborDecodeStream &CborDecodeStream::operator>>(std::string &str) {
    BytesIn bytes;
    if (!codec::read(bytes, partial, _as(token.strSize()))) {
      outcome::raise(CborDecodeError::kInvalidCbor);
    }
    str = common::span::bytestr(bytes);
    readToken();
    return *this;
  }

  CborDecodeStream &CborDecodeStream::operator>>(double &value) {
    value = toDouble(_as(token.asFloat()));
    readToken();
    return *this;
  }

  CborDecodeStream &CborDecodeStream::operator>>(float &value) {
    const auto wide{toDouble(_as(token.asFloat()))};
    if (std::isnan(wide)) {
      value = std::numeric_limits<float>::quiet_NaN();
    } else if (toSingle(wide)) {
      value = static_cast<float>(wide);
    } else {
      outcome::raise(CborDecodeError::kPrecisionLoss);
    }
    readToken();
    return *this;
  }

  CborDecodeStream &CborDecodeStream::operator>>(CborNegative &negative) {
    negative.magnitude = _as(token.asNegative());
    readToken();
    return *this;
  }

  CborDecodeStream &CborDecodeStream::operator>>(CborTag &tag) {
    tag.number = _as(token.tagNumber());
    readToken();
    return *this;
  }

  CborDecodeStream &CborDecodeStream::operator>>(CborUndefined &) {
    if (!isUndefined()) {
      outcome::raise(CborDecodeError::kWrongType);
    }
    readToken();
    return *this;
  }

  CborDecodeStream &CborDecodeStream::operator>>(CborSimple &simple) {
    simple.value = _as(token.asSimple());
    readToken();
    return *this;
  }

  CborDecodeStream &CborDecodeStream::operator>>(std::nullptr_t) {
    if (!isNull()) {
      outcome::raise(CborDecodeError::kWrongType);
    }
    readToken();
    return *this;
  }

  CborDecodeStream CborDecodeStream::list() {
    listLength();
    CborDecodeStream stream{readNested(), Validated{}};
    stream.readToken();
    return stream;
  }

  CborMapEntries CborDecodeStream::map() {
    const auto n{mapLength()};
    readToken();
    CborMapEntries entries;
    entries.reserve(n);
    for (size_t i{}; i < n; ++i) {
      auto key{readNested()};
      auto value{readNested()};
      entries.push_back(CborMapEntry{key,
                                     CborDecodeStream{key, Validated{}},
                                     CborDecodeStream{value, Validated{}}});
    }
    return entries;
  }

  std::map<std::string, CborDecodeStream> CborDecodeStream::textMap() {
    std::map<std::string, CborDecodeStream> map;
    std::string key;
    for (auto &entry : this->map()) {
      entry.key >> key;
      map.emplace(key, entry.value);
    }
    return map;
  }

  CborDecodeStream &CborDecodeStream::named(
      std::map<std::string, CborDecodeStream> &map, const std::string &name) {
    auto it{map.find(name)};
    if (it == map.end()) {
      outcome::raise(CborDecodeError::kKeyNotFound);
    }
    return it->second;
  }

  void CborDecodeStream::readToken() {
    input = partial;
    token = {};
    if (!partial.empty()) {
      auto res{cbor::readToken(partial)};
      if (!res) {
        outcome::raise(res.error());
      }
      token = res.value();
    }
  }

  BytesIn CborDecodeStream::readNested() {
    if (!token) {
      outcome::raise(CborDecodeError::kInvalidCbor);
    }
    BytesIn nested;
    if (!cbor::readNested(nested, input)) {
      outcome::raise(CborDecodeError::kInvalidCbor);
    }
    partial = input;
    readToken();
    return nested;
  }
}  // namespace dcbor::codec::cbor
