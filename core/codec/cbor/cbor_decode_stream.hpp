/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <limits>
#include <map>
#include <string>

#include <boost/optional.hpp>

#include "codec/cbor/cbor_errors.hpp"
#include "codec/cbor/cbor_limits.hpp"
#include "codec/cbor/cbor_token.hpp"
#include "codec/cbor/cbor_types.hpp"
#include "codec/cbor/streams_annotation.hpp"

namespace dcbor::codec::cbor {
  struct CborMapEntry;
  using CborMapEntries = std::vector<CborMapEntry>;

  /**
   * Decodes canonical CBOR.
   * Whole input is validated on construction, so every item handed out
   * passed all canonical form checks.
   */
  class CborDecodeStream {
   public:
    static constexpr auto is_cbor_decoder_stream = true;

    /**
     * Validates data as sequence of canonical items.
     * @throws std::system_error with CborDecodeError on first violation
     */
    explicit CborDecodeStream(BytesIn data,
                              const CborDecodeLimits &limits = {});

    /** Decodes integer or bool */
    template <
        typename T,
        typename = std::enable_if_t<std::is_integral_v<T> || std::is_enum_v<T>>>
    CborDecodeStream &operator>>(T &num) {
      if constexpr (std::is_enum_v<T>) {
        std::underlying_type_t<T> value;
        *this >> value;
        num = static_cast<T>(value);
        return *this;
      } else {
        if constexpr (std::is_same_v<T, bool>) {
          num = _as(token.asBool());
        } else if constexpr (std::is_unsigned_v<T>) {
          if (token.type == CborToken::Type::INT) {
            outcome::raise(CborDecodeError::kIntOverflow);
          }
          const auto num64{_as(token.asUint())};
          if (num64 > std::numeric_limits<T>::max()) {
            outcome::raise(CborDecodeError::kIntOverflow);
          }
          num = static_cast<T>(num64);
        } else {
          constexpr auto max{
              static_cast<uint64_t>(std::numeric_limits<T>::max())};
          if (token.type == CborToken::Type::INT) {
            // -1 - magnitude >= min
            const auto magnitude{_as(token.asNegative())};
            if (magnitude > max) {
              outcome::raise(CborDecodeError::kIntOverflow);
            }
            num = static_cast<T>(-1 - static_cast<int64_t>(magnitude));
          } else {
            const auto num64{_as(token.asUint())};
            if (num64 > max) {
              outcome::raise(CborDecodeError::kIntOverflow);
            }
            num = static_cast<T>(num64);
          }
        }
        readToken();
        return *this;
      }
    }

    /// Decodes nullable optional value
    template <typename T>
    CborDecodeStream &operator>>(boost::optional<T> &optional) {
      if (isNull()) {
        optional = boost::none;
        readToken();
      } else {
        T value{};
        *this >> value;
        optional = std::move(value);
      }
      return *this;
    }

    /// Decodes list elements into vector
    template <typename T>
    CborDecodeStream &operator>>(std::vector<T> &values) {
      auto n = listLength();
      auto l = list();
      values.clear();
      values.reserve(n);
      for (auto i = 0u; i < n; ++i) {
        T value{};
        l >> value;
        values.push_back(std::move(value));
      }
      return *this;
    }

    /// Decodes map entries into map
    template <typename K, typename T, typename Less>
    CborDecodeStream &operator>>(std::map<K, T, Less> &items);

    /// Decodes bytes of exact size
    CborDecodeStream &operator>>(BytesOut bytes);
    /** Decodes bytes */
    CborDecodeStream &operator>>(Bytes &bytes);
    /** Decodes string */
    CborDecodeStream &operator>>(std::string &str);
    /** Decodes float of any width */
    CborDecodeStream &operator>>(double &value);
    /** Decodes float exactly representable in single precision */
    CborDecodeStream &operator>>(float &value);
    /** Decodes negative integer magnitude */
    CborDecodeStream &operator>>(CborNegative &negative);
    /** Decodes tag number, stream moves to tagged item */
    CborDecodeStream &operator>>(CborTag &tag);
    CborDecodeStream &operator>>(CborUndefined &);
    CborDecodeStream &operator>>(CborSimple &simple);
    /** Decodes null */
    CborDecodeStream &operator>>(std::nullptr_t);
    /** Creates list container decode substream */
    CborDecodeStream list();
    /** Skips current element */
    void next() {
      readNested();
    }
    /** Major type of current element, INVALID after last element */
    CborToken::Type type() const {
      return token.type;
    }
    /** Checks if all elements were read */
    bool done() const {
      return !token;
    }
    bool isUint() const {
      return (bool)token.asUint();
    }
    bool isNegative() const {
      return (bool)token.asNegative();
    }
    bool isInt() const {
      return isUint() || isNegative();
    }
    bool isBytes() const {
      return (bool)token.bytesSize();
    }
    bool isStr() const {
      return (bool)token.strSize();
    }
    /** Checks if current element is list container */
    bool isList() const {
      return (bool)token.listCount();
    }
    /** Checks if current element is map container */
    bool isMap() const {
      return (bool)token.mapCount();
    }
    bool isTag() const {
      return (bool)token.tagNumber();
    }
    bool isFloat() const {
      return token.isFloat();
    }
    bool isBool() const {
      return (bool)token.asBool();
    }
    bool isNull() const {
      return token.isNull();
    }
    bool isUndefined() const {
      return token.isUndefined();
    }
    bool isSimple() const {
      return (bool)token.asSimple();
    }

    /** Returns count of items in current element list container */
    size_t listLength() const {
      return _as(token.listCount());
    }
    /** Returns count of entries in current element map container */
    size_t mapLength() const {
      return _as(token.mapCount());
    }
    /// Returns bytestring length
    size_t bytesLength() const {
      return _as(token.bytesSize());
    }
    /// Returns text string length in bytes
    size_t strLength() const {
      return _as(token.strSize());
    }
    /** Reads CBOR bytes of current element (and advances to the next element)
     */
    Bytes raw() {
      return copy(readNested());
    }
    /**
     * Reads map entries in canonical key order.
     * Key order and uniqueness were verified by validation.
     */
    CborMapEntries map();
    /** Reads map with text keys */
    std::map<std::string, CborDecodeStream> textMap();
    static CborDecodeStream &named(std::map<std::string, CborDecodeStream> &map,
                                   const std::string &name);

   private:
    struct Validated {};

    CborDecodeStream(BytesIn data, Validated);

    template <typename T>
    T _as(const std::optional<T> &opt) const {
      // no token after last element as well
      if (!opt) {
        outcome::raise(CborDecodeError::kWrongType);
      }
      return *opt;
    }
    void readToken();
    BytesIn readNested();

    BytesIn partial;
    BytesIn input;
    CborToken token;
  };

  /** Map entry of validated map */
  struct CborMapEntry {
    /// Canonical encoding of key
    BytesIn key_bytes;
    CborDecodeStream key;
    CborDecodeStream value;
  };

  template <typename K, typename T, typename Less>
  CborDecodeStream &CborDecodeStream::operator>>(std::map<K, T, Less> &items) {
    items.clear();
    for (auto &entry : map()) {
      K key{};
      entry.key >> key;
      T value{};
      entry.value >> value;
      if (!items.emplace(std::move(key), std::move(value)).second) {
        outcome::raise(CborDecodeError::kDuplicateMapKey);
      }
    }
    return *this;
  }
}  // namespace dcbor::codec::cbor
