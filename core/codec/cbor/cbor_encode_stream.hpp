/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <string_view>

#include <boost/optional.hpp>

#include "codec/cbor/cbor_token.hpp"
#include "codec/cbor/cbor_types.hpp"

namespace dcbor::codec::cbor {
  class CborEncodeStream;

  /**
   * Cbor map entries, each key and value is encode substream holding exactly
   * one item. Entries are sorted when map is written.
   */
  struct CborMap
      : public std::vector<std::pair<CborEncodeStream, CborEncodeStream>> {
    /** Adds entry with text key */
    CborEncodeStream &operator[](std::string_view key);
    /** Adds entry with key encoded by caller */
    CborEncodeStream &add(CborEncodeStream key);
  };

  /** Encodes canonical CBOR */
  class CborEncodeStream {
   public:
    static constexpr auto is_cbor_encoder_stream = true;

    /** Encodes integer or bool */
    template <
        typename T,
        typename = std::enable_if_t<std::is_integral_v<T> || std::is_enum_v<T>>>
    CborEncodeStream &operator<<(T num) {
      if constexpr (std::is_enum_v<T>) {
        return *this << static_cast<std::underlying_type_t<T>>(num);
      } else {
        addCount(1);
        if constexpr (std::is_same_v<T, bool>) {
          writeBool(data_, num);
        } else if constexpr (std::is_unsigned_v<T>) {
          writeUint(data_, num);
        } else {
          writeInt(data_, num);
        }
      }
      return *this;
    }

    /// Encodes nullable optional value
    template <typename T>
    CborEncodeStream &operator<<(const boost::optional<T> &optional) {
      if (optional) {
        *this << *optional;
      } else {
        *this << nullptr;
      }
      return *this;
    }

    /// Encodes elements into list
    template <typename T>
    CborEncodeStream &operator<<(const gsl::span<T> &values) {
      auto l{list()};
      for (auto &value : values) {
        l << value;
      }
      return *this << l;
    }

    /// Encodes elements into map, keys order does not matter
    template <typename K, typename T, typename Less>
    CborEncodeStream &operator<<(const std::map<K, T, Less> &items) {
      auto m{map()};
      for (auto &item : items) {
        m.add(CborEncodeStream{} << item.first) << item.second;
      }
      return *this << m;
    }

    /// Encodes vector into list
    template <typename T>
    CborEncodeStream &operator<<(const std::vector<T> &values) {
      return *this << gsl::span<const T>(values.data(), values.size());
    }

    /// Encodes array into list
    template <class T, size_t size>
    CborEncodeStream &operator<<(const std::array<T, size> &values) {
      return *this << gsl::span<const T>(values.data(), size);
    }

    /** Encodes bytes */
    CborEncodeStream &operator<<(const Bytes &bytes);
    /** Encodes bytes */
    CborEncodeStream &operator<<(BytesIn bytes);
    /** Encodes UTF-8 string */
    CborEncodeStream &operator<<(std::string_view str);
    /** Encodes string literal */
    CborEncodeStream &operator<<(const char *str);
    /** Encodes float with narrowest exact width */
    CborEncodeStream &operator<<(double value);
    CborEncodeStream &operator<<(float value);
    /** Encodes negative integer by magnitude */
    CborEncodeStream &operator<<(const CborNegative &negative);
    CborEncodeStream &operator<<(const CborUndefined &);
    CborEncodeStream &operator<<(const CborSimple &simple);
    /** Encodes list, tag or sequence substream */
    CborEncodeStream &operator<<(const CborEncodeStream &other);
    /** Encodes map with canonical key order */
    CborEncodeStream &operator<<(const CborMap &map);
    /** Encodes null */
    CborEncodeStream &operator<<(std::nullptr_t);
    /** Returns CBOR bytes of encoded elements */
    Bytes data() const;
    /** Returns the number of elements */
    size_t count() const;
    /** Returns max count of arrays, maps and tags enclosing each other */
    size_t depth() const;
    /** Creates list container encode substream */
    static CborEncodeStream list();
    /** Creates map container entries */
    static CborMap map();
    /** Creates tag encode substream, expects exactly one inner element */
    static CborEncodeStream tag(uint64_t number);

   private:
    void addCount(size_t count);
    /// Number of items this stream makes when appended to another
    size_t items() const;
    /// Substream is enclosed in list or tag
    bool isContainer() const;

    bool is_list_{false};
    boost::optional<uint64_t> tag_;
    Bytes data_{};
    size_t count_{0};
    size_t depth_{0};
  };
}  // namespace dcbor::codec::cbor
