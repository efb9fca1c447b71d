/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <type_traits>

#define CBOR_ENCODE(type, var)                                            \
  template <class Stream,                                                 \
            typename = std::enable_if_t<                                  \
                std::remove_reference_t<Stream>::is_cbor_encoder_stream>> \
  Stream &operator<<(Stream &&s,                                          \
                     const type &var)  // NOLINT(bugprone-macro-parentheses)

#define CBOR_DECODE(type, var)                                            \
  template <class Stream,                                                 \
            typename = std::enable_if_t<                                  \
                std::remove_reference_t<Stream>::is_cbor_decoder_stream>> \
  Stream &operator>>(Stream &&s,                                          \
                     type &var)  // NOLINT(bugprone-macro-parentheses)

// Expands member names to `t.a, t.b, ...`, up to 8 members
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_1(m) t.m
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_2(m, ...) t.m, _CBOR_FIELDS_1(__VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_3(m, ...) t.m, _CBOR_FIELDS_2(__VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_4(m, ...) t.m, _CBOR_FIELDS_3(__VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_5(m, ...) t.m, _CBOR_FIELDS_4(__VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_6(m, ...) t.m, _CBOR_FIELDS_5(__VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_7(m, ...) t.m, _CBOR_FIELDS_6(__VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_8(m, ...) t.m, _CBOR_FIELDS_7(__VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS_PICK(_1, _2, _3, _4, _5, _6, _7, _8, f, ...) f
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_FIELDS(...)                 \
  _CBOR_FIELDS_PICK(__VA_ARGS__,          \
                    _CBOR_FIELDS_8,       \
                    _CBOR_FIELDS_7,       \
                    _CBOR_FIELDS_6,       \
                    _CBOR_FIELDS_5,       \
                    _CBOR_FIELDS_4,       \
                    _CBOR_FIELDS_3,       \
                    _CBOR_FIELDS_2,       \
                    _CBOR_FIELDS_1)       \
  (__VA_ARGS__)

/**
 * Declares stream operators for struct encoded as list of its members in
 * declaration order.
 */
#define CBOR_TUPLE(T, ...)                                          \
  CBOR_ENCODE(T, t) {                                               \
    return s << dcbor::codec::cbor::encodeFields(                   \
               s.list(), _CBOR_FIELDS(__VA_ARGS__));                \
  }                                                                 \
  CBOR_DECODE(T, t) {                                               \
    dcbor::codec::cbor::decodeFields(s.list(),                      \
                                     _CBOR_FIELDS(__VA_ARGS__));    \
    return s;                                                       \
  }

namespace dcbor::codec::cbor {
  /// Appends fields to list substream
  template <typename List, typename... Fields>
  List encodeFields(List list, const Fields &...fields) {
    (list << ... << fields);
    return list;
  }

  /// Reads fields from list substream
  template <typename List, typename... Fields>
  void decodeFields(List list, Fields &...fields) {
    (list >> ... >> fields);
  }
}  // namespace dcbor::codec::cbor
