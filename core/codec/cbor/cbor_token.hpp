/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cassert>
#include <optional>

#include "codec/cbor/cbor_common.hpp"
#include "codec/cbor/cbor_errors.hpp"
#include "codec/cbor/cbor_float.hpp"
#include "codec/common.hpp"

namespace dcbor::codec::cbor {
  /** Header of CBOR item: major type and its argument */
  struct CborToken {
    enum Type : uint8_t {
      UINT,
      INT,
      BYTES,
      STR,
      LIST,
      MAP,
      TAG,
      SPECIAL,
      INVALID,
    };

    Type type{Type::INVALID};
    /// Additional information, low 5 bits of first byte
    uint8_t info{};
    /// Argument, or raw bits of float
    uint64_t extra{};

    constexpr operator bool() const {
      return type != Type::INVALID;
    }

    constexpr bool isFloat() const {
      return type == Type::SPECIAL && info >= kExtraFloat16
             && info <= kExtraFloat64;
    }
    constexpr bool isNull() const {
      return type == Type::SPECIAL && !isFloat() && extra == kExtraNull;
    }
    constexpr bool isUndefined() const {
      return type == Type::SPECIAL && !isFloat() && extra == kExtraUndefined;
    }
    constexpr std::optional<bool> asBool() const {
      if (type == Type::SPECIAL && !isFloat()) {
        if (extra == kExtraFalse) {
          return false;
        }
        if (extra == kExtraTrue) {
          return true;
        }
      }
      return {};
    }
    constexpr std::optional<uint64_t> asUint() const {
      if (type == Type::UINT) {
        return extra;
      }
      return {};
    }
    /// Magnitude of negative integer, value is -1 - magnitude
    constexpr std::optional<uint64_t> asNegative() const {
      if (type == Type::INT) {
        return extra;
      }
      return {};
    }
    constexpr std::optional<uint8_t> asSimple() const {
      if (type == Type::SPECIAL && !isFloat()) {
        return static_cast<uint8_t>(extra);
      }
      return {};
    }
    constexpr std::optional<CborFloat> asFloat() const {
      if (isFloat()) {
        return CborFloat{info, extra};
      }
      return {};
    }
    constexpr std::optional<uint64_t> bytesSize() const {
      if (type == Type::BYTES) {
        return extra;
      }
      return {};
    }
    constexpr std::optional<uint64_t> strSize() const {
      if (type == Type::STR) {
        return extra;
      }
      return {};
    }
    constexpr std::optional<uint64_t> listCount() const {
      if (type == Type::LIST) {
        return extra;
      }
      return {};
    }
    constexpr std::optional<uint64_t> mapCount() const {
      if (type == Type::MAP) {
        return extra;
      }
      return {};
    }
    constexpr std::optional<uint64_t> tagNumber() const {
      if (type == Type::TAG) {
        return extra;
      }
      return {};
    }
    constexpr uint64_t anySize() const {
      return type == Type::BYTES || type == Type::STR ? extra : 0;
    }
    constexpr uint64_t anyCount() const {
      return type == Type::LIST  ? extra
             : type == Type::MAP ? 2 * extra
             : type == Type::TAG ? 1
                                 : 0;
    }

    static constexpr uint8_t _first(Type type, uint8_t first) {
      return (type << 5) | first;
    }
    /// Minimal count of follow-on bytes to hold argument
    static constexpr size_t _more(uint64_t extra) {
      if (extra < kExtraUint8) {
        return 0;
      } else if (!(extra & 0xFFFFFFFFFFFFFF00)) {
        return sizeof(uint8_t);
      } else if (!(extra & 0xFFFFFFFFFFFF0000)) {
        return sizeof(uint16_t);
      } else if (!(extra & 0xFFFFFFFF00000000)) {
        return sizeof(uint32_t);
      } else {
        return sizeof(uint64_t);
      }
    }
    /// Additional information announcing `more` follow-on bytes
    static constexpr uint8_t _info(size_t more) {
      return more == sizeof(uint8_t)    ? kExtraUint8
             : more == sizeof(uint16_t) ? kExtraUint16
             : more == sizeof(uint32_t) ? kExtraUint32
                                        : kExtraUint64;
    }
  };

  constexpr BytesN<1> kNull{CborToken::_first(CborToken::SPECIAL, kExtraNull)};
  constexpr BytesN<1> kUndefined{
      CborToken::_first(CborToken::SPECIAL, kExtraUndefined)};
  constexpr BytesN<1> kFalse{
      CborToken::_first(CborToken::SPECIAL, kExtraFalse)};
  constexpr BytesN<1> kTrue{CborToken::_first(CborToken::SPECIAL, kExtraTrue)};

  /**
   * Decodes header byte by byte, checking that it is well-formed and
   * canonical: minimal argument width, no indefinite length, valid simple
   * value, canonical float.
   */
  struct CborTokenDecoder {
    CborToken value;
    size_t more{1};
    std::error_code error;

    inline void update(uint8_t byte) {
      using Type = CborToken::Type;
      assert(!error);
      assert(more);
      --more;
      if (!value) {
        value.type = static_cast<Type>(byte >> 5);
        value.info = byte & 0x1F;
        if (value.info < kExtraUint8) {
          value.extra = value.info;
        } else if (value.info <= kExtraUint64) {
          more = size_t{1} << (value.info - kExtraUint8);
        } else if (value.info == kExtraIndefinite
                   && value.type != Type::UINT && value.type != Type::INT
                   && value.type != Type::TAG) {
          // indefinite length item or break
          error = CborDecodeError::kIndefiniteLength;
          return;
        } else {
          error = CborDecodeError::kInvalidCbor;
          return;
        }
      } else {
        value.extra = (value.extra << 8) | byte;
      }
      if (!more && value.info >= kExtraUint8) {
        check();
      }
    }

   private:
    inline void check() {
      if (value.type == CborToken::Type::SPECIAL) {
        if (value.info == kExtraUint8) {
          if (value.extra < kMinSimple8) {
            error = CborDecodeError::kInvalidSimple;
          }
        } else if (auto res{checkCanonicalFloat(*value.asFloat())}; !res) {
          error = res.error();
        }
      } else if (CborToken::_info(CborToken::_more(value.extra))
                     != value.info
                 || value.extra < kExtraUint8) {
        error = CborDecodeError::kNonMinimalInt;
      }
    }
  };

  /**
   * Reads one header and advances input past it.
   * @return token, kTruncated if input ends inside header, or header error
   */
  inline outcome::result<CborToken> readToken(BytesIn &input) {
    CborTokenDecoder decoder;
    while (decoder.more) {
      if (input.empty()) {
        return CborDecodeError::kTruncated;
      }
      decoder.update(input[0]);
      if (decoder.error) {
        return decoder.error;
      }
      input = input.subspan(1);
    }
    return decoder.value;
  }

  /**
   * Reads CBOR nested item into nested and advances input to the next item.
   * Only walks structure, input must be validated beforehand.
   * @param[out] nested - read nested bytes
   * @param input - cbor bytes to read
   * @return true on success, otherwise false
   */
  inline bool readNested(BytesIn &nested, BytesIn &input) {
    const auto begin{input.data()};
    uint64_t more{1};
    while (more) {
      auto token{readToken(input)};
      if (!token) {
        nested = {};
        return false;
      }
      --more;
      BytesIn payload;
      if (!read(payload, input, token.value().anySize())) {
        nested = {};
        return false;
      }
      more += token.value().anyCount();
    }
    nested = BytesIn(begin, distance(begin, input.data()));
    return true;
  }

  struct CborTokenEncoder {
    BytesN<9> _bytes{};
    size_t length{};

    constexpr CborTokenEncoder(CborToken::Type type, uint64_t extra) {
      const auto more{CborToken::_more(extra)};
      length = 1 + more;
      if (!more) {
        _bytes[0] = CborToken::_first(type, static_cast<uint8_t>(extra));
        return;
      }
      _bytes[0] = CborToken::_first(type, CborToken::_info(more));
      for (size_t i{0}; i < more; ++i) {
        _bytes[more - i] = static_cast<uint8_t>(extra >> (8 * i));
      }
    }
    operator BytesIn() const {
      return BytesIn(_bytes.data(), length);
    }
  };

  inline void writeNull(Bytes &out) {
    append(out, kNull);
  }
  inline void writeUndefined(Bytes &out) {
    append(out, kUndefined);
  }
  inline void writeBool(Bytes &out, bool value) {
    append(out, value ? kTrue : kFalse);
  }
  inline void writeUint(Bytes &out, uint64_t value) {
    append(out, CborTokenEncoder{CborToken::Type::UINT, value});
  }
  inline void writeNegative(Bytes &out, uint64_t magnitude) {
    append(out, CborTokenEncoder{CborToken::Type::INT, magnitude});
  }
  inline void writeInt(Bytes &out, int64_t value) {
    if (value < 0) {
      writeNegative(out, ~static_cast<uint64_t>(value));
    } else {
      writeUint(out, static_cast<uint64_t>(value));
    }
  }
  inline void writeBytes(Bytes &out, size_t size) {
    append(out, CborTokenEncoder{CborToken::Type::BYTES, size});
  }
  inline void writeStr(Bytes &out, size_t size) {
    append(out, CborTokenEncoder{CborToken::Type::STR, size});
  }
  inline void writeList(Bytes &out, size_t count) {
    append(out, CborTokenEncoder{CborToken::Type::LIST, count});
  }
  inline void writeMap(Bytes &out, size_t count) {
    append(out, CborTokenEncoder{CborToken::Type::MAP, count});
  }
  inline void writeTag(Bytes &out, uint64_t number) {
    append(out, CborTokenEncoder{CborToken::Type::TAG, number});
  }
  /// Simple value, 24..31 must be rejected by caller
  inline void writeSimple(Bytes &out, uint8_t value) {
    append(out, CborTokenEncoder{CborToken::Type::SPECIAL, value});
  }
}  // namespace dcbor::codec::cbor
