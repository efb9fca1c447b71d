/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_float.hpp"

#include <cmath>
#include <cstring>

#include <boost/endian/conversion.hpp>

#include "codec/cbor/cbor_errors.hpp"

namespace dcbor::codec::cbor {
  namespace {
    constexpr int kMantissa64{52};
    constexpr uint64_t kMantissa64Mask{(uint64_t{1} << kMantissa64) - 1};
    constexpr uint64_t kExponent64Max{0x7FF};
    constexpr int kBias64{1023};

    /** IEEE-754 binary interchange format layout */
    struct Format {
      int mantissa;
      int exponent;

      constexpr int bias() const {
        return (1 << (exponent - 1)) - 1;
      }
      constexpr uint64_t exponentMax() const {
        return (uint64_t{1} << exponent) - 1;
      }
      constexpr uint64_t mantissaMask() const {
        return (uint64_t{1} << mantissa) - 1;
      }
    };

    constexpr Format kHalf{10, 5};
    constexpr Format kSingle{23, 8};

    uint64_t doubleBits(double value) {
      uint64_t bits{};
      std::memcpy(&bits, &value, sizeof(bits));
      return bits;
    }

    double bitsDouble(uint64_t bits) {
      double value{};
      std::memcpy(&value, &bits, sizeof(value));
      return value;
    }

    bool lowBitsZero(uint64_t value, int bits) {
      if (bits >= 64) {
        return value == 0;
      }
      return (value & ((uint64_t{1} << bits) - 1)) == 0;
    }

    /// Converts binary64 bits to narrower format if the value is kept exactly
    boost::optional<uint64_t> narrow(uint64_t bits, Format format) {
      const uint64_t sign{(bits >> 63) << (format.mantissa + format.exponent)};
      const uint64_t exponent{(bits >> kMantissa64) & kExponent64Max};
      const uint64_t mantissa{bits & kMantissa64Mask};
      const int drop{kMantissa64 - format.mantissa};
      if (exponent == kExponent64Max) {
        // infinity or NaN, payload must survive
        if (!lowBitsZero(mantissa, drop)) {
          return boost::none;
        }
        return sign | (format.exponentMax() << format.mantissa)
               | (mantissa >> drop);
      }
      if (exponent == 0) {
        if (mantissa == 0) {
          return sign;
        }
        // binary64 subnormals are below every narrower format
        return boost::none;
      }
      const int e{static_cast<int>(exponent) - kBias64};
      if (e > format.bias()) {
        return boost::none;
      }
      if (e >= 1 - format.bias()) {
        if (!lowBitsZero(mantissa, drop)) {
          return boost::none;
        }
        return sign
               | (static_cast<uint64_t>(e + format.bias()) << format.mantissa)
               | (mantissa >> drop);
      }
      // subnormal in narrow format: significand * 2^(1 - bias - mantissa)
      const int shift{(1 - format.bias() - format.mantissa)
                      - (e - kMantissa64)};
      const uint64_t significand{(uint64_t{1} << kMantissa64) | mantissa};
      if (shift >= 64 || !lowBitsZero(significand, shift)) {
        return boost::none;
      }
      return sign | (significand >> shift);
    }

    /// Converts narrower format bits to binary64 bits
    uint64_t widen(uint64_t bits, Format format) {
      const uint64_t sign{(bits >> (format.mantissa + format.exponent)) & 1};
      const uint64_t exponent{(bits >> format.mantissa)
                              & format.exponentMax()};
      uint64_t mantissa{bits & format.mantissaMask()};
      const int shift{kMantissa64 - format.mantissa};
      if (exponent == format.exponentMax()) {
        return (sign << 63) | (kExponent64Max << kMantissa64)
               | (mantissa << shift);
      }
      if (exponent == 0) {
        if (mantissa == 0) {
          return sign << 63;
        }
        int e{1 - format.bias()};
        while ((mantissa & (uint64_t{1} << format.mantissa)) == 0) {
          mantissa <<= 1;
          --e;
        }
        mantissa &= format.mantissaMask();
        return (sign << 63)
               | (static_cast<uint64_t>(e + kBias64) << kMantissa64)
               | (mantissa << shift);
      }
      const int e{static_cast<int>(exponent) - format.bias()};
      return (sign << 63) | (static_cast<uint64_t>(e + kBias64) << kMantissa64)
             | (mantissa << shift);
    }

    bool isNaN(uint64_t bits, Format format) {
      return ((bits >> format.mantissa) & format.exponentMax())
                 == format.exponentMax()
             && (bits & format.mantissaMask()) != 0;
    }
  }  // namespace

  CborFloat canonicalFloat(double value) {
    if (std::isnan(value)) {
      return {kExtraFloat16, kCanonicalNaN};
    }
    if (auto half{toHalf(value)}) {
      return {kExtraFloat16, *half};
    }
    if (auto single{toSingle(value)}) {
      return {kExtraFloat32, *single};
    }
    return {kExtraFloat64, doubleBits(value)};
  }

  boost::optional<uint16_t> toHalf(double value) {
    if (auto bits{narrow(doubleBits(value), kHalf)}) {
      return static_cast<uint16_t>(*bits);
    }
    return boost::none;
  }

  boost::optional<uint32_t> toSingle(double value) {
    if (auto bits{narrow(doubleBits(value), kSingle)}) {
      return static_cast<uint32_t>(*bits);
    }
    return boost::none;
  }

  double toDouble(const CborFloat &value) {
    switch (value.extra) {
      case kExtraFloat16:
        return bitsDouble(widen(value.bits, kHalf));
      case kExtraFloat32:
        return bitsDouble(widen(value.bits, kSingle));
      default:
        return bitsDouble(value.bits);
    }
  }

  outcome::result<void> checkCanonicalFloat(const CborFloat &value) {
    switch (value.extra) {
      case kExtraFloat16:
        if (isNaN(value.bits, kHalf) && value.bits != kCanonicalNaN) {
          return CborDecodeError::kNonCanonicalNaN;
        }
        return outcome::success();
      case kExtraFloat32:
        if (isNaN(value.bits, kSingle)) {
          return CborDecodeError::kNonCanonicalNaN;
        }
        if (toHalf(toDouble(value))) {
          return CborDecodeError::kNonCanonicalFloat;
        }
        return outcome::success();
      default:
        if (isNaN(value.bits, {kMantissa64, 11})) {
          return CborDecodeError::kNonCanonicalNaN;
        }
        if (narrow(value.bits, kSingle)) {
          return CborDecodeError::kNonCanonicalFloat;
        }
        return outcome::success();
    }
  }

  void writeFloat(Bytes &out, double value) {
    const auto wire{canonicalFloat(value)};
    // major type 7
    out.push_back(static_cast<uint8_t>(0xE0 | wire.extra));
    const auto size{out.size()};
    switch (wire.extra) {
      case kExtraFloat16:
        out.resize(size + sizeof(uint16_t));
        boost::endian::store_big_u16(&out[size],
                                     static_cast<uint16_t>(wire.bits));
        break;
      case kExtraFloat32:
        out.resize(size + sizeof(uint32_t));
        boost::endian::store_big_u32(&out[size],
                                     static_cast<uint32_t>(wire.bits));
        break;
      default:
        out.resize(size + sizeof(uint64_t));
        boost::endian::store_big_u64(&out[size], wire.bits);
        break;
    }
  }
}  // namespace dcbor::codec::cbor
