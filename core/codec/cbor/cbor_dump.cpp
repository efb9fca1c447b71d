/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_dump.hpp"

#include <cmath>

#include <boost/multiprecision/cpp_int.hpp>
#include <fmt/format.h>
#include <libp2p/common/hexutil.hpp>

#include "codec/cbor/cbor_decode_stream.hpp"
#include "common/logger.hpp"

namespace dcbor::codec::cbor {
  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("cbor");
      return logger.get();
    }

    void dumpText(std::string &o, const std::string &str) {
      o += '"';
      for (auto c : str) {
        if (c == '"' || c == '\\') {
          o += '\\';
        }
        o += c;
      }
      o += '"';
    }

    void dumpFloat(std::string &o, double value) {
      if (std::isnan(value)) {
        o += "NaN";
      } else if (std::isinf(value)) {
        o += value < 0 ? "-Infinity" : "Infinity";
      } else {
        auto str{fmt::format("{}", value)};
        if (str.find_first_of(".e") == std::string::npos) {
          str += ".0";
        }
        o += str;
      }
    }

    // NOLINTNEXTLINE(readability-function-cognitive-complexity)
    void dumpCbor(std::string &o, CborDecodeStream &s) {
      if (s.isList()) {
        o += "[";
        auto n{s.listLength()};
        auto list{s.list()};
        for (auto i{0u}; i < n; ++i) {
          if (i != 0) {
            o += ", ";
          }
          dumpCbor(o, list);
        }
        o += "]";
      } else if (s.isMap()) {
        o += "{";
        auto comma{false};
        for (auto &entry : s.map()) {
          if (comma) {
            o += ", ";
          } else {
            comma = true;
          }
          dumpCbor(o, entry.key);
          o += ": ";
          dumpCbor(o, entry.value);
        }
        o += "}";
      } else if (s.isTag()) {
        CborTag tag;
        s >> tag;
        o += std::to_string(tag.number) + "(";
        dumpCbor(o, s);
        o += ")";
      } else if (s.isBytes()) {
        Bytes bytes;
        s >> bytes;
        o += "h'" + dumpBytes(bytes) + "'";
      } else if (s.isStr()) {
        std::string str;
        s >> str;
        dumpText(o, str);
      } else if (s.isUint()) {
        uint64_t u{};
        s >> u;
        o += std::to_string(u);
      } else if (s.isNegative()) {
        CborNegative negative;
        s >> negative;
        boost::multiprecision::cpp_int value{-1};
        value -= negative.magnitude;
        o += value.str();
      } else if (s.isFloat()) {
        double value{};
        s >> value;
        dumpFloat(o, value);
      } else if (s.isBool()) {
        bool b{};
        s >> b;
        o += b ? "true" : "false";
      } else if (s.isNull()) {
        o += "null";
        s.next();
      } else if (s.isUndefined()) {
        o += "undefined";
        s.next();
      } else {
        CborSimple simple;
        s >> simple;
        o += "simple(" + std::to_string(simple.value) + ")";
      }
    }
  }  // namespace

  std::string dumpBytes(BytesIn bytes) {
    return libp2p::common::hex_lower(bytes);
  }

  std::string dumpCbor(BytesIn bytes) {
    if (bytes.empty()) {
      return "(empty)";
    }
    try {
      std::string o;
      CborDecodeStream s{bytes};
      while (!s.done()) {
        if (!o.empty()) {
          o += ", ";
        }
        dumpCbor(o, s);
      }
      return o;
    } catch (std::system_error &e) {
      log()->debug("dump of malformed CBOR: {}", e.code().message());
      return "(error:" + dumpBytes(bytes) + ")";
    }
  }
}  // namespace dcbor::codec::cbor
