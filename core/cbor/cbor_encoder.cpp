/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cbor/cbor_encoder.hpp"

#include <algorithm>

#include "common/visitor.hpp"

namespace oasis::cbor {

  namespace major {
    constexpr uint8_t kUnsigned = 0;
    constexpr uint8_t kNegative = 1;
    constexpr uint8_t kBytes = 2;
    constexpr uint8_t kText = 3;
    constexpr uint8_t kArray = 4;
    constexpr uint8_t kMap = 5;
    constexpr uint8_t kSimple = 7;
  }  // namespace major

  namespace simple {
    constexpr uint8_t kFalse = 20;
    constexpr uint8_t kTrue = 21;
    constexpr uint8_t kNull = 22;
  }  // namespace simple

  void CborEncoder::putHeader(uint8_t major, uint64_t argument) {
    const uint8_t type = major << 5;
    if (argument < 24) {
      out_.putUint8(type | static_cast<uint8_t>(argument));
    } else if (argument <= 0xff) {
      out_.putUint8(type | 24).putUint8(static_cast<uint8_t>(argument));
    } else if (argument <= 0xffff) {
      out_.putUint8(type | 25)
          .putUint8(static_cast<uint8_t>(argument >> 8))
          .putUint8(static_cast<uint8_t>(argument));
    } else if (argument <= 0xffffffff) {
      out_.putUint8(type | 26).putUint32(static_cast<uint32_t>(argument));
    } else {
      out_.putUint8(type | 27).putUint64(argument);
    }
  }

  CborEncoder &CborEncoder::operator<<(const Value &value) {
    visit_in_place(
        value.variant(),
        [&](const Null &) { out_.putUint8((major::kSimple << 5) | simple::kNull); },
        [&](bool b) {
          out_.putUint8((major::kSimple << 5)
                        | (b ? simple::kTrue : simple::kFalse));
        },
        [&](uint64_t n) { putHeader(major::kUnsigned, n); },
        [&](const NegativeInt &n) { putHeader(major::kNegative, n.magnitude); },
        [&](const common::Buffer &bytes) {
          putHeader(major::kBytes, bytes.size());
          out_.put(bytes);
        },
        [&](const std::string &text) {
          putHeader(major::kText, text.size());
          out_.put(text);
        },
        [&](const Array &array) {
          putHeader(major::kArray, array.size());
          for (const auto &item : array) {
            *this << item;
          }
        },
        [&](const Map &map) {
          std::vector<std::pair<common::Buffer, const Value *>> entries;
          entries.reserve(map.size());
          for (const auto &[key, item] : map) {
            entries.emplace_back(encodeValue(key), &item);
          }
          std::sort(entries.begin(),
                    entries.end(),
                    [](const auto &lhs, const auto &rhs) {
                      return BufferView{lhs.first} < BufferView{rhs.first};
                    });
          putHeader(major::kMap, entries.size());
          for (const auto &[key, item] : entries) {
            out_.put(key);
            *this << *item;
          }
        });
    return *this;
  }

  common::Buffer encodeValue(const Value &value) {
    CborEncoder encoder;
    encoder << value;
    return encoder.takeData();
  }

}  // namespace oasis::cbor
