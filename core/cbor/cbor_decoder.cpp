/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cbor/cbor_decoder.hpp"

#include <algorithm>

namespace oasis::cbor {

  outcome::result<Value> CborDecoder::next() {
    return decodeItem(0);
  }

  outcome::result<BufferView> CborDecoder::take(uint64_t n) {
    if (n > data_.size() - offset_) {
      return Error::NOT_ENOUGH_DATA;
    }
    BufferView chunk = data_.subspan(offset_, n);
    offset_ += n;
    return chunk;
  }

  outcome::result<uint64_t> CborDecoder::readArgument(uint8_t info) {
    if (info < 24) {
      return static_cast<uint64_t>(info);
    }
    size_t width = 0;
    switch (info) {
      case 24:
        width = 1;
        break;
      case 25:
        width = 2;
        break;
      case 26:
        width = 4;
        break;
      case 27:
        width = 8;
        break;
      case 31:
        return Error::INDEFINITE_LENGTH;
      default:
        return Error::UNSUPPORTED_ITEM;
    }
    OUTCOME_TRY(bytes, take(width));
    uint64_t argument = 0;
    for (auto b : bytes) {
      argument = (argument << 8) | b;
    }
    return argument;
  }

  outcome::result<Value> CborDecoder::decodeItem(size_t depth) {
    if (depth > kMaxDepth) {
      return Error::TOO_DEEP;
    }
    OUTCOME_TRY(head, take(1));
    const uint8_t major = head[0] >> 5;
    const uint8_t info = head[0] & 0x1f;

    if (major == 7) {
      switch (info) {
        case 20:
          return Value{false};
        case 21:
          return Value{true};
        case 22:
          return Value{};
        default:
          return Error::UNSUPPORTED_ITEM;
      }
    }
    if (major == 6) {
      return Error::UNSUPPORTED_ITEM;
    }

    OUTCOME_TRY(argument, readArgument(info));
    const size_t remaining = data_.size() - offset_;

    switch (major) {
      case 0:
        return Value{argument};
      case 1:
        return Value{NegativeInt{argument}};
      case 2: {
        OUTCOME_TRY(bytes, take(argument));
        return Value{bytes};
      }
      case 3: {
        OUTCOME_TRY(bytes, take(argument));
        return Value{bytes.toStringView()};
      }
      case 4: {
        if (argument > remaining) {
          return Error::NOT_ENOUGH_DATA;
        }
        Array array;
        array.reserve(argument);
        for (uint64_t i = 0; i < argument; ++i) {
          OUTCOME_TRY(item, decodeItem(depth + 1));
          array.emplace_back(std::move(item));
        }
        return Value{std::move(array)};
      }
      case 5: {
        if (argument > remaining / 2) {
          return Error::NOT_ENOUGH_DATA;
        }
        Map map;
        map.reserve(argument);
        std::vector<common::Buffer> keys;
        keys.reserve(argument);
        for (uint64_t i = 0; i < argument; ++i) {
          const size_t key_start = offset_;
          OUTCOME_TRY(key, decodeItem(depth + 1));
          common::Buffer key_bytes{
              data_.subspan(key_start, offset_ - key_start)};
          if (std::find(keys.begin(), keys.end(), key_bytes) != keys.end()) {
            return Error::DUPLICATE_KEY;
          }
          keys.emplace_back(std::move(key_bytes));
          OUTCOME_TRY(item, decodeItem(depth + 1));
          map.emplace_back(std::move(key), std::move(item));
        }
        return Value{std::move(map)};
      }
      default:
        break;
    }
    return Error::UNSUPPORTED_ITEM;
  }

  outcome::result<Value> decodeValue(BufferView data) {
    CborDecoder decoder{data};
    OUTCOME_TRY(value, decoder.next());
    if (decoder.hasMore()) {
      return Error::TRAILING_DATA;
    }
    return value;
  }

}  // namespace oasis::cbor
