/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "cbor/cbor_error.hpp"
#include "cbor/cbor_value.hpp"

namespace oasis::cbor {

  /**
   * @class CborDecoder reads data items from a byte stream. Indefinite
   * lengths, tags, floating point values and duplicate map keys are rejected
   */
  class CborDecoder {
   public:
    static constexpr size_t kMaxDepth = 64;

    explicit CborDecoder(BufferView data) : data_{data} {}

    outcome::result<Value> next();

    bool hasMore() const {
      return offset_ < data_.size();
    }

   private:
    outcome::result<Value> decodeItem(size_t depth);
    outcome::result<uint64_t> readArgument(uint8_t info);
    outcome::result<BufferView> take(uint64_t n);

    BufferView data_;
    size_t offset_ = 0;
  };

  /**
   * Decodes exactly one data item occupying the whole input
   */
  outcome::result<Value> decodeValue(BufferView data);

}  // namespace oasis::cbor
