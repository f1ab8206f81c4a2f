/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "cbor/cbor_value.hpp"

namespace oasis::cbor {

  /**
   * @class CborEncoder writes data items in the canonical form: shortest
   * argument encoding, definite lengths and map entries sorted by the
   * bytewise order of their encoded keys
   */
  class CborEncoder {
   public:
    CborEncoder &operator<<(const Value &value);

    const common::Buffer &data() const {
      return out_;
    }

    common::Buffer takeData() {
      return std::move(out_);
    }

   private:
    void putHeader(uint8_t major, uint64_t argument);

    common::Buffer out_;
  };

  /**
   * Encodes a single data item canonically
   */
  common::Buffer encodeValue(const Value &value);

}  // namespace oasis::cbor
