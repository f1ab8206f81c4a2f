/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/buffer.hpp"
#include "outcome/outcome.hpp"

namespace oasis::common {

  enum class Bech32Error {
    INVALID_LENGTH = 1,
    INVALID_CHARACTER,
    MIXED_CASE,
    MISSING_SEPARATOR,
    INVALID_CHECKSUM,
    INVALID_PADDING,
  };

  /// Human readable part and payload of a bech32 string
  struct Bech32Data {
    std::string hrp;
    Buffer data;
  };

  /**
   * Encodes 8-bit payload as a BIP-173 bech32 string
   * @param hrp lowercase human readable prefix
   * @param data payload bytes, regrouped into 5-bit words before encoding
   */
  std::string bech32Encode(std::string_view hrp, BufferView data);

  /**
   * Decodes a BIP-173 bech32 string and regroups the payload back into bytes.
   * The returned prefix is always lowercase.
   */
  outcome::result<Bech32Data> bech32Decode(std::string_view str);

}  // namespace oasis::common

OUTCOME_HPP_DECLARE_ERROR(oasis::common, Bech32Error);
