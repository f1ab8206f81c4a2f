/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include "config/config_error.hpp"

namespace oasis::config {

  /// 10^38 is the largest power of ten below 2^128
  constexpr uint8_t kMaxDecimals = 38;

  /**
   * How amounts of a denomination are shown to people
   */
  struct DenominationInfo {
    std::string symbol;
    /// number of decimal places of a base unit
    uint8_t decimals = 0;

    bool operator==(const DenominationInfo &) const = default;

    outcome::result<void> validate() const;
  };

}  // namespace oasis::config
