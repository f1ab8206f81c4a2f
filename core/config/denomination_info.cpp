/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/denomination_info.hpp"

namespace oasis::config {

  outcome::result<void> DenominationInfo::validate() const {
    if (symbol.empty()) {
      return ConfigError::EMPTY_SYMBOL;
    }
    if (decimals > kMaxDecimals) {
      return ConfigError::TOO_MANY_DECIMALS;
    }
    return outcome::success();
  }

}  // namespace oasis::config
