/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace oasis::config {

  enum class ConfigError {
    MALFORMED_IDENTIFIER = 1,
    ALREADY_EXISTS,
    NOT_FOUND,
    DEFAULT_NOT_FOUND,
    MALFORMED_CHAIN_CONTEXT,
    MALFORMED_RPC,
    MALFORMED_PARATIME_ID,
    EMPTY_SYMBOL,
    TOO_MANY_DECIMALS,
    MALFORMED_DENOMINATION,
    INVALID_CONSENSUS_DENOMINATION,
    MALFORMED_AMOUNT,
    AMOUNT_OVERFLOW,
    MALFORMED_ADDRESS,
    UNSUPPORTED_ADDRESS_KIND,
  };

}  // namespace oasis::config

OUTCOME_HPP_DECLARE_ERROR(oasis::config, ConfigError);
