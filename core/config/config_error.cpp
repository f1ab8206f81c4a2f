/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/config_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(oasis::config, ConfigError, e) {
  using E = oasis::config::ConfigError;
  switch (e) {
    case E::MALFORMED_IDENTIFIER:
      return "Identifier must be non-empty and consist of letters, digits, "
             "'_' and '-'";
    case E::ALREADY_EXISTS:
      return "Entry with this name already exists";
    case E::NOT_FOUND:
      return "Entry with this name does not exist";
    case E::DEFAULT_NOT_FOUND:
      return "Default entry does not exist";
    case E::MALFORMED_CHAIN_CONTEXT:
      return "Chain context must be a hex encoded 32-byte hash";
    case E::MALFORMED_RPC:
      return "Malformed RPC endpoint";
    case E::MALFORMED_PARATIME_ID:
      return "ParaTime identifier must be hex encoded 32 bytes";
    case E::EMPTY_SYMBOL:
      return "Denomination symbol must not be empty";
    case E::TOO_MANY_DECIMALS:
      return "Denomination can not have more than 38 decimals";
    case E::MALFORMED_DENOMINATION:
      return "Malformed denomination name";
    case E::INVALID_CONSENSUS_DENOMINATION:
      return "Consensus denomination is not among the ParaTime denominations";
    case E::MALFORMED_AMOUNT:
      return "Malformed amount";
    case E::AMOUNT_OVERFLOW:
      return "Amount does not fit into 128 bits";
    case E::MALFORMED_ADDRESS:
      return "Malformed address";
    case E::UNSUPPORTED_ADDRESS_KIND:
      return "Unsupported explicit address kind";
  }
  return "Unknown config error";
}
