/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/network.hpp"

#include <algorithm>

namespace oasis::config {

  outcome::result<void> Network::validate() const {
    if (not common::Hash256::fromHex(chain_context)) {
      return ConfigError::MALFORMED_CHAIN_CONTEXT;
    }
    auto bad_char = [](char c) {
      return static_cast<unsigned char>(c) <= ' ' or c == '\x7f';
    };
    if (std::ranges::any_of(rpc, bad_char)) {
      return ConfigError::MALFORMED_RPC;
    }
    OUTCOME_TRY(denomination.validate());
    OUTCOME_TRY(paratimes.validate());
    return outcome::success();
  }

  bool Network::isLocalRpc() const {
    return rpc.starts_with("unix:");
  }

  crypto::ChainContext Network::chainContextFor(const ParaTime &paratime) const {
    return crypto::ChainContext{.runtime_id = paratime.id,
                                .consensus_chain_context = chain_context};
  }

}  // namespace oasis::config
