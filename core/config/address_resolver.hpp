/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "config/network.hpp"
#include "primitives/address.hpp"

namespace oasis::config {

  /**
   * Resolves a textual account reference on \param network. Accepted forms:
   *   "oasis1..."                 bech32 address
   *   "0x" + 40 hex digits        Ethereum address
   *   "paratime:<name>"           runtime account of a configured ParaTime
   *   "pool:<name>"               module pool: rewards, common, fee-accumulator
   */
  outcome::result<primitives::Address> resolveAddress(const Network &network,
                                                      std::string_view text);

}  // namespace oasis::config
