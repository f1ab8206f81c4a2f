/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "config/network.hpp"

namespace oasis::config {

  /**
   * Public networks known out of the box: mainnet (default) and testnet,
   * each with the cipher and emerald (default) ParaTimes
   */
  Networks defaultNetworks();

}  // namespace oasis::config
