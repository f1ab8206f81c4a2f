/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include "config/denomination_info.hpp"
#include "config/paratime.hpp"
#include "crypto/signature/context.hpp"

namespace oasis::config {

  /**
   * Consensus network and the ParaTimes running on top of it
   */
  struct Network {
    std::string description;
    /// hex encoded 32-byte chain domain separation context
    std::string chain_context;
    /// gRPC endpoint, "unix:" prefixed for local sockets
    std::string rpc;
    DenominationInfo denomination;
    ParaTimes paratimes;

    bool operator==(const Network &) const = default;

    outcome::result<void> validate() const;

    bool isLocalRpc() const;

    /// Context transactions of \param paratime on this network are signed in
    crypto::ChainContext chainContextFor(const ParaTime &paratime) const;
  };

  using Networks = Registry<Network>;

}  // namespace oasis::config
