/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/transaction.hpp"

namespace oasis::connection {

  /**
   * @class Connection delivers signed transactions to a runtime
   */
  class Connection {
   public:
    virtual ~Connection() = default;

    /**
     * Submits \param ut and waits for it to be executed
     * @return result of the call, possibly sealed
     */
    virtual outcome::result<primitives::CallResult> submit(
        const primitives::UnverifiedTransaction &ut) = 0;
  };

}  // namespace oasis::connection
