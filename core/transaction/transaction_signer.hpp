/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/transaction.hpp"

namespace oasis::transaction {

  /**
   * Transaction being signed. The body is encoded once, proofs are allocated
   * on the first signature and then filled slot by slot.
   */
  struct TransactionSigner {
    primitives::Transaction tx;
    primitives::UnverifiedTransaction ut;
  };

}  // namespace oasis::transaction
