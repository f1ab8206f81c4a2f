/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace oasis::transaction {

  enum class TransactionAuthenticatorError {
    SIGNER_NOT_FOUND = 1,
    SIGNATURE_INVALID,
  };

}  // namespace oasis::transaction

OUTCOME_HPP_DECLARE_ERROR(oasis::transaction, TransactionAuthenticatorError);
