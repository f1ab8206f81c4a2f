/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transaction/transaction_authenticator_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(oasis::transaction,
                            TransactionAuthenticatorError,
                            e) {
  using E = oasis::transaction::TransactionAuthenticatorError;
  switch (e) {
    case E::SIGNER_NOT_FOUND:
      return "Signer key is not among the transaction signer slots";
    case E::SIGNATURE_INVALID:
      return "Transaction signature verification failed";
  }
  return "Unknown transaction authenticator error";
}
