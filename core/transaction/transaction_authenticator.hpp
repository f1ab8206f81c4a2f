/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "crypto/signature/context.hpp"
#include "crypto/signature/signer.hpp"
#include "transaction/transaction_authenticator_error.hpp"
#include "transaction/transaction_signer.hpp"

namespace oasis::transaction {

  /**
   * Origin of the first signature that failed verification
   */
  struct InvalidSignature {
    /// position in the batch of all signatures of the transaction
    size_t index;
    size_t slot;
    /// member of a multisig slot, nullopt for single signatures
    std::optional<size_t> sub_slot;

    bool operator==(const InvalidSignature &) const = default;
  };

  /**
   * @class TransactionAuthenticator produces and checks the proofs that bind
   * signer slots of a transaction to the keys they declare
   */
  class TransactionAuthenticator {
   public:
    virtual ~TransactionAuthenticator() = default;

    /**
     * Encodes \param tx and returns a handle without any proofs yet
     */
    virtual TransactionSigner prepareForSigning(
        primitives::Transaction tx) const = 0;

    /**
     * Adds signatures of \param signer to every slot and multisig sub-slot
     * that declares its public key.
     * @return SIGNER_NOT_FOUND when no slot declares the key
     */
    virtual outcome::result<void> appendSign(
        TransactionSigner &handle,
        const crypto::ChainContext &chain,
        const crypto::Signer &signer) const = 0;

    /**
     * Checks that every signer slot is authenticated by its proof.
     * On SIGNATURE_INVALID \param invalid holds the failing position.
     * @return decoded transaction
     */
    virtual outcome::result<primitives::Transaction> verify(
        const primitives::UnverifiedTransaction &ut,
        const crypto::ChainContext &chain,
        std::optional<InvalidSignature> &invalid) const = 0;

    outcome::result<primitives::Transaction> verify(
        const primitives::UnverifiedTransaction &ut,
        const crypto::ChainContext &chain) const {
      std::optional<InvalidSignature> invalid;
      return verify(ut, chain, invalid);
    }
  };

}  // namespace oasis::transaction
