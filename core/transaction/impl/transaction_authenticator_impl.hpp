/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "crypto/signature/signature_verifier.hpp"
#include "log/logger.hpp"
#include "transaction/transaction_authenticator.hpp"

namespace oasis::transaction {

  class TransactionAuthenticatorImpl : public TransactionAuthenticator {
   public:
    explicit TransactionAuthenticatorImpl(
        std::shared_ptr<crypto::SignatureVerifier> verifier);

    TransactionSigner prepareForSigning(
        primitives::Transaction tx) const override;

    outcome::result<void> appendSign(
        TransactionSigner &handle,
        const crypto::ChainContext &chain,
        const crypto::Signer &signer) const override;

    using TransactionAuthenticator::verify;

    outcome::result<primitives::Transaction> verify(
        const primitives::UnverifiedTransaction &ut,
        const crypto::ChainContext &chain,
        std::optional<InvalidSignature> &invalid) const override;

   private:
    std::shared_ptr<crypto::SignatureVerifier> verifier_;
    log::Logger signer_logger_;
    log::Logger verifier_logger_;
  };

}  // namespace oasis::transaction
