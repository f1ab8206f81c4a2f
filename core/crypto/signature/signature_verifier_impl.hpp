/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "crypto/ed25519_provider.hpp"
#include "crypto/secp256k1_provider.hpp"
#include "crypto/signature/signature_verifier.hpp"
#include "crypto/sr25519_verifier.hpp"
#include "log/logger.hpp"

namespace oasis::crypto {

  class SignatureVerifierImpl : public SignatureVerifier {
   public:
    enum class Error {
      MALFORMED_SIGNATURE = 1,
      UNSUPPORTED_SCHEME,
    };

    /**
     * @param sr25519_verifier - may be null, sr25519 signatures are then
     * rejected with UNSUPPORTED_SCHEME
     */
    SignatureVerifierImpl(std::shared_ptr<Ed25519Provider> ed25519_provider,
                          std::shared_ptr<Secp256k1Provider> secp256k1_provider,
                          std::shared_ptr<Sr25519Verifier> sr25519_verifier);

    outcome::result<bool> verify(const PublicKey &public_key,
                                 common::BufferView context,
                                 common::BufferView message,
                                 common::BufferView signature) const override;

   private:
    std::shared_ptr<Ed25519Provider> ed25519_provider_;
    std::shared_ptr<Secp256k1Provider> secp256k1_provider_;
    std::shared_ptr<Sr25519Verifier> sr25519_verifier_;
    log::Logger logger_;
  };

}  // namespace oasis::crypto

OUTCOME_HPP_DECLARE_ERROR(oasis::crypto, SignatureVerifierImpl::Error);
