/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/x25519_provider.hpp"

#include "log/logger.hpp"

namespace oasis::crypto {

  class X25519ProviderImpl : public X25519Provider {
   public:
    enum class Error {
      KEY_GENERATION_FAILED = 1,
      INVALID_KEY,
      DERIVATION_FAILED,
    };

    X25519ProviderImpl();

    outcome::result<X25519Keypair> generateKeypair() const override;

    outcome::result<X25519Keypair> keypairFromSecret(
        const X25519PrivateKey &secret_key) const override;

    outcome::result<X25519SharedSecret> dh(
        const X25519PrivateKey &secret_key,
        const X25519PublicKey &peer_public_key) const override;

   private:
    log::Logger logger_;
  };

}  // namespace oasis::crypto

OUTCOME_HPP_DECLARE_ERROR(oasis::crypto, X25519ProviderImpl::Error);
