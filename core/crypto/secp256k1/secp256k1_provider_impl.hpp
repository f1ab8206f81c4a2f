/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <secp256k1.h>

#include "crypto/secp256k1_provider.hpp"
#include "log/logger.hpp"

namespace oasis::crypto {

  enum class Secp256k1ProviderError {
    INVALID_ARGUMENT = 1,
    INVALID_PUBLIC_KEY,
    INVALID_SIGNATURE_ENCODING,
    SIGN_FAILED,
    SERIALIZATION_FAILED,
  };

  class Secp256k1ProviderImpl : public Secp256k1Provider {
   public:
    ~Secp256k1ProviderImpl() override = default;

    Secp256k1ProviderImpl();

    outcome::result<Secp256k1Keypair> generateKeypair(
        const Secp256k1PrivateKey &secret_key) const override;

    outcome::result<secp256k1::PublicKey> decompress(
        const Secp256k1PublicKey &public_key) const override;

    outcome::result<Secp256k1Signature> signPrehashed(
        const secp256k1::MessageHash &digest,
        const Secp256k1PrivateKey &secret_key) const override;

    outcome::result<bool> verifyPrehashed(
        const secp256k1::MessageHash &digest,
        common::BufferView signature,
        const Secp256k1PublicKey &public_key) const override;

   private:
    outcome::result<secp256k1_pubkey> parsePublicKey(
        const Secp256k1PublicKey &public_key) const;

    std::unique_ptr<secp256k1_context, void (*)(secp256k1_context *)> context_;
    log::Logger logger_;
  };

  namespace secp256k1 {
    /**
     * Expands a compressed key without a provider instance
     * @return 64-byte untagged point or INVALID_PUBLIC_KEY
     */
    outcome::result<PublicKey> decompressPublicKey(
        const Secp256k1PublicKey &public_key);
  }  // namespace secp256k1
}  // namespace oasis::crypto

OUTCOME_HPP_DECLARE_ERROR(oasis::crypto, Secp256k1ProviderError);
