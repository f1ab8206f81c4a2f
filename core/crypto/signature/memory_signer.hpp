/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "crypto/ed25519_provider.hpp"
#include "crypto/secp256k1_provider.hpp"
#include "crypto/signature/signer.hpp"

namespace oasis::crypto {

  /**
   * Ed25519 signer holding the key pair in memory
   */
  class Ed25519MemorySigner : public Signer {
   public:
    Ed25519MemorySigner(std::shared_ptr<Ed25519Provider> provider,
                        Ed25519Keypair keypair);

    /**
     * Creates a signer from a 32-byte seed
     */
    static outcome::result<std::shared_ptr<Ed25519MemorySigner>> fromSeed(
        std::shared_ptr<Ed25519Provider> provider, const Ed25519Seed &seed);

    PublicKey publicKey() const override;

    outcome::result<common::Buffer> sign(
        common::BufferView context, common::BufferView message) const override;

   private:
    std::shared_ptr<Ed25519Provider> provider_;
    Ed25519Keypair keypair_;
  };

  /**
   * Secp256k1 signer holding the key pair in memory
   */
  class Secp256k1MemorySigner : public Signer {
   public:
    Secp256k1MemorySigner(std::shared_ptr<Secp256k1Provider> provider,
                          Secp256k1Keypair keypair);

    /**
     * Creates a signer from a 32-byte secret scalar
     */
    static outcome::result<std::shared_ptr<Secp256k1MemorySigner>>
    fromSecret(std::shared_ptr<Secp256k1Provider> provider,
               const Secp256k1PrivateKey &secret_key);

    PublicKey publicKey() const override;

    outcome::result<common::Buffer> sign(
        common::BufferView context, common::BufferView message) const override;

   private:
    std::shared_ptr<Secp256k1Provider> provider_;
    Secp256k1Keypair keypair_;
  };

}  // namespace oasis::crypto
