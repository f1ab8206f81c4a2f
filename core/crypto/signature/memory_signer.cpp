/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/signature/memory_signer.hpp"

#include <boost/assert.hpp>

#include "crypto/sha/sha512_256.hpp"

namespace oasis::crypto {

  common::Hash256 prepareSignerMessage(common::BufferView context,
                                       common::BufferView message) {
    return sha512_256({context, message});
  }

  Ed25519MemorySigner::Ed25519MemorySigner(
      std::shared_ptr<Ed25519Provider> provider, Ed25519Keypair keypair)
      : provider_{std::move(provider)}, keypair_{std::move(keypair)} {
    BOOST_ASSERT(provider_ != nullptr);
  }

  outcome::result<std::shared_ptr<Ed25519MemorySigner>>
  Ed25519MemorySigner::fromSeed(std::shared_ptr<Ed25519Provider> provider,
                                const Ed25519Seed &seed) {
    OUTCOME_TRY(keypair, provider->generateKeypair(seed));
    return std::make_shared<Ed25519MemorySigner>(std::move(provider),
                                                 std::move(keypair));
  }

  PublicKey Ed25519MemorySigner::publicKey() const {
    return PublicKey{keypair_.public_key};
  }

  outcome::result<common::Buffer> Ed25519MemorySigner::sign(
      common::BufferView context, common::BufferView message) const {
    auto digest = prepareSignerMessage(context, message);
    OUTCOME_TRY(signature, provider_->sign(keypair_, digest));
    return common::Buffer(signature.view());
  }

  Secp256k1MemorySigner::Secp256k1MemorySigner(
      std::shared_ptr<Secp256k1Provider> provider, Secp256k1Keypair keypair)
      : provider_{std::move(provider)}, keypair_{std::move(keypair)} {
    BOOST_ASSERT(provider_ != nullptr);
  }

  outcome::result<std::shared_ptr<Secp256k1MemorySigner>>
  Secp256k1MemorySigner::fromSecret(
      std::shared_ptr<Secp256k1Provider> provider,
      const Secp256k1PrivateKey &secret_key) {
    OUTCOME_TRY(keypair, provider->generateKeypair(secret_key));
    return std::make_shared<Secp256k1MemorySigner>(std::move(provider),
                                                   std::move(keypair));
  }

  PublicKey Secp256k1MemorySigner::publicKey() const {
    return PublicKey{keypair_.public_key};
  }

  outcome::result<common::Buffer> Secp256k1MemorySigner::sign(
      common::BufferView context, common::BufferView message) const {
    auto digest = prepareSignerMessage(context, message);
    return provider_->signPrehashed(digest, keypair_.secret_key);
  }

}  // namespace oasis::crypto
