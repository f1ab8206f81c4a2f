/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/mrae/mrae_box.hpp"

#include <boost/assert.hpp>

#include "crypto/sha/sha512_256.hpp"

namespace oasis::crypto {

  MraeBox::MraeBox(std::shared_ptr<X25519Provider> x25519_provider)
      : x25519_provider_{std::move(x25519_provider)} {
    BOOST_ASSERT(x25519_provider_ != nullptr);
  }

  outcome::result<DeoxysIIKey> MraeBox::deriveSymmetricKey(
      const X25519PrivateKey &secret_key,
      const X25519PublicKey &peer_public_key) const {
    OUTCOME_TRY(shared, x25519_provider_->dh(secret_key, peer_public_key));
    auto key = hmacSha512_256(
        common::BufferView{std::span<const char>{kBoxKdfContext}},
        shared.unsafeBytes());
    return DeoxysIIKey::from(SecureCleanGuard{key});
  }

  outcome::result<common::Buffer> MraeBox::seal(
      const DeoxysIINonce &nonce,
      common::BufferView plaintext,
      common::BufferView additional_data,
      const X25519PublicKey &peer_public_key,
      const X25519PrivateKey &secret_key) const {
    OUTCOME_TRY(key, deriveSymmetricKey(secret_key, peer_public_key));
    DeoxysII aead{key};
    return aead.seal(nonce, plaintext, additional_data);
  }

  outcome::result<common::Buffer> MraeBox::open(
      const DeoxysIINonce &nonce,
      common::BufferView ciphertext,
      common::BufferView additional_data,
      const X25519PublicKey &peer_public_key,
      const X25519PrivateKey &secret_key) const {
    OUTCOME_TRY(key, deriveSymmetricKey(secret_key, peer_public_key));
    DeoxysII aead{key};
    return aead.open(nonce, ciphertext, additional_data);
  }

}  // namespace oasis::crypto
