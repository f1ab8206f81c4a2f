/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "crypto/deoxysii/deoxysii.hpp"
#include "crypto/x25519_provider.hpp"

namespace oasis::crypto {

  /**
   * @class MraeBox is a public-key authenticated encryption box: X25519 key
   * agreement, HMAC-SHA-512/256 key derivation and Deoxys-II sealing
   */
  class MraeBox {
   public:
    /// HMAC key used to derive the symmetric key from the X25519 secret
    static constexpr std::string_view kBoxKdfContext =
        "MRAE_Box_Deoxys-II-256-128";

    explicit MraeBox(std::shared_ptr<X25519Provider> x25519_provider);

    /**
     * Derives the symmetric key shared by the owner of \param secret_key and
     * the owner of \param peer_public_key
     */
    outcome::result<DeoxysIIKey> deriveSymmetricKey(
        const X25519PrivateKey &secret_key,
        const X25519PublicKey &peer_public_key) const;

    outcome::result<common::Buffer> seal(
        const DeoxysIINonce &nonce,
        common::BufferView plaintext,
        common::BufferView additional_data,
        const X25519PublicKey &peer_public_key,
        const X25519PrivateKey &secret_key) const;

    outcome::result<common::Buffer> open(
        const DeoxysIINonce &nonce,
        common::BufferView ciphertext,
        common::BufferView additional_data,
        const X25519PublicKey &peer_public_key,
        const X25519PrivateKey &secret_key) const;

   private:
    std::shared_ptr<X25519Provider> x25519_provider_;
  };

}  // namespace oasis::crypto
