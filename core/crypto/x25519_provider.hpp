/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/x25519_types.hpp"
#include "outcome/outcome.hpp"

namespace oasis::crypto {

  class X25519Provider {
   public:
    virtual ~X25519Provider() = default;

    /**
     * Generates a fresh key pair from the system CSPRNG
     */
    virtual outcome::result<X25519Keypair> generateKeypair() const = 0;

    /**
     * Derives public key of a given (clamped on use) secret scalar
     */
    virtual outcome::result<X25519Keypair> keypairFromSecret(
        const X25519PrivateKey &secret_key) const = 0;

    /**
     * Diffie-Hellman over Curve25519
     * @return shared secret or error for low-order peer keys
     */
    virtual outcome::result<X25519SharedSecret> dh(
        const X25519PrivateKey &secret_key,
        const X25519PublicKey &peer_public_key) const = 0;
  };

}  // namespace oasis::crypto
