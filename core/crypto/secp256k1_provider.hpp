/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/secp256k1_types.hpp"
#include "outcome/outcome.hpp"

namespace oasis::crypto {

  /**
   * @class Secp256k1Provider provides ECDSA over secp256k1 on prehashed
   * messages, with compressed public keys and DER signatures
   */
  class Secp256k1Provider {
   public:
    virtual ~Secp256k1Provider() = default;

    /**
     * @brief derives a key pair from a secret scalar
     * @return key pair with compressed public key or error if the scalar is
     * zero or not below the curve order
     */
    virtual outcome::result<Secp256k1Keypair> generateKeypair(
        const Secp256k1PrivateKey &secret_key) const = 0;

    /**
     * @brief expands compressed public key into the 64-byte untagged point
     */
    virtual outcome::result<secp256k1::PublicKey> decompress(
        const Secp256k1PublicKey &public_key) const = 0;

    /**
     * @brief signs 32-byte digest producing low-S DER signature
     */
    virtual outcome::result<Secp256k1Signature> signPrehashed(
        const secp256k1::MessageHash &digest,
        const Secp256k1PrivateKey &secret_key) const = 0;

    /**
     * @brief verifies DER signature over 32-byte digest
     * @return false when signature does not match, error when the signature
     * or the key can not be parsed
     */
    virtual outcome::result<bool> verifyPrehashed(
        const secp256k1::MessageHash &digest,
        common::BufferView signature,
        const Secp256k1PublicKey &public_key) const = 0;
  };

}  // namespace oasis::crypto
