/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "crypto/common.hpp"

namespace oasis::crypto::constants::x25519 {
  enum {  // NOLINT(performance-enum-size)
    PRIVKEY_SIZE = 32,
    PUBKEY_SIZE = 32,
    SHARED_SECRET_SIZE = 32,
  };
}  // namespace oasis::crypto::constants::x25519

OASIS_BLOB_STRICT_TYPEDEF(oasis::crypto,
                          X25519PublicKey,
                          constants::x25519::PUBKEY_SIZE);

namespace oasis::crypto {

  struct X25519KeyTag;
  using X25519PrivateKey =
      PrivateKey<constants::x25519::PRIVKEY_SIZE, X25519KeyTag>;

  struct X25519SharedSecretTag;
  using X25519SharedSecret =
      PrivateKey<constants::x25519::SHARED_SECRET_SIZE, X25519SharedSecretTag>;

  struct X25519Keypair {
    X25519PrivateKey secret_key;
    X25519PublicKey public_key;

    bool operator==(const X25519Keypair &other) const = default;
  };

}  // namespace oasis::crypto
