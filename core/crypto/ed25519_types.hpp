/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

extern "C" {
#include <schnorrkel/schnorrkel.h>
}

#include "common/blob.hpp"
#include "crypto/common.hpp"

namespace oasis::crypto::constants::ed25519 {
  /**
   * Important constants to deal with ed25519
   */
  enum {  // NOLINT(performance-enum-size)
    PRIVKEY_SIZE = ED25519_SECRET_KEY_LENGTH,
    PUBKEY_SIZE = ED25519_PUBLIC_KEY_LENGTH,
    SIGNATURE_SIZE = ED25519_SIGNATURE_LENGTH,
    SEED_SIZE = PRIVKEY_SIZE,
  };
}  // namespace oasis::crypto::constants::ed25519

OASIS_BLOB_STRICT_TYPEDEF(oasis::crypto,
                          Ed25519PublicKey,
                          constants::ed25519::PUBKEY_SIZE);
OASIS_BLOB_STRICT_TYPEDEF(oasis::crypto,
                          Ed25519Signature,
                          constants::ed25519::SIGNATURE_SIZE);

namespace oasis::crypto {

  struct Ed25519KeyTag;
  using Ed25519PrivateKey =
      PrivateKey<constants::ed25519::PRIVKEY_SIZE, Ed25519KeyTag>;

  struct Ed25519SeedTag;
  using Ed25519Seed = PrivateKey<constants::ed25519::SEED_SIZE, Ed25519SeedTag>;

  struct Ed25519Keypair {
    Ed25519PrivateKey secret_key;
    Ed25519PublicKey public_key;

    bool operator==(const Ed25519Keypair &other) const = default;
  };

}  // namespace oasis::crypto
