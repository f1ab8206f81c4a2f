/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "common/buffer.hpp"
#include "crypto/common.hpp"

namespace oasis::crypto::secp256k1 {
  namespace constants {
    static constexpr size_t kUncompressedPublicKeySize = 65u;
    static constexpr size_t kCompressedPublicKeySize = 33u;
    static constexpr size_t kGeneralPublicKeySize = 64u;
    static constexpr size_t kPrivateKeySize = 32u;
    static constexpr size_t kMaxDerSignatureSize = 72u;
  }  // namespace constants

  /**
   * uncompressed form of public key
   */
  using UncompressedPublicKey =
      common::Blob<constants::kUncompressedPublicKeySize>;

  /**
   * truncated form of uncompressed public key, without the 0x04 tag
   */
  using PublicKey = common::Blob<constants::kGeneralPublicKeySize>;

  /**
   * 32-byte digest the ECDSA signature is computed over
   */
  using MessageHash = common::Hash256;
}  // namespace oasis::crypto::secp256k1

/**
 * compressed form of public key, the form used on the wire
 */
OASIS_BLOB_STRICT_TYPEDEF(
    oasis::crypto,
    Secp256k1PublicKey,
    oasis::crypto::secp256k1::constants::kCompressedPublicKeySize);

namespace oasis::crypto {
  struct Secp256k1KeyTag;
  using Secp256k1PrivateKey =
      PrivateKey<secp256k1::constants::kPrivateKeySize, Secp256k1KeyTag>;

  /**
   * DER-encoded ECDSA signature
   */
  using Secp256k1Signature = common::Buffer;

  struct Secp256k1Keypair {
    Secp256k1PrivateKey secret_key;
    Secp256k1PublicKey public_key;

    bool operator==(const Secp256k1Keypair &other) const = default;
  };
}  // namespace oasis::crypto
