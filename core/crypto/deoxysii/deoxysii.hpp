/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>

#include "common/blob.hpp"
#include "common/buffer.hpp"
#include "crypto/common.hpp"
#include "outcome/outcome.hpp"

namespace oasis::crypto::constants::deoxysii {
  enum {  // NOLINT(performance-enum-size)
    KEY_SIZE = 32,
    NONCE_SIZE = 15,
    TAG_SIZE = 16,
    BLOCK_SIZE = 16,
    ROUNDS = 16,
  };
}  // namespace oasis::crypto::constants::deoxysii

OASIS_BLOB_STRICT_TYPEDEF(oasis::crypto,
                          DeoxysIINonce,
                          constants::deoxysii::NONCE_SIZE);

namespace oasis::crypto {

  struct DeoxysIIKeyTag;
  using DeoxysIIKey = PrivateKey<constants::deoxysii::KEY_SIZE, DeoxysIIKeyTag>;

  enum class DeoxysIIError {
    CIPHERTEXT_TOO_SHORT = 1,
    AUTHENTICATION_FAILED,
  };

  /**
   * @class DeoxysII implements the nonce-misuse-resistant Deoxys-II-256-128
   * AEAD (tweakable block cipher Deoxys-BC-384, 128-bit tags).
   * Ciphertexts are the encrypted message followed by the tag.
   */
  class DeoxysII {
   public:
    using Block = std::array<uint8_t, constants::deoxysii::BLOCK_SIZE>;

    explicit DeoxysII(const DeoxysIIKey &key);

    ~DeoxysII();

    DeoxysII(const DeoxysII &) = delete;
    DeoxysII &operator=(const DeoxysII &) = delete;

    common::Buffer seal(const DeoxysIINonce &nonce,
                        common::BufferView plaintext,
                        common::BufferView additional_data) const;

    outcome::result<common::Buffer> open(
        const DeoxysIINonce &nonce,
        common::BufferView ciphertext,
        common::BufferView additional_data) const;

   private:
    Block encryptBlock(const Block &tweak, const Block &block) const;

    Block computeTag(const DeoxysIINonce &nonce,
                     common::BufferView message,
                     common::BufferView additional_data) const;

    void applyKeystream(const Block &tag,
                        const DeoxysIINonce &nonce,
                        common::BufferView in,
                        uint8_t *out) const;

    /// key-dependent part of the round subkeys, STK without the tweak
    std::array<Block, constants::deoxysii::ROUNDS + 1> derived_keys_;
  };

}  // namespace oasis::crypto

OUTCOME_HPP_DECLARE_ERROR(oasis::crypto, DeoxysIIError);
