/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/buffer.hpp"
#include "crypto/signature/public_key.hpp"
#include "outcome/outcome.hpp"

namespace oasis::crypto {

  /**
   * @class Signer produces signatures on behalf of a single key. The
   * implementation decides how context and message are combined, following
   * the conventions of its signature scheme.
   */
  class Signer {
   public:
    virtual ~Signer() = default;

    virtual PublicKey publicKey() const = 0;

    virtual outcome::result<common::Buffer> sign(
        common::BufferView context, common::BufferView message) const = 0;
  };

  /**
   * Digest that ed25519 and secp256k1 signatures are computed over:
   * SHA-512/256(context || message)
   */
  common::Hash256 prepareSignerMessage(common::BufferView context,
                                       common::BufferView message);

}  // namespace oasis::crypto
