/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/sr25519_types.hpp"
#include "outcome/outcome.hpp"

namespace oasis::crypto {

  /**
   * @class Sr25519Verifier checks schnorrkel signatures made under an
   * arbitrary signing context, with the message absorbed into the transcript
   * as its SHA-512/256 digest.
   * No implementation is built in: the schnorrkel C bindings only expose the
   * fixed "substrate" signing context, so hosts that need sr25519 signers
   * inject their own verifier.
   */
  class Sr25519Verifier {
   public:
    virtual ~Sr25519Verifier() = default;

    virtual outcome::result<bool> verify(
        const Sr25519Signature &signature,
        common::BufferView context,
        common::BufferView message,
        const Sr25519PublicKey &public_key) const = 0;
  };

}  // namespace oasis::crypto
