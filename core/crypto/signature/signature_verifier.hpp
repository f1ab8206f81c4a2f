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
   * @class SignatureVerifier checks a signature over (context, message)
   * under any supported signature scheme
   */
  class SignatureVerifier {
   public:
    virtual ~SignatureVerifier() = default;

    /**
     * @return true if signature is valid, false if it does not match, error
     * if it is malformed or its scheme can not be verified
     */
    virtual outcome::result<bool> verify(const PublicKey &public_key,
                                         common::BufferView context,
                                         common::BufferView message,
                                         common::BufferView signature) const = 0;
  };

}  // namespace oasis::crypto
