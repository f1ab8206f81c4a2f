/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "crypto/sr25519_verifier.hpp"

namespace oasis::crypto {

  class Sr25519VerifierMock : public Sr25519Verifier {
   public:
    MOCK_METHOD(outcome::result<bool>,
                verify,
                (const Sr25519Signature &signature,
                 common::BufferView context,
                 common::BufferView message,
                 const Sr25519PublicKey &public_key),
                (const, override));
  };

}  // namespace oasis::crypto
