/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "crypto/signature/signature_verifier.hpp"

namespace oasis::crypto {

  class SignatureVerifierMock : public SignatureVerifier {
   public:
    MOCK_METHOD(outcome::result<bool>,
                verify,
                (const PublicKey &public_key,
                 common::BufferView context,
                 common::BufferView message,
                 common::BufferView signature),
                (const, override));
  };

}  // namespace oasis::crypto
