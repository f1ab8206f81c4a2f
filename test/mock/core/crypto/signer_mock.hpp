/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "crypto/signature/signer.hpp"

namespace oasis::crypto {

  class SignerMock : public Signer {
   public:
    MOCK_METHOD(PublicKey, publicKey, (), (const, override));

    MOCK_METHOD(outcome::result<common::Buffer>,
                sign,
                (common::BufferView context, common::BufferView message),
                (const, override));
  };

}  // namespace oasis::crypto
