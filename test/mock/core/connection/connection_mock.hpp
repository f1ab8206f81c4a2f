/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "connection/connection.hpp"

namespace oasis::connection {

  class ConnectionMock : public Connection {
   public:
    MOCK_METHOD(outcome::result<primitives::CallResult>,
                submit,
                (const primitives::UnverifiedTransaction &ut),
                (override));
  };

}  // namespace oasis::connection
