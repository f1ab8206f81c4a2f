/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <libp2p/crypto/random_generator.hpp>

namespace oasis::crypto {
  using RandomGenerator = libp2p::crypto::random::RandomGenerator;
  using CSPRNG = libp2p::crypto::random::CSPRNG;
}  // namespace oasis::crypto
