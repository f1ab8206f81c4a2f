/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

extern "C" {
#include <schnorrkel/schnorrkel.h>
}

#include "common/blob.hpp"

namespace oasis::crypto::constants::sr25519 {
  /**
   * Important constants to deal with sr25519
   */
  enum {  // NOLINT(performance-enum-size)
    PUBLIC_SIZE = SR25519_PUBLIC_SIZE,
    SIGNATURE_SIZE = SR25519_SIGNATURE_SIZE,
  };
}  // namespace oasis::crypto::constants::sr25519

OASIS_BLOB_STRICT_TYPEDEF(oasis::crypto,
                          Sr25519PublicKey,
                          constants::sr25519::PUBLIC_SIZE);
OASIS_BLOB_STRICT_TYPEDEF(oasis::crypto,
                          Sr25519Signature,
                          constants::sr25519::SIGNATURE_SIZE);
