/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"

namespace oasis::crypto {
  /**
   * Legacy Keccak-256 (pre-standard padding 0x01), as used by Ethereum
   * @param buf to be hashed
   * @return hashed bytes
   */
  common::Hash256 keccak(common::BufferView buf);
}  // namespace oasis::crypto
