/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "common/blob.hpp"

namespace oasis::crypto {
  /**
   * Take a SHA-512/256 hash from string
   * @param input to be hashed
   * @return hashed bytes
   */
  common::Hash256 sha512_256(std::string_view input);

  /**
   * Take a SHA-512/256 hash from bytes
   * @param input to be hashed
   * @return hashed bytes
   */
  common::Hash256 sha512_256(common::BufferView input);

  /**
   * SHA-512/256 over a concatenation of parts, without joining them first
   */
  common::Hash256 sha512_256(std::initializer_list<common::BufferView> parts);

  /**
   * HMAC with SHA-512/256 as the hash function
   * @param key - MAC key
   * @param data - authenticated data
   * @return 32-byte tag
   */
  common::Hash256 hmacSha512_256(common::BufferView key,
                                 common::BufferView data);
}  // namespace oasis::crypto
