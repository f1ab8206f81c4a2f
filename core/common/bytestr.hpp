/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/bytestr.hpp>

namespace oasis {
  using qtils::byte2str;
  using qtils::str2byte;
}  // namespace oasis
