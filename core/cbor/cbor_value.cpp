/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cbor/cbor_value.hpp"

namespace oasis::cbor {

  const Value *Value::find(std::string_view key) const {
    const auto *map = get<Map>();
    if (map == nullptr) {
      return nullptr;
    }
    for (const auto &[k, v] : *map) {
      if (const auto *text = k.get<std::string>(); text and *text == key) {
        return &v;
      }
    }
    return nullptr;
  }

}  // namespace oasis::cbor
