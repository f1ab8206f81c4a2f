/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cbor/cbor.hpp"

#include <algorithm>

namespace oasis::cbor {

  outcome::result<uint64_t> asUint(const Value &value) {
    if (const auto *number = value.get<uint64_t>()) {
      return *number;
    }
    return Error::UNEXPECTED_TYPE;
  }

  outcome::result<bool> asBool(const Value &value) {
    if (const auto *flag = value.get<bool>()) {
      return *flag;
    }
    return Error::UNEXPECTED_TYPE;
  }

  outcome::result<common::Buffer> asBytes(const Value &value) {
    if (const auto *bytes = value.get<common::Buffer>()) {
      return *bytes;
    }
    return Error::UNEXPECTED_TYPE;
  }

  outcome::result<std::string> asText(const Value &value) {
    if (const auto *text = value.get<std::string>()) {
      return *text;
    }
    return Error::UNEXPECTED_TYPE;
  }

  outcome::result<const Array *> asArray(const Value &value) {
    if (const auto *array = value.get<Array>()) {
      return array;
    }
    return Error::UNEXPECTED_TYPE;
  }

  MapReader::MapReader(const Map &map)
      : map_{&map}, used_(map.size(), false) {}

  outcome::result<MapReader> MapReader::open(const Value &value) {
    const auto *map = value.get<Map>();
    if (map == nullptr) {
      return Error::UNEXPECTED_TYPE;
    }
    for (const auto &[key, _] : *map) {
      if (key.get<std::string>() == nullptr) {
        return Error::UNEXPECTED_TYPE;
      }
    }
    return MapReader{*map};
  }

  const Value *MapReader::optional(std::string_view key) {
    for (size_t i = 0; i < map_->size(); ++i) {
      const auto &[k, v] = (*map_)[i];
      if (*k.get<std::string>() == key) {
        used_[i] = true;
        return &v;
      }
    }
    return nullptr;
  }

  outcome::result<const Value *> MapReader::required(std::string_view key) {
    if (const auto *value = optional(key)) {
      return value;
    }
    return Error::MISSING_FIELD;
  }

  outcome::result<void> MapReader::finish() const {
    if (std::find(used_.begin(), used_.end(), false) != used_.end()) {
      return Error::UNKNOWN_FIELD;
    }
    return outcome::success();
  }

  outcome::result<std::string_view> MapReader::soleKey() const {
    if (map_->size() != 1) {
      return Error::AMBIGUOUS_UNION;
    }
    return std::string_view{*map_->front().first.get<std::string>()};
  }

}  // namespace oasis::cbor
