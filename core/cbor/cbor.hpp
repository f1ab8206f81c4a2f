/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "cbor/cbor_decoder.hpp"
#include "cbor/cbor_encoder.hpp"
#include "cbor/cbor_error.hpp"
#include "cbor/cbor_value.hpp"

/**
 * Types serializable to CBOR provide two free functions found by ADL:
 *   cbor::Value toCbor(const T &);
 *   outcome::result<void> fromCbor(const cbor::Value &, T &);
 */
namespace oasis::cbor {

  inline Value toCbor(const Value &value) {
    return value;
  }

  inline outcome::result<void> fromCbor(const Value &value, Value &out) {
    out = value;
    return outcome::success();
  }

  template <typename T>
  common::Buffer encode(const T &value) {
    return encodeValue(toCbor(value));
  }

  template <typename T>
  outcome::result<T> decode(BufferView data) {
    OUTCOME_TRY(value, decodeValue(data));
    T out{};
    OUTCOME_TRY(fromCbor(value, out));
    return out;
  }

  outcome::result<uint64_t> asUint(const Value &value);

  outcome::result<bool> asBool(const Value &value);

  outcome::result<common::Buffer> asBytes(const Value &value);

  outcome::result<std::string> asText(const Value &value);

  outcome::result<const Array *> asArray(const Value &value);

  template <size_t N>
  outcome::result<common::Blob<N>> asBlob(const Value &value) {
    const auto *bytes = value.get<common::Buffer>();
    if (bytes == nullptr) {
      return Error::UNEXPECTED_TYPE;
    }
    if (bytes->size() != N) {
      return Error::INVALID_LENGTH;
    }
    return common::Blob<N>::fromSpan(*bytes);
  }

  /**
   * @class MapReader walks a map keyed by text strings and remembers which
   * entries have been consumed, so that leftovers can be reported
   */
  class MapReader {
   public:
    static outcome::result<MapReader> open(const Value &value);

    /// @return entry value or nullptr when the key is absent
    const Value *optional(std::string_view key);

    outcome::result<const Value *> required(std::string_view key);

    /// Fails with UNKNOWN_FIELD when some entry was never consumed
    outcome::result<void> finish() const;

    /// Key of a single-entry map, used for sum types
    outcome::result<std::string_view> soleKey() const;

   private:
    explicit MapReader(const Map &map);

    const Map *map_;
    std::vector<bool> used_;
  };

}  // namespace oasis::cbor
