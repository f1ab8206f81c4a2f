/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <concepts>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "common/buffer.hpp"

namespace oasis::cbor {

  class Value;

  using Array = std::vector<Value>;
  using MapEntry = std::pair<Value, Value>;

  /// Entries keep insertion order; canonical order is applied on encoding
  using Map = std::vector<MapEntry>;

  struct Null {
    bool operator==(const Null &) const = default;
  };

  /// Negative integer as its CBOR argument, the value is (-1 - magnitude)
  struct NegativeInt {
    uint64_t magnitude;
    bool operator==(const NegativeInt &) const = default;
  };

  /**
   * In-memory CBOR data item. Covers the subset of RFC 8949 used by the
   * runtime wire protocol: integers, byte and text strings, arrays, maps,
   * booleans and null.
   */
  class Value {
   public:
    using Variant = std::variant<Null,
                                 bool,
                                 uint64_t,
                                 NegativeInt,
                                 common::Buffer,
                                 std::string,
                                 Array,
                                 Map>;

    Value() = default;

    Value(Null) {}

    template <std::same_as<bool> B>
    Value(B b) : value_{b} {}

    template <std::unsigned_integral T>
      requires(not std::same_as<T, bool>)
    Value(T number) : value_{static_cast<uint64_t>(number)} {}

    Value(NegativeInt number) : value_{number} {}

    Value(common::Buffer bytes) : value_{std::move(bytes)} {}

    Value(BufferView bytes) : value_{common::Buffer{bytes}} {}

    Value(std::string text) : value_{std::move(text)} {}

    Value(std::string_view text) : value_{std::string{text}} {}

    Value(const char *text) : value_{std::string{text}} {}

    Value(Array array) : value_{std::move(array)} {}

    Value(Map map) : value_{std::move(map)} {}

    const Variant &variant() const {
      return value_;
    }

    template <typename T>
    const T *get() const {
      return std::get_if<T>(&value_);
    }

    bool isNull() const {
      return std::holds_alternative<Null>(value_);
    }

    /**
     * Looks up a text key in a map item
     * @return pointer to the value or nullptr when absent or not a map
     */
    const Value *find(std::string_view key) const;

    bool operator==(const Value &other) const {
      return value_ == other.value_;
    }

   private:
    Variant value_;
  };

}  // namespace oasis::cbor
