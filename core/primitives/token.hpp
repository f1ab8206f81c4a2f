/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include <boost/multiprecision/cpp_int.hpp>

#include "cbor/cbor.hpp"

namespace oasis::primitives {

  /// Token amount, encoded on the wire as minimal big-endian bytes
  using Quantity = boost::multiprecision::uint128_t;

  /// Denomination name, at most this many bytes
  constexpr size_t kMaxDenominationSize = 32;

  /**
   * Token denomination; the empty denomination is the native token
   */
  struct Denomination {
    std::string name;

    bool operator==(const Denomination &) const = default;

    static Denomination native() {
      return {};
    }

    bool isNative() const {
      return name.empty();
    }
  };

  /**
   * Amount of tokens of one denomination
   */
  struct BaseUnits {
    Quantity amount = 0;
    Denomination denomination;

    bool operator==(const BaseUnits &) const = default;
  };

  cbor::Value toCbor(const Quantity &quantity);

  /// Rejects non-minimal encodings and values wider than 128 bits
  outcome::result<void> fromCbor(const cbor::Value &value, Quantity &out);

  cbor::Value toCbor(const BaseUnits &units);

  outcome::result<void> fromCbor(const cbor::Value &value, BaseUnits &out);

}  // namespace oasis::primitives

template <>
struct fmt::formatter<oasis::primitives::BaseUnits> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const oasis::primitives::BaseUnits &units,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    if (units.denomination.isNative()) {
      return fmt::format_to(ctx.out(), "{} <native>", units.amount.str());
    }
    return fmt::format_to(
        ctx.out(), "{} {}", units.amount.str(), units.denomination.name);
  }
};
