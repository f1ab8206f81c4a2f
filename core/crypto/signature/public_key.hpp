/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <variant>

#include "cbor/cbor.hpp"
#include "crypto/ed25519_types.hpp"
#include "crypto/secp256k1_types.hpp"
#include "crypto/sr25519_types.hpp"

namespace oasis::crypto {

  /**
   * Public key of a transaction signer, tagged by its signature scheme
   */
  struct PublicKey {
    using Variant =
        std::variant<Ed25519PublicKey, Secp256k1PublicKey, Sr25519PublicKey>;

    Variant key;

    bool operator==(const PublicKey &other) const = default;

    /// raw key bytes without the scheme tag
    common::BufferView view() const;

    /// name of the scheme as it appears on the wire
    std::string_view schemeName() const;
  };

  cbor::Value toCbor(const PublicKey &public_key);

  /**
   * Decodes {"<scheme>": bytes}; secp256k1 keys must be valid curve points
   */
  outcome::result<void> fromCbor(const cbor::Value &value, PublicKey &out);

}  // namespace oasis::crypto

template <>
struct fmt::formatter<oasis::crypto::PublicKey> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const oasis::crypto::PublicKey &key, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::format_to(
        ctx.out(), "{}:0x{}", key.schemeName(), key.view().toHex());
  }
};
