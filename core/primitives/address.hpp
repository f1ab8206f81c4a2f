/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "cbor/cbor.hpp"
#include "common/blob.hpp"

namespace oasis::primitives::constants::address {
  enum {  // NOLINT(performance-enum-size)
    SIZE = 21,
    ETH_SIZE = 20,
    VERSION = 0,
  };
}  // namespace oasis::primitives::constants::address

/**
 * Account address: version byte followed by a truncated context hash
 */
OASIS_BLOB_STRICT_TYPEDEF(oasis::primitives,
                          Address,
                          constants::address::SIZE);

/**
 * Raw Ethereum-compatible address of a secp256k1 key
 */
OASIS_BLOB_STRICT_TYPEDEF(oasis::primitives,
                          EthAddress,
                          constants::address::ETH_SIZE);

namespace oasis::primitives {

  /// Human readable prefix of the bech32 address form
  constexpr std::string_view kAddressBech32Hrp = "oasis";

  namespace address_context {
    constexpr std::string_view kEd25519 = "oasis-core/address: staking";
    constexpr std::string_view kSecp256k1Eth =
        "oasis-runtime-sdk/address: secp256k1eth";
    constexpr std::string_view kSr25519 = "oasis-runtime-sdk/address: sr25519";
    constexpr std::string_view kModule = "oasis-runtime-sdk/address: module";
    constexpr std::string_view kMultisig =
        "oasis-runtime-sdk/address: multisig";
    constexpr std::string_view kRuntime = "oasis-core/address: runtime";
  }  // namespace address_context

  cbor::Value toCbor(const Address &address);

  outcome::result<void> fromCbor(const cbor::Value &value, Address &out);

}  // namespace oasis::primitives
