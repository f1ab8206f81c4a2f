/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "outcome/outcome.hpp"
#include "primitives/address.hpp"
#include "primitives/multisig.hpp"
#include "primitives/signature_address_spec.hpp"

namespace oasis::primitives {

  enum class AddressError { MALFORMED = 1 };

  /**
   * Address of arbitrary data under a derivation context:
   * version || SHA-512/256(context || version || data)[:20]
   */
  Address deriveAddress(std::string_view context, common::BufferView data);

  /**
   * Address of an account authenticated by a single key.
   * @throws std::invalid_argument if a secp256k1 key is not a curve point
   */
  Address addressFromSigSpec(const SignatureAddressSpec &spec);

  Address addressFromMultisig(const MultisigConfig &config);

  /**
   * Address of an account owned by a runtime module rather than by a key
   * @param module - module name
   * @param kind - module-specific account kind
   */
  Address addressForModule(std::string_view module, common::BufferView kind);

  Address addressFromRuntimeId(const common::Hash256 &runtime_id);

  Address addressFromEth(const EthAddress &eth_address);

  /**
   * Last 20 bytes of Keccak-256 over the untagged uncompressed key
   */
  outcome::result<EthAddress> ethAddressFromPublicKey(
      const crypto::Secp256k1PublicKey &public_key);

  std::string encodeBech32(const Address &address);

  /**
   * Parses "oasis1..." text form.
   * @return MALFORMED on wrong prefix, length, checksum or version
   */
  outcome::result<Address> decodeBech32(std::string_view text);

}  // namespace oasis::primitives

OUTCOME_HPP_DECLARE_ERROR(oasis::primitives, AddressError);
