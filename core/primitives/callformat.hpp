/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "cbor/cbor.hpp"
#include "crypto/deoxysii/deoxysii.hpp"
#include "crypto/x25519_types.hpp"

namespace oasis::primitives {

  /**
   * Body of a call sealed with X25519 key agreement and Deoxys-II
   */
  struct CallEnvelopeX25519DeoxysII {
    /// caller's ephemeral public key
    crypto::X25519PublicKey pk;
    crypto::DeoxysIINonce nonce;
    /// epoch of the runtime key the call is sealed for
    std::optional<uint64_t> epoch;
    /// sealed CBOR-encoded call
    common::Buffer data;

    bool operator==(const CallEnvelopeX25519DeoxysII &) const = default;
  };

  /**
   * Call result sealed by the runtime
   */
  struct ResultEnvelopeX25519DeoxysII {
    crypto::DeoxysIINonce nonce;
    common::Buffer data;

    bool operator==(const ResultEnvelopeX25519DeoxysII &) const = default;
  };

  cbor::Value toCbor(const CallEnvelopeX25519DeoxysII &envelope);
  outcome::result<void> fromCbor(const cbor::Value &value,
                                 CallEnvelopeX25519DeoxysII &out);

  cbor::Value toCbor(const ResultEnvelopeX25519DeoxysII &envelope);
  outcome::result<void> fromCbor(const cbor::Value &value,
                                 ResultEnvelopeX25519DeoxysII &out);

}  // namespace oasis::primitives
