/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include "cbor/cbor.hpp"
#include "crypto/signature/public_key.hpp"
#include "outcome/outcome.hpp"

namespace oasis::primitives {

  enum class MultisigError {
    ZERO_THRESHOLD = 1,
    DUPLICATE_SIGNER,
    ZERO_WEIGHT,
    WEIGHT_OVERFLOW,
    IMPOSSIBLE_THRESHOLD,
    WRONG_PROOF_COUNT,
    INSUFFICIENT_WEIGHT,
  };

  struct MultisigSigner {
    crypto::PublicKey public_key;
    uint64_t weight = 0;

    bool operator==(const MultisigSigner &) const = default;
  };

  /**
   * Weighted threshold signer set
   */
  struct MultisigConfig {
    std::vector<MultisigSigner> signers;
    uint64_t threshold = 0;

    bool operator==(const MultisigConfig &) const = default;

    /**
     * Fails when threshold is zero, a key repeats, a weight is zero, the
     * weights overflow or their sum does not reach the threshold
     */
    outcome::result<void> validateBasic() const;

    /// Signature of one signer that has to be checked cryptographically
    struct SignatureCheck {
      size_t signer_index;
      crypto::PublicKey public_key;
      common::Buffer signature;
    };

    /**
     * Selects signatures to verify out of one proof slot per signer.
     * Signatures are not verified here; only the weight of the provided
     * slots is checked against the threshold.
     * @param signatures - aligned with signers, nullopt for missing ones
     */
    outcome::result<std::vector<SignatureCheck>> batch(
        const std::vector<std::optional<common::Buffer>> &signatures) const;
  };

  cbor::Value toCbor(const MultisigConfig &config);

  outcome::result<void> fromCbor(const cbor::Value &value,
                                 MultisigConfig &out);

}  // namespace oasis::primitives

OUTCOME_HPP_DECLARE_ERROR(oasis::primitives, MultisigError);
