/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/multisig.hpp"

#include <limits>

OUTCOME_CPP_DEFINE_CATEGORY(oasis::primitives, MultisigError, e) {
  using E = oasis::primitives::MultisigError;
  switch (e) {
    case E::ZERO_THRESHOLD:
      return "Invalid multisig config: zero threshold";
    case E::DUPLICATE_SIGNER:
      return "Invalid multisig config: duplicate public key";
    case E::ZERO_WEIGHT:
      return "Invalid multisig config: signer with zero weight";
    case E::WEIGHT_OVERFLOW:
      return "Invalid multisig config: sum of weights overflows";
    case E::IMPOSSIBLE_THRESHOLD:
      return "Invalid multisig config: sum of weights is below threshold";
    case E::WRONG_PROOF_COUNT:
      return "Number of multisig signature slots differs from signer count";
    case E::INSUFFICIENT_WEIGHT:
      return "Signatures do not reach multisig threshold";
  }
  return "Unknown multisig error";
}

namespace oasis::primitives {

  outcome::result<void> MultisigConfig::validateBasic() const {
    if (threshold == 0) {
      return MultisigError::ZERO_THRESHOLD;
    }
    uint64_t total = 0;
    for (size_t i = 0; i < signers.size(); ++i) {
      const auto &signer = signers[i];
      for (size_t j = 0; j < i; ++j) {
        if (signers[j].public_key == signer.public_key) {
          return MultisigError::DUPLICATE_SIGNER;
        }
      }
      if (signer.weight == 0) {
        return MultisigError::ZERO_WEIGHT;
      }
      if (signer.weight > std::numeric_limits<uint64_t>::max() - total) {
        return MultisigError::WEIGHT_OVERFLOW;
      }
      total += signer.weight;
    }
    if (total < threshold) {
      return MultisigError::IMPOSSIBLE_THRESHOLD;
    }
    return outcome::success();
  }

  outcome::result<std::vector<MultisigConfig::SignatureCheck>>
  MultisigConfig::batch(
      const std::vector<std::optional<common::Buffer>> &signatures) const {
    OUTCOME_TRY(validateBasic());
    if (signatures.size() != signers.size()) {
      return MultisigError::WRONG_PROOF_COUNT;
    }
    uint64_t total = 0;
    std::vector<SignatureCheck> checks;
    for (size_t i = 0; i < signers.size(); ++i) {
      if (not signatures[i].has_value()) {
        continue;
      }
      // cannot overflow, validateBasic bounds the full sum
      total += signers[i].weight;
      checks.push_back(SignatureCheck{.signer_index = i,
                                      .public_key = signers[i].public_key,
                                      .signature = *signatures[i]});
    }
    if (total < threshold) {
      return MultisigError::INSUFFICIENT_WEIGHT;
    }
    return checks;
  }

  cbor::Value toCbor(const MultisigConfig &config) {
    cbor::Array signers;
    signers.reserve(config.signers.size());
    for (const auto &signer : config.signers) {
      signers.emplace_back(cbor::Map{
          {"public_key", toCbor(signer.public_key)},
          {"weight", signer.weight},
      });
    }
    return cbor::Map{
        {"signers", std::move(signers)},
        {"threshold", config.threshold},
    };
  }

  outcome::result<void> fromCbor(const cbor::Value &value,
                                 MultisigConfig &out) {
    OUTCOME_TRY(reader, cbor::MapReader::open(value));
    out.signers.clear();
    if (const auto *signers = reader.optional("signers")) {
      OUTCOME_TRY(items, cbor::asArray(*signers));
      for (const auto &item : *items) {
        OUTCOME_TRY(signer_reader, cbor::MapReader::open(item));
        MultisigSigner signer;
        OUTCOME_TRY(key, signer_reader.required("public_key"));
        OUTCOME_TRY(crypto::fromCbor(*key, signer.public_key));
        if (const auto *weight = signer_reader.optional("weight")) {
          OUTCOME_TRY(w, cbor::asUint(*weight));
          signer.weight = w;
        }
        OUTCOME_TRY(signer_reader.finish());
        out.signers.push_back(std::move(signer));
      }
    }
    out.threshold = 0;
    if (const auto *threshold = reader.optional("threshold")) {
      OUTCOME_TRY(t, cbor::asUint(*threshold));
      out.threshold = t;
    }
    return reader.finish();
  }

}  // namespace oasis::primitives
