/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transaction/impl/transaction_authenticator_impl.hpp"

#include <boost/assert.hpp>

#include "common/bytestr.hpp"
#include "common/visitor.hpp"

namespace oasis::transaction {

  using primitives::AuthProof;
  using primitives::MultisigConfig;
  using primitives::SignatureAddressSpec;

  namespace {
    /// Empty proof of the shape expected by the slot
    AuthProof emptyProof(const primitives::AddressSpec &spec) {
      if (const auto *config = if_type<MultisigConfig>(spec.spec)) {
        return AuthProof{AuthProof::Multisig{
            std::vector<std::optional<common::Buffer>>(config->signers.size())}};
      }
      return AuthProof{AuthProof::Signature{}};
    }
  }  // namespace

  TransactionAuthenticatorImpl::TransactionAuthenticatorImpl(
      std::shared_ptr<crypto::SignatureVerifier> verifier)
      : verifier_{std::move(verifier)},
        signer_logger_{log::createLogger("TransactionSigner", "signer")},
        verifier_logger_{log::createLogger("TransactionVerifier", "verifier")} {
    BOOST_ASSERT(verifier_ != nullptr);
  }

  TransactionSigner TransactionAuthenticatorImpl::prepareForSigning(
      primitives::Transaction tx) const {
    auto body = cbor::encode(tx);
    return TransactionSigner{
        .tx = std::move(tx),
        .ut = primitives::UnverifiedTransaction{.body = std::move(body),
                                                .auth_proofs = {}},
    };
  }

  outcome::result<void> TransactionAuthenticatorImpl::appendSign(
      TransactionSigner &handle,
      const crypto::ChainContext &chain,
      const crypto::Signer &signer) const {
    const auto &signer_info = handle.tx.auth_info.signer_info;
    auto &proofs = handle.ut.auth_proofs;
    if (proofs.empty()) {
      proofs.reserve(signer_info.size());
      for (const auto &info : signer_info) {
        proofs.push_back(emptyProof(info.address_spec));
      }
    }
    if (proofs.size() != signer_info.size()) {
      SL_DEBUG(signer_logger_,
               "Transaction has {} signer slots but {} proofs",
               signer_info.size(),
               proofs.size());
      return primitives::TransactionError::WRONG_PROOF_COUNT;
    }
    // handles may come decoded from elsewhere, so check shapes before writing
    for (size_t slot = 0; slot < signer_info.size(); ++slot) {
      auto res =
          primitives::checkProofShape(signer_info[slot].address_spec,
                                      proofs[slot]);
      if (res.has_error()) {
        SL_DEBUG(signer_logger_,
                 "Proof of slot {} does not fit its address spec: {}",
                 slot,
                 res.error().message());
        return res.error();
      }
    }

    const auto public_key = signer.publicKey();
    const auto context = crypto::txSignatureContext(chain);

    std::optional<common::Buffer> signature;
    auto get_signature = [&]() -> outcome::result<common::Buffer> {
      if (not signature) {
        OUTCOME_TRY(sig, signer.sign(str2byte(context), handle.ut.body));
        signature = std::move(sig);
      }
      return *signature;
    };

    size_t matched = 0;
    for (size_t slot = 0; slot < signer_info.size(); ++slot) {
      const auto &spec = signer_info[slot].address_spec.spec;
      if (const auto *sig_spec = if_type<SignatureAddressSpec>(spec)) {
        if (sig_spec->publicKey() != public_key) {
          continue;
        }
        OUTCOME_TRY(sig, get_signature());
        proofs[slot] = AuthProof{AuthProof::Signature{std::move(sig)}};
        SL_TRACE(signer_logger_, "Signed slot {} with {}", slot, public_key);
        ++matched;
        continue;
      }

      const auto &config = std::get<MultisigConfig>(spec);
      auto &multisig = std::get<AuthProof::Multisig>(proofs[slot].proof);
      for (size_t sub = 0; sub < config.signers.size(); ++sub) {
        if (config.signers[sub].public_key != public_key) {
          continue;
        }
        OUTCOME_TRY(sig, get_signature());
        multisig.signatures[sub] = std::move(sig);
        SL_TRACE(signer_logger_,
                 "Signed multisig slot {}.{} with {}",
                 slot,
                 sub,
                 public_key);
        ++matched;
      }
    }

    if (matched == 0) {
      SL_DEBUG(signer_logger_,
               "Key {} is not declared by any of {} signer slots",
               public_key,
               signer_info.size());
      return TransactionAuthenticatorError::SIGNER_NOT_FOUND;
    }
    return outcome::success();
  }

  outcome::result<primitives::Transaction> TransactionAuthenticatorImpl::verify(
      const primitives::UnverifiedTransaction &ut,
      const crypto::ChainContext &chain,
      std::optional<InvalidSignature> &invalid) const {
    invalid.reset();
    OUTCOME_TRY(tx, cbor::decode<primitives::Transaction>(ut.body));
    OUTCOME_TRY(tx.validateBasic());

    const auto &signer_info = tx.auth_info.signer_info;
    if (ut.auth_proofs.size() != signer_info.size()) {
      SL_DEBUG(verifier_logger_,
               "Transaction has {} signer slots but {} proofs",
               signer_info.size(),
               ut.auth_proofs.size());
      return primitives::TransactionError::WRONG_PROOF_COUNT;
    }

    std::vector<primitives::SignatureCheck> checks;
    for (size_t slot = 0; slot < signer_info.size(); ++slot) {
      OUTCOME_TRY(slot_checks,
                  primitives::batch(
                      signer_info[slot].address_spec, ut.auth_proofs[slot], slot));
      checks.insert(checks.end(),
                    std::make_move_iterator(slot_checks.begin()),
                    std::make_move_iterator(slot_checks.end()));
    }

    const auto context = crypto::txSignatureContext(chain);
    for (size_t index = 0; index < checks.size(); ++index) {
      const auto &check = checks[index];
      auto res = verifier_->verify(
          check.public_key, str2byte(context), ut.body, check.signature);
      if (res.has_value() and res.value()) {
        continue;
      }
      if (res.has_error()) {
        SL_DEBUG(verifier_logger_,
                 "Signature in slot {}{} can not be checked: {}",
                 check.slot,
                 check.sub_slot ? fmt::format(".{}", *check.sub_slot) : "",
                 res.error().message());
      } else {
        SL_DEBUG(verifier_logger_,
                 "Invalid signature in slot {}{} by {}",
                 check.slot,
                 check.sub_slot ? fmt::format(".{}", *check.sub_slot) : "",
                 check.public_key);
      }
      invalid = InvalidSignature{
          .index = index, .slot = check.slot, .sub_slot = check.sub_slot};
      return TransactionAuthenticatorError::SIGNATURE_INVALID;
    }

    return tx;
  }

}  // namespace oasis::transaction
