/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "client/transaction_builder.hpp"

#include <boost/assert.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(oasis::client, TransactionBuilder::Error, e) {
  using E = oasis::client::TransactionBuilder::Error;
  switch (e) {
    case E::ALREADY_SIGNED:
      return "Transaction can not be changed after it has been signed";
    case E::NOT_SIGNED:
      return "Transaction has not been signed yet";
  }
  return "Unknown transaction builder error";
}

namespace oasis::client {

  TransactionBuilder::TransactionBuilder(
      std::shared_ptr<connection::Connection> connection,
      std::shared_ptr<transaction::TransactionAuthenticator> authenticator,
      std::shared_ptr<callformat::CallFormatCodec> call_format_codec,
      crypto::ChainContext chain,
      primitives::Transaction tx)
      : connection_{std::move(connection)},
        authenticator_{std::move(authenticator)},
        call_format_codec_{std::move(call_format_codec)},
        chain_{std::move(chain)},
        tx_{std::move(tx)},
        logger_{log::createLogger("TransactionBuilder", "transaction")} {
    BOOST_ASSERT(connection_ != nullptr);
    BOOST_ASSERT(authenticator_ != nullptr);
    BOOST_ASSERT(call_format_codec_ != nullptr);
  }

  outcome::result<void> TransactionBuilder::ensureNotSigned() const {
    if (signer_) {
      return Error::ALREADY_SIGNED;
    }
    return outcome::success();
  }

  outcome::result<void> TransactionBuilder::setFeeAmount(
      primitives::BaseUnits amount) {
    OUTCOME_TRY(ensureNotSigned());
    tx_.auth_info.fee.amount = std::move(amount);
    return outcome::success();
  }

  outcome::result<void> TransactionBuilder::setFeeGas(uint64_t gas) {
    OUTCOME_TRY(ensureNotSigned());
    tx_.auth_info.fee.gas = gas;
    return outcome::success();
  }

  outcome::result<void> TransactionBuilder::setFeeConsensusMessages(
      uint32_t consensus_messages) {
    OUTCOME_TRY(ensureNotSigned());
    tx_.auth_info.fee.consensus_messages = consensus_messages;
    return outcome::success();
  }

  outcome::result<void> TransactionBuilder::appendAuthSignature(
      primitives::SignatureAddressSpec spec, uint64_t nonce) {
    OUTCOME_TRY(ensureNotSigned());
    tx_.appendAuthSignature(std::move(spec), nonce);
    return outcome::success();
  }

  outcome::result<void> TransactionBuilder::appendAuthMultisig(
      primitives::MultisigConfig config, uint64_t nonce) {
    OUTCOME_TRY(ensureNotSigned());
    tx_.appendAuthMultisig(std::move(config), nonce);
    return outcome::success();
  }

  outcome::result<void> TransactionBuilder::encodeCall(
      primitives::CallFormat format, const callformat::EncodeConfig &config) {
    OUTCOME_TRY(ensureNotSigned());
    OUTCOME_TRY(encoded,
                call_format_codec_->encodeCall(tx_.call, format, config));
    tx_.call = std::move(encoded.call);
    call_metadata_ = std::move(encoded.metadata);
    return outcome::success();
  }

  outcome::result<void> TransactionBuilder::appendSign(
      const crypto::Signer &signer) {
    if (not signer_) {
      OUTCOME_TRY(tx_.validateBasic());
      signer_ = authenticator_->prepareForSigning(tx_);
    }
    return authenticator_->appendSign(*signer_, chain_, signer);
  }

  outcome::result<primitives::UnverifiedTransaction>
  TransactionBuilder::unverifiedTransaction() const {
    if (not signer_) {
      return Error::NOT_SIGNED;
    }
    return signer_->ut;
  }

  outcome::result<primitives::CallResult> TransactionBuilder::submit() {
    OUTCOME_TRY(ut, unverifiedTransaction());
    SL_DEBUG(logger_,
             "Submitting transaction {} with {} signer slots",
             ut.hash(),
             tx_.auth_info.signer_info.size());
    OUTCOME_TRY(result, connection_->submit(ut));
    OUTCOME_TRY(decoded,
                call_format_codec_->decodeResult(result, call_metadata_));
    if (not decoded.isSuccess() and not decoded.isUnknown()) {
      SL_DEBUG(logger_,
               "Transaction {} failed: {}",
               ut.hash(),
               std::get<primitives::FailedCallResult>(decoded.result).toString());
    }
    return decoded;
  }

}  // namespace oasis::client
