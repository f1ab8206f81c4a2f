/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>

#include "callformat/call_format_codec.hpp"
#include "connection/connection.hpp"
#include "log/logger.hpp"
#include "transaction/transaction_authenticator.hpp"

namespace oasis::client {

  /**
   * @class TransactionBuilder assembles a transaction, optionally seals its
   * call, collects signatures and submits it. The transaction can not be
   * changed once the first signature is appended.
   */
  class TransactionBuilder {
   public:
    enum class Error {
      ALREADY_SIGNED = 1,
      NOT_SIGNED,
    };

    TransactionBuilder(
        std::shared_ptr<connection::Connection> connection,
        std::shared_ptr<transaction::TransactionAuthenticator> authenticator,
        std::shared_ptr<callformat::CallFormatCodec> call_format_codec,
        crypto::ChainContext chain,
        primitives::Transaction tx);

    const primitives::Transaction &transaction() const {
      return tx_;
    }

    outcome::result<void> setFeeAmount(primitives::BaseUnits amount);

    outcome::result<void> setFeeGas(uint64_t gas);

    outcome::result<void> setFeeConsensusMessages(uint32_t consensus_messages);

    outcome::result<void> appendAuthSignature(
        primitives::SignatureAddressSpec spec, uint64_t nonce);

    outcome::result<void> appendAuthMultisig(primitives::MultisigConfig config,
                                             uint64_t nonce);

    /**
     * Replaces the call with its encoding in \param format. Metadata needed
     * to decode the result is kept by the builder.
     */
    outcome::result<void> encodeCall(primitives::CallFormat format,
                                     const callformat::EncodeConfig &config);

    outcome::result<void> appendSign(const crypto::Signer &signer);

    /// Signed transaction, NOT_SIGNED before the first signature
    outcome::result<primitives::UnverifiedTransaction> unverifiedTransaction()
        const;

    /**
     * Submits the signed transaction and decodes its result
     */
    outcome::result<primitives::CallResult> submit();

   private:
    outcome::result<void> ensureNotSigned() const;

    std::shared_ptr<connection::Connection> connection_;
    std::shared_ptr<transaction::TransactionAuthenticator> authenticator_;
    std::shared_ptr<callformat::CallFormatCodec> call_format_codec_;
    crypto::ChainContext chain_;
    primitives::Transaction tx_;
    std::optional<transaction::TransactionSigner> signer_;
    std::optional<callformat::CallMetadata> call_metadata_;
    log::Logger logger_;
  };

}  // namespace oasis::client

OUTCOME_HPP_DECLARE_ERROR(oasis::client, TransactionBuilder::Error);
