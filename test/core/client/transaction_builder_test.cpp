/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "client/transaction_builder.hpp"

#include <gtest/gtest.h>

#include "callformat/impl/call_format_codec_impl.hpp"
#include "crypto/random_generator/boost_generator.hpp"
#include "crypto/sha/sha512_256.hpp"
#include "crypto/signature/signature_verifier_impl.hpp"
#include "crypto/x25519/x25519_provider_impl.hpp"
#include "mock/core/connection/connection_mock.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/test_keys.hpp"
#include "transaction/impl/transaction_authenticator_impl.hpp"

using oasis::callformat::CallFormatCodecImpl;
using oasis::callformat::EncodeConfig;
using oasis::client::TransactionBuilder;
using oasis::common::Buffer;
using oasis::connection::ConnectionMock;
using oasis::crypto::BoostRandomGenerator;
using oasis::crypto::ChainContext;
using oasis::crypto::Ed25519ProviderImpl;
using oasis::crypto::Secp256k1ProviderImpl;
using oasis::crypto::SecureCleanGuard;
using oasis::crypto::SignatureVerifierImpl;
using oasis::crypto::X25519Keypair;
using oasis::crypto::X25519PrivateKey;
using oasis::crypto::X25519ProviderImpl;
using oasis::primitives::BaseUnits;
using oasis::primitives::CallFormat;
using oasis::primitives::CallResult;
using oasis::primitives::Denomination;
using oasis::primitives::FailedCallResult;
using oasis::primitives::SignatureAddressSpec;
using oasis::primitives::Transaction;
using oasis::primitives::TransactionError;
using oasis::primitives::UnverifiedTransaction;
using oasis::transaction::TransactionAuthenticatorError;
using oasis::transaction::TransactionAuthenticatorImpl;
using testing::_;
using testing::Invoke;
using testing::Return;

class TransactionBuilderTest : public testing::Test {
 protected:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    connection_ = std::make_shared<ConnectionMock>();
    x25519_ = std::make_shared<X25519ProviderImpl>();
    codec_ = std::make_shared<CallFormatCodecImpl>(
        x25519_, std::make_shared<BoostRandomGenerator>());
    authenticator_ = std::make_shared<TransactionAuthenticatorImpl>(
        std::make_shared<SignatureVerifierImpl>(
            std::make_shared<Ed25519ProviderImpl>(),
            std::make_shared<Secp256k1ProviderImpl>(),
            nullptr));
    alice_ = testutil::keys::alice();
    auto runtime_secret = oasis::crypto::sha512_256("callformat test runtime");
    runtime_ = x25519_
                   ->keypairFromSecret(X25519PrivateKey::from(
                       SecureCleanGuard{runtime_secret}))
                   .value();
  }

  TransactionBuilder builder() {
    return TransactionBuilder{
        connection_,
        authenticator_,
        codec_,
        chain_,
        Transaction::make(std::nullopt, "accounts.Transfer", Buffer{"01"_unhex})};
  }

  std::shared_ptr<ConnectionMock> connection_;
  std::shared_ptr<X25519ProviderImpl> x25519_;
  std::shared_ptr<CallFormatCodecImpl> codec_;
  std::shared_ptr<TransactionAuthenticatorImpl> authenticator_;
  std::shared_ptr<oasis::crypto::Signer> alice_;
  X25519Keypair runtime_;
  ChainContext chain_{
      "000000000000000000000000000000000000000000000000e2eaa99fc008f87f"_hash256,
      "53852332637bacb61b91b6411ab4095168ba02a50be4c3f82448438826f23898"};
};

/**
 * @given builder of a plain transaction
 * @when set the fee, add a signer, sign and submit
 * @then the connection receives a transaction that verifies and the result
 * is returned as is
 */
TEST_F(TransactionBuilderTest, SignAndSubmit) {
  auto tb = builder();
  EXPECT_EC(tb.unverifiedTransaction(), TransactionBuilder::Error::NOT_SIGNED);

  EXPECT_OUTCOME_TRUE_1(
      tb.setFeeAmount(BaseUnits{.amount = 150, .denomination = Denomination{}}));
  EXPECT_OUTCOME_TRUE_1(tb.setFeeGas(1500));
  EXPECT_OUTCOME_TRUE_1(tb.setFeeConsensusMessages(1));
  EXPECT_OUTCOME_TRUE_1(tb.appendAuthSignature(
      SignatureAddressSpec::fromPublicKey(alice_->publicKey()), 4));
  EXPECT_EQ(tb.transaction().auth_info.fee.gasPrice(), 0);
  EXPECT_OUTCOME_TRUE_1(tb.appendSign(*alice_));

  EXPECT_EC(tb.setFeeGas(2000), TransactionBuilder::Error::ALREADY_SIGNED);
  EXPECT_EC(tb.appendAuthSignature(
                SignatureAddressSpec::fromPublicKey(alice_->publicKey()), 5),
            TransactionBuilder::Error::ALREADY_SIGNED);

  CallResult ok{CallResult::Ok{uint64_t{1}}};
  EXPECT_CALL(*connection_, submit(_))
      .WillOnce(Invoke([&](const UnverifiedTransaction &ut) {
        auto tx = authenticator_->verify(ut, chain_);
        EXPECT_TRUE(tx);
        EXPECT_EQ(tx.value(), tb.transaction());
        return ok;
      }));
  EXPECT_OUTCOME_TRUE(result, tb.submit());
  EXPECT_EQ(result, ok);
}

/**
 * @given builder without signer slots
 * @when sign
 * @then signing is refused
 */
TEST_F(TransactionBuilderTest, NoSigners) {
  auto tb = builder();
  EXPECT_EC(tb.appendSign(*alice_), TransactionError::NO_SIGNERS);
  EXPECT_EC(tb.submit(), TransactionBuilder::Error::NOT_SIGNED);
}

/**
 * @given builder with a slot for another key
 * @when sign with alice
 * @then the signer is not found
 */
TEST_F(TransactionBuilderTest, WrongSigner) {
  auto tb = builder();
  EXPECT_OUTCOME_TRUE_1(tb.appendAuthSignature(
      SignatureAddressSpec::fromPublicKey(testutil::keys::bob()->publicKey()),
      0));
  EXPECT_EC(tb.appendSign(*alice_),
            TransactionAuthenticatorError::SIGNER_NOT_FOUND);
}

/**
 * @given builder with an encrypted call
 * @when the runtime seals its result
 * @then submit returns the decrypted result
 */
TEST_F(TransactionBuilderTest, EncryptedCall) {
  auto tb = builder();
  EXPECT_OUTCOME_TRUE_1(tb.encodeCall(
      CallFormat::ENCRYPTED_X25519_DEOXYSII,
      EncodeConfig{.public_key = runtime_.public_key, .epoch = 3}));
  EXPECT_EQ(tb.transaction().call.format, CallFormat::ENCRYPTED_X25519_DEOXYSII);
  EXPECT_TRUE(tb.transaction().call.method.empty());
  EXPECT_OUTCOME_TRUE_1(tb.appendAuthSignature(
      SignatureAddressSpec::fromPublicKey(alice_->publicKey()), 0));
  EXPECT_OUTCOME_TRUE_1(tb.appendSign(*alice_));

  CallResult inner{CallResult::Ok{"done"}};
  EXPECT_CALL(*connection_, submit(_))
      .WillOnce(Invoke([&](const UnverifiedTransaction &ut)
                           -> outcome::result<CallResult> {
        OUTCOME_TRY(tx, authenticator_->verify(ut, chain_));
        OUTCOME_TRY(decoded, codec_->decodeCall(tx.call, runtime_));
        EXPECT_EQ(decoded.call.method, "accounts.Transfer");
        return codec_->encodeResult(inner, decoded.metadata, 10, 0);
      }));
  EXPECT_OUTCOME_TRUE(result, tb.submit());
  EXPECT_EQ(result, inner);
}

/**
 * @given encrypted call rejected before decryption
 * @when submit it
 * @then the failure is returned as data
 */
TEST_F(TransactionBuilderTest, EncryptedCallFailed) {
  auto tb = builder();
  EXPECT_OUTCOME_TRUE_1(tb.encodeCall(
      CallFormat::ENCRYPTED_X25519_DEOXYSII,
      EncodeConfig{.public_key = runtime_.public_key}));
  EXPECT_OUTCOME_TRUE_1(tb.appendAuthSignature(
      SignatureAddressSpec::fromPublicKey(alice_->publicKey()), 0));
  EXPECT_OUTCOME_TRUE_1(tb.appendSign(*alice_));

  CallResult failed{FailedCallResult{
      .module = "core", .code = 25, .message = "invalid call format"}};
  EXPECT_CALL(*connection_, submit(_)).WillOnce(Return(failed));
  EXPECT_OUTCOME_TRUE(result, tb.submit());
  EXPECT_EQ(result, failed);
  EXPECT_FALSE(result.isSuccess());
}
