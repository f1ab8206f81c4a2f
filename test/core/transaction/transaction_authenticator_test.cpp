/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transaction/impl/transaction_authenticator_impl.hpp"

#include <gtest/gtest.h>

#include "crypto/signature/signature_verifier_impl.hpp"
#include "mock/core/crypto/signature_verifier_mock.hpp"
#include "mock/core/crypto/signer_mock.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/test_keys.hpp"

using oasis::common::Buffer;
using oasis::crypto::ChainContext;
using oasis::crypto::Ed25519ProviderImpl;
using oasis::crypto::Secp256k1ProviderImpl;
using oasis::crypto::SignatureVerifierImpl;
using oasis::crypto::SignatureVerifierMock;
using oasis::crypto::SignerMock;
using oasis::primitives::AuthProof;
using oasis::primitives::MultisigConfig;
using oasis::primitives::MultisigError;
using oasis::primitives::MultisigSigner;
using oasis::primitives::SignatureAddressSpec;
using oasis::primitives::Transaction;
using oasis::primitives::TransactionError;
using oasis::primitives::UnverifiedTransaction;
using oasis::transaction::TransactionAuthenticatorError;
using oasis::transaction::InvalidSignature;
using oasis::transaction::TransactionAuthenticatorImpl;
using testing::_;
using testing::Return;

class TransactionAuthenticatorTest : public testing::Test {
 protected:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    alice_ = testutil::keys::alice();
    bob_ = testutil::keys::bob();
    charlie_ = testutil::keys::charlie();
    dave_ = testutil::keys::dave();
    authenticator_ = std::make_shared<TransactionAuthenticatorImpl>(
        std::make_shared<SignatureVerifierImpl>(
            std::make_shared<Ed25519ProviderImpl>(),
            std::make_shared<Secp256k1ProviderImpl>(),
            nullptr));
  }

  static SignatureAddressSpec specOf(
      const std::shared_ptr<oasis::crypto::Signer> &signer) {
    return SignatureAddressSpec::fromPublicKey(signer->publicKey());
  }

  /// 2-of-3 multisig of alice, bob and charlie
  MultisigConfig multisig() const {
    return MultisigConfig{
        .signers = {MultisigSigner{.public_key = alice_->publicKey(),
                                   .weight = 1},
                    MultisigSigner{.public_key = bob_->publicKey(),
                                   .weight = 1},
                    MultisigSigner{.public_key = charlie_->publicKey(),
                                   .weight = 1}},
        .threshold = 2};
  }

  /// 2-of-2 multisig of alice and bob
  MultisigConfig aliceAndBob() const {
    return MultisigConfig{
        .signers = {MultisigSigner{.public_key = alice_->publicKey(),
                                   .weight = 1},
                    MultisigSigner{.public_key = bob_->publicKey(),
                                   .weight = 1}},
        .threshold = 2};
  }

  /// two solo slots and a multisig slot over the same two keys
  Transaction helloWorld() const {
    auto tx = Transaction::make(std::nullopt, "hello.World", {});
    tx.appendAuthSignature(specOf(alice_), 42);
    tx.appendAuthSignature(specOf(bob_), 43);
    tx.appendAuthMultisig(aliceAndBob(), 44);
    return tx;
  }

  static Transaction transfer() {
    auto tx = Transaction::make(std::nullopt, "accounts.Transfer", {});
    tx.auth_info.fee.gas = 100;
    return tx;
  }

  std::shared_ptr<oasis::crypto::Signer> alice_;
  std::shared_ptr<oasis::crypto::Signer> bob_;
  std::shared_ptr<oasis::crypto::Signer> charlie_;
  std::shared_ptr<oasis::crypto::Signer> dave_;

  std::shared_ptr<TransactionAuthenticatorImpl> authenticator_;
  ChainContext chain_{
      "8000000000000000000000000000000000000000000000000000000000000000"_hash256,
      "643fb06848be7e970af3b5b2d772eb8cfb30499c8162bc18ac03df2f5e22520e"};
  ChainContext other_chain_{
      "8000000000000000000000000000000000000000000000000000000000000001"_hash256,
      "643fb06848be7e970af3b5b2d772eb8cfb30499c8162bc18ac03df2f5e22520e"};
};

/**
 * @given transaction with ed25519 and secp256k1 signer slots
 * @when both signers sign and the result is verified
 * @then the original transaction is returned
 */
TEST_F(TransactionAuthenticatorTest, SignAndVerify) {
  auto tx = transfer();
  tx.appendAuthSignature(specOf(alice_), 1);
  tx.appendAuthSignature(specOf(dave_), 5);

  auto handle = authenticator_->prepareForSigning(tx);
  EXPECT_EQ(handle.ut.body, oasis::cbor::encode(tx));
  EXPECT_OUTCOME_TRUE_1(authenticator_->appendSign(handle, chain_, *dave_));
  EXPECT_OUTCOME_TRUE_1(authenticator_->appendSign(handle, chain_, *alice_));
  ASSERT_EQ(handle.ut.auth_proofs.size(), 2);

  EXPECT_OUTCOME_TRUE(verified, authenticator_->verify(handle.ut, chain_));
  EXPECT_EQ(verified, tx);
}

/**
 * @given transaction signed for one chain
 * @when verify it against another chain
 * @then the signature does not match
 */
TEST_F(TransactionAuthenticatorTest, WrongChain) {
  auto tx = transfer();
  tx.appendAuthSignature(specOf(alice_), 1);
  auto handle = authenticator_->prepareForSigning(tx);
  EXPECT_OUTCOME_TRUE_1(authenticator_->appendSign(handle, chain_, *alice_));
  EXPECT_EC(authenticator_->verify(handle.ut, other_chain_),
            TransactionAuthenticatorError::SIGNATURE_INVALID);
}

/**
 * @given signer not declared by any slot
 * @when it signs
 * @then signing fails and no slot is filled
 */
TEST_F(TransactionAuthenticatorTest, SignerNotFound) {
  auto tx = transfer();
  tx.appendAuthSignature(specOf(alice_), 1);
  auto handle = authenticator_->prepareForSigning(tx);
  EXPECT_EC(authenticator_->appendSign(handle, chain_, *bob_),
            TransactionAuthenticatorError::SIGNER_NOT_FOUND);
  ASSERT_EQ(handle.ut.auth_proofs.size(), 1);
  EXPECT_EQ(handle.ut.auth_proofs[0],
            AuthProof{AuthProof::Signature{}});
}

/**
 * @given transaction with an unsigned slot
 * @when verify it
 * @then the missing signature is reported
 */
TEST_F(TransactionAuthenticatorTest, MissingSignature) {
  auto tx = transfer();
  tx.appendAuthSignature(specOf(alice_), 1);
  tx.appendAuthSignature(specOf(bob_), 1);
  auto handle = authenticator_->prepareForSigning(tx);
  EXPECT_OUTCOME_TRUE_1(authenticator_->appendSign(handle, chain_, *alice_));
  EXPECT_EC(authenticator_->verify(handle.ut, chain_),
            TransactionError::MISSING_SIGNATURE);
}

/**
 * @given 2-of-3 multisig slot
 * @when one and then two of the members sign
 * @then verification passes only once the threshold is reached
 */
TEST_F(TransactionAuthenticatorTest, Multisig) {
  auto tx = transfer();
  tx.appendAuthMultisig(multisig(), 3);
  auto handle = authenticator_->prepareForSigning(tx);

  EXPECT_OUTCOME_TRUE_1(authenticator_->appendSign(handle, chain_, *charlie_));
  EXPECT_EC(authenticator_->verify(handle.ut, chain_),
            MultisigError::INSUFFICIENT_WEIGHT);

  EXPECT_OUTCOME_TRUE_1(authenticator_->appendSign(handle, chain_, *alice_));
  const auto &proof =
      std::get<AuthProof::Multisig>(handle.ut.auth_proofs[0].proof);
  EXPECT_TRUE(proof.signatures[0].has_value());
  EXPECT_FALSE(proof.signatures[1].has_value());
  EXPECT_TRUE(proof.signatures[2].has_value());

  EXPECT_OUTCOME_TRUE(verified, authenticator_->verify(handle.ut, chain_));
  EXPECT_EQ(verified, tx);
}

/**
 * @given key declared both as a solo slot and as a multisig member
 * @when it signs once
 * @then every matching slot receives the same signature
 */
TEST_F(TransactionAuthenticatorTest, SignsAllMatchingSlots) {
  auto tx = transfer();
  tx.appendAuthSignature(specOf(alice_), 1);
  tx.appendAuthMultisig(multisig(), 2);

  auto signer = std::make_shared<SignerMock>();
  auto signature = Buffer(64, 7);
  EXPECT_CALL(*signer, publicKey()).WillRepeatedly(Return(alice_->publicKey()));
  EXPECT_CALL(*signer, sign(_, _)).WillOnce(Return(signature));

  auto handle = authenticator_->prepareForSigning(tx);
  EXPECT_OUTCOME_TRUE_1(authenticator_->appendSign(handle, chain_, *signer));
  EXPECT_EQ(handle.ut.auth_proofs[0], AuthProof{AuthProof::Signature{signature}});
  const auto &proof =
      std::get<AuthProof::Multisig>(handle.ut.auth_proofs[1].proof);
  EXPECT_EQ(proof.signatures[0], signature);
}

/**
 * @given signed transaction with a proof removed or a body tampered with
 * @when verify it
 * @then verification fails
 */
TEST_F(TransactionAuthenticatorTest, MalformedUnverified) {
  auto tx = transfer();
  tx.appendAuthSignature(specOf(alice_), 1);
  auto handle = authenticator_->prepareForSigning(tx);
  EXPECT_OUTCOME_TRUE_1(authenticator_->appendSign(handle, chain_, *alice_));

  auto no_proofs = handle.ut;
  no_proofs.auth_proofs.clear();
  EXPECT_EC(authenticator_->verify(no_proofs, chain_),
            TransactionError::WRONG_PROOF_COUNT);

  auto module_proof = handle.ut;
  module_proof.auth_proofs[0] = AuthProof{AuthProof::Module{"evm"}};
  EXPECT_EC(authenticator_->verify(module_proof, chain_),
            TransactionError::PROOF_MISMATCH);

  auto tampered = handle.ut;
  auto changed = tx;
  changed.auth_info.fee.gas = 101;
  tampered.body = oasis::cbor::encode(changed);
  EXPECT_EC(authenticator_->verify(tampered, chain_),
            TransactionAuthenticatorError::SIGNATURE_INVALID);

  auto garbage = handle.ut;
  garbage.body = "ff"_unhex;
  EXPECT_FALSE(authenticator_->verify(garbage, chain_));
}

/**
 * @given verifier that fails to check a signature
 * @when verify a transaction
 * @then the signature is treated as invalid
 */
TEST_F(TransactionAuthenticatorTest, VerifierError) {
  auto verifier = std::make_shared<SignatureVerifierMock>();
  TransactionAuthenticatorImpl authenticator{verifier};
  auto tx = transfer();
  tx.appendAuthSignature(specOf(alice_), 1);
  UnverifiedTransaction ut{
      .body = oasis::cbor::encode(tx),
      .auth_proofs = {AuthProof{AuthProof::Signature{Buffer(64, 1)}}}};

  EXPECT_CALL(*verifier, verify(alice_->publicKey(), _, _, _))
      .WillOnce(Return(SignatureVerifierImpl::Error::UNSUPPORTED_SCHEME));
  EXPECT_EC(authenticator.verify(ut, chain_),
            TransactionAuthenticatorError::SIGNATURE_INVALID);
}

/**
 * @given call with two solo slots and a 2-of-2 multisig slot
 * @when both keys sign
 * @then every slot is filled and the verified transaction equals the original
 */
TEST_F(TransactionAuthenticatorTest, SoloAndMultisigRoundTrip) {
  auto tx = helloWorld();
  EXPECT_OUTCOME_TRUE_1(tx.validateBasic());
  ChainContext chain{
      "8000000000000000000000000000000000000000000000000000000000000000"_hash256,
      "0000000000000000000000000000000000000000000000000000000000000001"};

  auto handle = authenticator_->prepareForSigning(tx);
  EXPECT_OUTCOME_TRUE_1(authenticator_->appendSign(handle, chain, *alice_));
  EXPECT_OUTCOME_TRUE_1(authenticator_->appendSign(handle, chain, *bob_));
  ASSERT_EQ(handle.ut.auth_proofs.size(), 3);
  const auto &proof =
      std::get<AuthProof::Multisig>(handle.ut.auth_proofs[2].proof);
  ASSERT_EQ(proof.signatures.size(), 2);
  EXPECT_TRUE(proof.signatures[0].has_value());
  EXPECT_TRUE(proof.signatures[1].has_value());

  EXPECT_OUTCOME_TRUE(verified, authenticator_->verify(handle.ut, chain));
  EXPECT_EQ(verified, tx);
  EXPECT_OUTCOME_TRUE_1(verified.validateBasic());
}

/**
 * @given signed transaction whose second multisig signature is corrupted
 * @when verify it
 * @then the failure points at that multisig member
 */
TEST_F(TransactionAuthenticatorTest, ReportsInvalidPosition) {
  auto tx = helloWorld();
  auto handle = authenticator_->prepareForSigning(tx);
  EXPECT_OUTCOME_TRUE_1(authenticator_->appendSign(handle, chain_, *alice_));
  EXPECT_OUTCOME_TRUE_1(authenticator_->appendSign(handle, chain_, *bob_));

  auto corrupted = handle.ut;
  auto &multisig =
      std::get<AuthProof::Multisig>(corrupted.auth_proofs[2].proof);
  ASSERT_TRUE(multisig.signatures[1].has_value());
  (*multisig.signatures[1])[0] ^= 0x01;

  std::optional<InvalidSignature> invalid;
  EXPECT_EC(authenticator_->verify(corrupted, chain_, invalid),
            TransactionAuthenticatorError::SIGNATURE_INVALID);
  ASSERT_TRUE(invalid.has_value());
  EXPECT_EQ(invalid->slot, 2u);
  EXPECT_EQ(invalid->sub_slot, std::optional<size_t>{1});
  EXPECT_EQ(invalid->index, 3u);

  EXPECT_OUTCOME_TRUE_1(authenticator_->verify(handle.ut, chain_, invalid));
  EXPECT_FALSE(invalid.has_value());
}

/**
 * @given handle whose proofs do not fit the signer slots
 * @when a multisig member signs
 * @then signing is refused and the proofs are left untouched
 */
TEST_F(TransactionAuthenticatorTest, RejectsMalformedHandle) {
  auto tx = transfer();
  tx.appendAuthMultisig(aliceAndBob(), 1);

  auto short_multisig = authenticator_->prepareForSigning(tx);
  short_multisig.ut.auth_proofs = {
      AuthProof{AuthProof::Multisig{{std::nullopt}}}};
  EXPECT_EC(authenticator_->appendSign(short_multisig, chain_, *bob_),
            TransactionError::WRONG_PROOF_COUNT);
  EXPECT_EQ(std::get<AuthProof::Multisig>(
                short_multisig.ut.auth_proofs[0].proof)
                .signatures.size(),
            1);

  auto solo_proof = authenticator_->prepareForSigning(tx);
  solo_proof.ut.auth_proofs = {AuthProof{AuthProof::Signature{}}};
  EXPECT_EC(authenticator_->appendSign(solo_proof, chain_, *bob_),
            TransactionError::PROOF_MISMATCH);

  auto module_proof = authenticator_->prepareForSigning(tx);
  module_proof.ut.auth_proofs = {AuthProof{AuthProof::Module{"evm"}}};
  EXPECT_EC(authenticator_->appendSign(module_proof, chain_, *bob_),
            TransactionError::PROOF_MISMATCH);

  auto extra_proof = authenticator_->prepareForSigning(tx);
  extra_proof.ut.auth_proofs = {
      AuthProof{AuthProof::Multisig{{std::nullopt, std::nullopt}}},
      AuthProof{AuthProof::Signature{}}};
  EXPECT_EC(authenticator_->appendSign(extra_proof, chain_, *bob_),
            TransactionError::WRONG_PROOF_COUNT);
}
