/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "crypto/signature/context.hpp"
#include "crypto/signature/signature_verifier_impl.hpp"
#include "mock/core/crypto/sr25519_verifier_mock.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/test_keys.hpp"

using oasis::common::Buffer;
using oasis::crypto::ChainContext;
using oasis::crypto::Ed25519ProviderImpl;
using oasis::crypto::PublicKey;
using oasis::crypto::Secp256k1ProviderImpl;
using oasis::crypto::SignatureVerifierImpl;
using oasis::crypto::Sr25519PublicKey;
using oasis::crypto::Sr25519Signature;
using oasis::crypto::Sr25519VerifierMock;
using oasis::crypto::txSignatureContext;
using testing::_;
using testing::Return;

class SignatureTest : public testing::Test {
 protected:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  std::shared_ptr<SignatureVerifierImpl> makeVerifier(
      std::shared_ptr<Sr25519VerifierMock> sr25519 = nullptr) {
    return std::make_shared<SignatureVerifierImpl>(
        std::make_shared<Ed25519ProviderImpl>(),
        std::make_shared<Secp256k1ProviderImpl>(),
        std::move(sr25519));
  }

  Buffer context_ = "oasis-runtime-sdk/tx: v0 for chain test"_buf;
  Buffer message_ = "transaction body"_buf;
};

/**
 * @given seeds of the shared test keys
 * @when derive their public keys
 * @then the keys are the well-known ones
 */
TEST_F(SignatureTest, TestKeys) {
  EXPECT_EQ(
      testutil::keys::alice()->publicKey().view().toHex(),
      "35c3f3356dd85364feba0354b545ada109d1bdb38bf5d6126817db8c72cfd691");
  EXPECT_EQ(
      testutil::keys::bob()->publicKey().view().toHex(),
      "620904895491e1231075f5f0fa9a6e15896a1f4b1ebad9c22a4f0a1bc3f2031d");
  EXPECT_EQ(
      testutil::keys::dave()->publicKey().view().toHex(),
      "03017a18d8dbc9b333862dd7463e51d684e230c90ed6703007b3590251f55f8044");
  EXPECT_EQ(testutil::keys::dave()->publicKey().schemeName(), "secp256k1");
}

/**
 * @given ed25519 signer
 * @when sign a message and verify it with the same and another context
 * @then only the signing context is accepted
 */
TEST_F(SignatureTest, Ed25519SignVerify) {
  auto signer = testutil::keys::alice();
  EXPECT_OUTCOME_TRUE(signature, signer->sign(context_, message_));
  EXPECT_EQ(signature.size(), 64);

  auto verifier = makeVerifier();
  EXPECT_OUTCOME_TRUE(
      valid, verifier->verify(signer->publicKey(), context_, message_, signature));
  EXPECT_TRUE(valid);
  EXPECT_OUTCOME_TRUE(
      other_context,
      verifier->verify(signer->publicKey(), "other"_buf, message_, signature));
  EXPECT_FALSE(other_context);
  EXPECT_OUTCOME_TRUE(other_key,
                      verifier->verify(testutil::keys::bob()->publicKey(),
                                       context_,
                                       message_,
                                       signature));
  EXPECT_FALSE(other_key);
}

/**
 * @given secp256k1 signer
 * @when sign a message, then verify it intact and altered
 * @then only the intact message is accepted
 */
TEST_F(SignatureTest, Secp256k1SignVerify) {
  auto signer = testutil::keys::dave();
  EXPECT_OUTCOME_TRUE(signature, signer->sign(context_, message_));

  auto verifier = makeVerifier();
  EXPECT_OUTCOME_TRUE(
      valid, verifier->verify(signer->publicKey(), context_, message_, signature));
  EXPECT_TRUE(valid);
  EXPECT_OUTCOME_TRUE(tampered,
                      verifier->verify(signer->publicKey(),
                                       context_,
                                       "transaction bodY"_buf,
                                       signature));
  EXPECT_FALSE(tampered);
}

/**
 * @given ed25519 public key
 * @when verify a signature of a wrong length
 * @then it is reported as malformed
 */
TEST_F(SignatureTest, MalformedEd25519Signature) {
  auto verifier = makeVerifier();
  EXPECT_EC(verifier->verify(testutil::keys::alice()->publicKey(),
                             context_,
                             message_,
                             Buffer(63, 0)),
            SignatureVerifierImpl::Error::MALFORMED_SIGNATURE);
}

/**
 * @given verifier without sr25519 support
 * @when verify an sr25519 signature
 * @then the scheme is reported as unsupported
 */
TEST_F(SignatureTest, Sr25519Unsupported) {
  auto verifier = makeVerifier();
  PublicKey key{Sr25519PublicKey{}};
  EXPECT_EC(verifier->verify(key, context_, message_, Buffer(64, 0)),
            SignatureVerifierImpl::Error::UNSUPPORTED_SCHEME);
}

/**
 * @given verifier with an injected sr25519 verifier
 * @when verify an sr25519 signature
 * @then the call is delegated with context and message untouched
 */
TEST_F(SignatureTest, Sr25519Delegated) {
  auto sr25519 = std::make_shared<Sr25519VerifierMock>();
  auto verifier = makeVerifier(sr25519);
  Sr25519PublicKey key;
  key[0] = 0x42;
  Sr25519Signature signature;
  signature[0] = 0x17;

  EXPECT_CALL(*sr25519,
              verify(signature,
                     testing::Truly([&](oasis::common::BufferView v) {
                       return Buffer{v} == context_;
                     }),
                     testing::Truly([&](oasis::common::BufferView v) {
                       return Buffer{v} == message_;
                     }),
                     key))
      .WillOnce(Return(true));
  EXPECT_OUTCOME_TRUE(
      valid, verifier->verify(
          PublicKey{key}, context_, message_, signature.view()));
  EXPECT_TRUE(valid);
}

/**
 * @given runtime identifier and consensus chain context
 * @when derive the transaction signature context
 * @then it binds both to the base context
 */
TEST_F(SignatureTest, TxSignatureContext) {
  ChainContext chain{
      "8000000000000000000000000000000000000000000000000000000000000000"_hash256,
      "643fb06848be7e970af3b5b2d772eb8cfb30499c8162bc18ac03df2f5e22520e"};
  EXPECT_EQ(txSignatureContext(chain),
            "oasis-runtime-sdk/tx: v0 for chain "
            "ca4842870b97a6d5c0d025adce0b6a0dec94d2ba192ede70f96349cfbe3628b9");
}

/**
 * @given public keys of every scheme
 * @when encode them to CBOR and decode back
 * @then the scheme tag is preserved
 */
TEST_F(SignatureTest, PublicKeyCbor) {
  auto alice = testutil::keys::alice()->publicKey();
  auto encoded = oasis::cbor::encode(alice);
  EXPECT_EQ(encoded,
            "a1676564323535313958"
            "2035c3f3356dd85364feba0354b545ada109d1bdb38bf5d6126817db8c72cfd691"_unhex);
  EXPECT_OUTCOME_TRUE(decoded, oasis::cbor::decode<PublicKey>(encoded));
  EXPECT_EQ(decoded, alice);

  auto dave = testutil::keys::dave()->publicKey();
  EXPECT_OUTCOME_TRUE(decoded_dave,
                      oasis::cbor::decode<PublicKey>(oasis::cbor::encode(dave)));
  EXPECT_EQ(decoded_dave, dave);
}
