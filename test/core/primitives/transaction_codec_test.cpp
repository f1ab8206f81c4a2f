/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/transaction.hpp"

#include <gtest/gtest.h>

#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/test_keys.hpp"

using oasis::cbor::decode;
using oasis::cbor::encode;
using oasis::common::Buffer;
using oasis::primitives::AddressSpec;
using oasis::primitives::AuthProof;
using oasis::primitives::CallFormat;
using oasis::primitives::CallResult;
using oasis::primitives::FailedCallResult;
using oasis::primitives::MultisigConfig;
using oasis::primitives::MultisigError;
using oasis::primitives::MultisigSigner;
using oasis::primitives::QueryRequest;
using oasis::primitives::SignatureAddressSpec;
using oasis::primitives::Transaction;
using oasis::primitives::TransactionError;
using oasis::primitives::UnverifiedTransaction;

class TransactionCodecTest : public testing::Test {
 protected:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  /// deposit call with gas 1000 signed by alice at nonce 7
  Transaction depositTx() const {
    auto tx = Transaction::make(std::nullopt, "consensus.Deposit", {});
    tx.auth_info.fee.gas = 1000;
    tx.appendAuthSignature(SignatureAddressSpec::fromPublicKey(
                               testutil::keys::alice()->publicKey()),
                           7);
    return tx;
  }

  Buffer deposit_tx_cbor_ =
      "a3617601626169a262736981a2656e6f6e6365076c616464726573735f73706563a169"
      "7369676e6174757265a16765643235353139582035c3f3356dd85364feba0354b545ad"
      "a109d1bdb38bf5d6126817db8c72cfd69163666565a2636761731903e866616d6f756e"
      "748240406463616c6ca264626f6479f6666d6574686f6471636f6e73656e7375732e44"
      "65706f736974"_unhex;
};

/**
 * @given plain transaction with one ed25519 signer
 * @when encode it
 * @then fields appear in canonical order and defaults are omitted
 */
TEST_F(TransactionCodecTest, EncodeTransaction) {
  EXPECT_EQ(encode(depositTx()), deposit_tx_cbor_);
}

/**
 * @given canonical encoding of a transaction
 * @when decode it
 * @then the original transaction is restored
 */
TEST_F(TransactionCodecTest, DecodeTransaction) {
  EXPECT_OUTCOME_TRUE(tx, decode<Transaction>(deposit_tx_cbor_));
  EXPECT_EQ(tx, depositTx());
  EXPECT_EQ(tx.call.format, CallFormat::PLAIN);
  EXPECT_FALSE(tx.call.read_only);
  EXPECT_OUTCOME_TRUE_1(tx.validateBasic());
}

/**
 * @given transaction of a version other than the latest
 * @when decode it
 * @then it is rejected
 */
TEST_F(TransactionCodecTest, UnsupportedVersion) {
  auto encoded = deposit_tx_cbor_;
  // "v": 1 -> "v": 2
  ASSERT_EQ(encoded[3], 0x01);
  encoded[3] = 0x02;
  EXPECT_EC(decode<Transaction>(encoded), TransactionError::UNSUPPORTED_VERSION);

  auto tx = depositTx();
  tx.version = 2;
  EXPECT_EC(tx.validateBasic(), TransactionError::UNSUPPORTED_VERSION);
}

/**
 * @given transaction with an unexpected top-level field
 * @when decode it
 * @then it is rejected
 */
TEST_F(TransactionCodecTest, UnknownField) {
  auto value = oasis::cbor::toCbor(depositTx());
  auto map = *value.get<oasis::cbor::Map>();
  map.emplace_back("extra", uint64_t{1});
  EXPECT_EC(decode<Transaction>(oasis::cbor::encodeValue(map)),
            oasis::cbor::Error::UNKNOWN_FIELD);
}

/**
 * @given transaction without signers
 * @when validate it
 * @then it is rejected
 */
TEST_F(TransactionCodecTest, NoSigners) {
  auto tx = Transaction::make(std::nullopt, "accounts.Transfer", {});
  EXPECT_EC(tx.validateBasic(), TransactionError::NO_SIGNERS);
}

/**
 * @given query for a method
 * @when convert it to a transaction
 * @then it carries the call and fee but no signer slots
 */
TEST_F(TransactionCodecTest, QueryRequest) {
  QueryRequest query;
  query.call.method = "accounts.Balances";
  query.call.read_only = true;
  query.fee.gas = 5;
  auto tx = query.toTransaction();
  EXPECT_EQ(tx.call, query.call);
  EXPECT_EQ(tx.auth_info.fee, query.fee);
  EXPECT_TRUE(tx.auth_info.signer_info.empty());
  EXPECT_EQ(encode(query), encode(tx));
}

/**
 * @given unverified transaction with an all-zero signature
 * @when hash it
 * @then hash is taken over its canonical encoding
 */
TEST_F(TransactionCodecTest, UnverifiedTransactionHash) {
  UnverifiedTransaction ut{
      .body = deposit_tx_cbor_,
      .auth_proofs = {AuthProof{AuthProof::Signature{Buffer(64, 0)}}}};
  EXPECT_EQ(
      ut.hash(),
      "89deeda998557b3f0c238da2367ee1afcc3b4b5c046ba7b82dbc2b3eb6617b16"_hash256);
  EXPECT_OUTCOME_TRUE(decoded, decode<UnverifiedTransaction>(encode(ut)));
  EXPECT_EQ(decoded, ut);
}

/**
 * @given multisig proof with a missing signature
 * @when encode and decode it
 * @then the missing slot is kept as null
 */
TEST_F(TransactionCodecTest, MultisigProof) {
  AuthProof proof{AuthProof::Multisig{{Buffer(64, 1), std::nullopt}}};
  auto encoded = encode(proof);
  EXPECT_EQ(encoded.size(), 1 + 9 + 1 + 2 + 64 + 1);
  EXPECT_EQ(encoded.back(), 0xf6);
  EXPECT_OUTCOME_TRUE(decoded, decode<AuthProof>(encoded));
  EXPECT_EQ(decoded, proof);

  EXPECT_EC(decode<AuthProof>("a0"_unhex), oasis::cbor::Error::AMBIGUOUS_UNION);
}

/**
 * @given address specs paired with proofs of every shape
 * @when collect signatures to verify
 * @then mismatched and unsigned proofs are rejected
 */
TEST_F(TransactionCodecTest, BatchProofs) {
  auto alice = testutil::keys::alice()->publicKey();
  AddressSpec solo{SignatureAddressSpec::fromPublicKey(alice)};
  AddressSpec multisig{MultisigConfig{
      .signers = {MultisigSigner{.public_key = alice, .weight = 1}},
      .threshold = 1}};

  EXPECT_OUTCOME_TRUE(
      checks, batch(solo, AuthProof{AuthProof::Signature{Buffer(64, 1)}}, 3));
  ASSERT_EQ(checks.size(), 1);
  EXPECT_EQ(checks[0].slot, 3);
  EXPECT_EQ(checks[0].sub_slot, std::nullopt);
  EXPECT_EQ(checks[0].public_key, alice);

  EXPECT_EC(batch(solo, AuthProof{AuthProof::Signature{}}, 0),
            TransactionError::MISSING_SIGNATURE);
  EXPECT_EC(batch(solo, AuthProof{AuthProof::Module{"evm"}}, 0),
            TransactionError::PROOF_MISMATCH);
  EXPECT_EC(batch(multisig, AuthProof{AuthProof::Signature{Buffer(64, 1)}}, 0),
            TransactionError::PROOF_MISMATCH);
  EXPECT_EC(batch(multisig, AuthProof{AuthProof::Multisig{{std::nullopt}}}, 0),
            MultisigError::INSUFFICIENT_WEIGHT);

  EXPECT_OUTCOME_TRUE(
      multi,
      batch(multisig, AuthProof{AuthProof::Multisig{{Buffer(64, 1)}}}, 1));
  ASSERT_EQ(multi.size(), 1);
  EXPECT_EQ(multi[0].sub_slot, 0);
}

/**
 * @given failed call result
 * @when encode and decode it
 * @then module, code and message are kept
 */
TEST_F(TransactionCodecTest, FailedCallResult) {
  CallResult result{FailedCallResult{
      .module = "accounts", .code = 2, .message = "insufficient balance"}};
  auto encoded = encode(result);
  EXPECT_EQ(encoded,
            "a1646661696ca364636f646502666d6f64756c65686163636f756e7473676d6573"
            "7361676574696e73756666696369656e742062616c616e6365"_unhex);
  EXPECT_FALSE(result.isSuccess());
  EXPECT_OUTCOME_TRUE(decoded, decode<CallResult>(encoded));
  EXPECT_EQ(decoded, result);

  // {"ok": null, "fail": ...} is not a valid result
  EXPECT_EC(decode<CallResult>("a2626f6bf6646661696ca0"_unhex),
            oasis::cbor::Error::AMBIGUOUS_UNION);
}
