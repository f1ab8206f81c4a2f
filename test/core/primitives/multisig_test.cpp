/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/multisig.hpp"

#include <gtest/gtest.h>

#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/test_keys.hpp"

using oasis::common::Buffer;
using oasis::crypto::PublicKey;
using oasis::primitives::MultisigConfig;
using oasis::primitives::MultisigError;
using oasis::primitives::MultisigSigner;

class MultisigTest : public testing::Test {
 protected:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    alice_ = testutil::keys::alice()->publicKey();
    bob_ = testutil::keys::bob()->publicKey();
    charlie_ = testutil::keys::charlie()->publicKey();
  }

  /// alice and bob weigh 1, charlie weighs 2, threshold is 2
  MultisigConfig config() const {
    return MultisigConfig{
        .signers = {MultisigSigner{.public_key = alice_, .weight = 1},
                    MultisigSigner{.public_key = bob_, .weight = 1},
                    MultisigSigner{.public_key = charlie_, .weight = 2}},
        .threshold = 2};
  }

  PublicKey alice_;
  PublicKey bob_;
  PublicKey charlie_;
  Buffer signature_ = Buffer(64, 0xab);
};

/**
 * @given well formed config
 * @when validate it
 * @then validation passes
 */
TEST_F(MultisigTest, ValidConfig) {
  EXPECT_OUTCOME_TRUE_1(config().validateBasic());
}

/**
 * @given configs breaking one rule each
 * @when validate them
 * @then the broken rule is reported
 */
TEST_F(MultisigTest, InvalidConfigs) {
  auto zero_threshold = config();
  zero_threshold.threshold = 0;
  EXPECT_EC(zero_threshold.validateBasic(), MultisigError::ZERO_THRESHOLD);

  auto duplicate = config();
  duplicate.signers[1].public_key = alice_;
  EXPECT_EC(duplicate.validateBasic(), MultisigError::DUPLICATE_SIGNER);

  auto zero_weight = config();
  zero_weight.signers[0].weight = 0;
  EXPECT_EC(zero_weight.validateBasic(), MultisigError::ZERO_WEIGHT);

  auto overflow = config();
  overflow.signers[2].weight = std::numeric_limits<uint64_t>::max();
  EXPECT_EC(overflow.validateBasic(), MultisigError::WEIGHT_OVERFLOW);

  auto impossible = config();
  impossible.threshold = 5;
  EXPECT_EC(impossible.validateBasic(), MultisigError::IMPOSSIBLE_THRESHOLD);

  MultisigConfig empty{.signers = {}, .threshold = 1};
  EXPECT_EC(empty.validateBasic(), MultisigError::IMPOSSIBLE_THRESHOLD);
}

/**
 * @given signatures of signers whose weights reach the threshold
 * @when batch them
 * @then only the present signatures are selected, in signer order
 */
TEST_F(MultisigTest, BatchSelectsPresent) {
  EXPECT_OUTCOME_TRUE(checks,
                      config().batch({signature_, signature_, std::nullopt}));
  ASSERT_EQ(checks.size(), 2);
  EXPECT_EQ(checks[0].signer_index, 0);
  EXPECT_EQ(checks[0].public_key, alice_);
  EXPECT_EQ(checks[1].signer_index, 1);
  EXPECT_EQ(checks[1].public_key, bob_);
  EXPECT_EQ(checks[1].signature, signature_);

  EXPECT_OUTCOME_TRUE(heavy,
                      config().batch({std::nullopt, std::nullopt, signature_}));
  ASSERT_EQ(heavy.size(), 1);
  EXPECT_EQ(heavy[0].signer_index, 2);
}

/**
 * @given too few signatures or a wrong number of slots
 * @when batch them
 * @then batching fails
 */
TEST_F(MultisigTest, BatchRejects) {
  EXPECT_EC(config().batch({signature_, std::nullopt, std::nullopt}),
            MultisigError::INSUFFICIENT_WEIGHT);
  EXPECT_EC(config().batch({signature_, signature_}),
            MultisigError::WRONG_PROOF_COUNT);
}

/**
 * @given 2-of-2 config of alice and bob
 * @when encode it
 * @then fields are in canonical order
 */
TEST_F(MultisigTest, Encode) {
  MultisigConfig config{
      .signers = {MultisigSigner{.public_key = alice_, .weight = 1},
                  MultisigSigner{.public_key = bob_, .weight = 1}},
      .threshold = 2};
  auto encoded = oasis::cbor::encode(config);
  EXPECT_EQ(
      encoded,
      "a2677369676e65727382a266776569676874016a7075626c69635f6b6579a16765"
      "643235353139582035c3f3356dd85364feba0354b545ada109d1bdb38bf5d61268"
      "17db8c72cfd691a266776569676874016a7075626c69635f6b6579a16765643235"
      "3531395820620904895491e1231075f5f0fa9a6e15896a1f4b1ebad9c22a4f0a1b"
      "c3f2031d697468726573686f6c6402"_unhex);
  EXPECT_OUTCOME_TRUE(decoded, oasis::cbor::decode<MultisigConfig>(encoded));
  EXPECT_EQ(decoded, config);
}
