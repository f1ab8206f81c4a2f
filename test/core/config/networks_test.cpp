/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "config/default_networks.hpp"
#include "crypto/signature/context.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using oasis::config::ConfigError;
using oasis::config::defaultNetworks;
using oasis::config::DenominationInfo;
using oasis::config::Network;
using oasis::config::ParaTime;
using oasis::config::ParaTimes;

namespace {
  ParaTime paratime() {
    ParaTime paratime;
    paratime.id =
        "00000000000000000000000000000000000000000000000072c8215e60d5bca7"_hash256;
    paratime.denominations.emplace("_", DenominationInfo{"TEST", 18});
    paratime.denominations.emplace("usdc", DenominationInfo{"USDC", 6});
    return paratime;
  }
}  // namespace

/**
 * @given networks known out of the box
 * @when validate them and look up the defaults
 * @then mainnet with Emerald is the default
 */
TEST(Networks, Defaults) {
  auto networks = defaultNetworks();
  EXPECT_OUTCOME_TRUE_1(networks.validate());
  ASSERT_NE(networks.getDefault(), nullptr);
  EXPECT_EQ(networks.default_name, "mainnet");
  const auto &mainnet = *networks.getDefault();
  EXPECT_EQ(mainnet.denomination, (DenominationInfo{"ROSE", 9}));
  EXPECT_FALSE(mainnet.isLocalRpc());

  const auto *emerald = mainnet.paratimes.getDefault();
  ASSERT_NE(emerald, nullptr);
  EXPECT_EQ(mainnet.paratimes.default_name, "emerald");
  EXPECT_EQ(emerald->getDenominationInfo("").decimals, 18);
  EXPECT_EQ(oasis::crypto::txSignatureContext(mainnet.chainContextFor(*emerald)),
            "oasis-runtime-sdk/tx: v0 for chain "
            "cac08966e8ac2edf051c3ff598898260f3d878d00aa450573b70287b16eceab6");

  const auto *testnet = networks.find("testnet");
  ASSERT_NE(testnet, nullptr);
  ASSERT_NE(testnet->paratimes.find("cipher"), nullptr);
  EXPECT_EQ(networks.find("devnet"), nullptr);
}

/**
 * @given empty registry
 * @when add, select and remove entries
 * @then the default follows the entries
 */
TEST(Networks, Registry) {
  ParaTimes paratimes;
  EXPECT_EQ(paratimes.getDefault(), nullptr);

  EXPECT_OUTCOME_TRUE_1(paratimes.add("first", paratime()));
  EXPECT_EQ(paratimes.default_name, "first");
  EXPECT_OUTCOME_TRUE_1(paratimes.add("second", paratime()));
  EXPECT_EQ(paratimes.default_name, "first");
  EXPECT_EC(paratimes.add("second", paratime()), ConfigError::ALREADY_EXISTS);
  EXPECT_EC(paratimes.add("bad name", paratime()),
            ConfigError::MALFORMED_IDENTIFIER);
  EXPECT_EC(paratimes.add("", paratime()), ConfigError::MALFORMED_IDENTIFIER);

  EXPECT_OUTCOME_TRUE_1(paratimes.setDefault("second"));
  EXPECT_EC(paratimes.setDefault("third"), ConfigError::NOT_FOUND);

  EXPECT_OUTCOME_TRUE_1(paratimes.remove("second"));
  EXPECT_TRUE(paratimes.default_name.empty());
  EXPECT_EC(paratimes.remove("second"), ConfigError::NOT_FOUND);
  EXPECT_OUTCOME_TRUE_1(paratimes.validate());

  paratimes.default_name = "missing";
  EXPECT_EC(paratimes.validate(), ConfigError::DEFAULT_NOT_FOUND);
}

/**
 * @given ParaTime with native and token denominations
 * @when look up denomination infos
 * @then lookups fall back to lowercase names and then to the default info
 */
TEST(Networks, DenominationInfo) {
  auto p = paratime();
  EXPECT_EQ(p.getDenominationInfo(""), (DenominationInfo{"TEST", 18}));
  EXPECT_EQ(p.getDenominationInfo("usdc"), (DenominationInfo{"USDC", 6}));
  EXPECT_EQ(p.getDenominationInfo("USDC"), (DenominationInfo{"USDC", 6}));
  EXPECT_EQ(p.getDenominationInfo("FOO"), (DenominationInfo{"FOO", 9}));
}

/**
 * @given ParaTimes and networks breaking one rule each
 * @when validate them
 * @then the broken rule is reported
 */
TEST(Networks, Validation) {
  auto p = paratime();
  EXPECT_OUTCOME_TRUE_1(p.validate());

  p.consensus_denomination = "TEST";
  EXPECT_EC(p.validate(), ConfigError::INVALID_CONSENSUS_DENOMINATION);
  p.consensus_denomination = "usdc";
  EXPECT_OUTCOME_TRUE_1(p.validate());

  auto no_symbol = paratime();
  no_symbol.denominations["usdc"].symbol = "";
  EXPECT_EC(no_symbol.validate(), ConfigError::EMPTY_SYMBOL);

  auto too_precise = paratime();
  too_precise.denominations["usdc"].decimals = 39;
  EXPECT_EC(too_precise.validate(), ConfigError::TOO_MANY_DECIMALS);

  auto mainnet = *defaultNetworks().find("mainnet");
  EXPECT_OUTCOME_TRUE_1(mainnet.validate());

  auto bad_context = mainnet;
  bad_context.chain_context = "53852332";
  EXPECT_EC(bad_context.validate(), ConfigError::MALFORMED_CHAIN_CONTEXT);

  auto bad_rpc = mainnet;
  bad_rpc.rpc = "grpc.oasis.dev :443";
  EXPECT_EC(bad_rpc.validate(), ConfigError::MALFORMED_RPC);

  auto local = mainnet;
  local.rpc = "unix:/node/data/internal.sock";
  EXPECT_OUTCOME_TRUE_1(local.validate());
  EXPECT_TRUE(local.isLocalRpc());
}
