/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/default_networks.hpp"

namespace oasis::config {

  namespace {
    ParaTime makeParaTime(std::string_view id, DenominationInfo native) {
      ParaTime paratime;
      paratime.id = common::Hash256::fromHex(id).value();
      paratime.denominations.emplace(std::string{kNativeDenominationKey},
                                     std::move(native));
      return paratime;
    }
  }  // namespace

  Networks defaultNetworks() {
    Network mainnet{
        .description = "",
        .chain_context =
            "53852332637bacb61b91b6411ab4095168ba02a50be4c3f82448438826f23898",
        .rpc = "grpc.oasis.dev:443",
        .denomination = {.symbol = "ROSE", .decimals = 9},
        .paratimes = {},
    };
    mainnet.paratimes.all.emplace(
        "cipher",
        makeParaTime(
            "000000000000000000000000000000000000000000000000e199119c992377cb",
            {.symbol = "ROSE", .decimals = 9}));
    mainnet.paratimes.all.emplace(
        "emerald",
        makeParaTime(
            "000000000000000000000000000000000000000000000000e2eaa99fc008f87f",
            {.symbol = "ROSE", .decimals = 18}));
    mainnet.paratimes.default_name = "emerald";

    Network testnet{
        .description = "",
        .chain_context =
            "5ba68bc5e01e06f755c4c044dd11ec508e4c17f1faf40c0e67874388437a9e55",
        .rpc = "testnet.grpc.oasis.dev:443",
        .denomination = {.symbol = "TEST", .decimals = 9},
        .paratimes = {},
    };
    testnet.paratimes.all.emplace(
        "cipher",
        makeParaTime(
            "0000000000000000000000000000000000000000000000000000000000000000",
            {.symbol = "TEST", .decimals = 9}));
    testnet.paratimes.all.emplace(
        "emerald",
        makeParaTime(
            "00000000000000000000000000000000000000000000000072c8215e60d5bca7",
            {.symbol = "TEST", .decimals = 18}));
    testnet.paratimes.default_name = "emerald";

    Networks networks;
    networks.all.emplace("mainnet", std::move(mainnet));
    networks.all.emplace("testnet", std::move(testnet));
    networks.default_name = "mainnet";
    return networks;
  }

}  // namespace oasis::config
