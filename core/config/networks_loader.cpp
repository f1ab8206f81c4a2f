/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/networks_loader.hpp"

#include <limits>
#include <sstream>

#include <boost/property_tree/json_parser.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(oasis::config, NetworksLoader::Error, e) {
  using E = oasis::config::NetworksLoader::Error;
  switch (e) {
    case E::MISSING_ENTRY:
      return "A required entry is missing in the network config";
    case E::PARSER_ERROR:
      return "Network config is not valid JSON";
    case E::MALFORMED_ENTRY:
      return "An entry of the network config has a wrong type";
  }
  return "Unknown error in NetworksLoader";
}

namespace oasis::config {

  namespace pt = boost::property_tree;

  namespace {
    constexpr std::string_view kDefaultKey = "default";

    std::string optionalString(const pt::ptree &tree, const std::string &key) {
      return tree.get<std::string>(key, "");
    }
  }  // namespace

  NetworksLoader::NetworksLoader()
      : logger_{log::createLogger("NetworksLoader", "config")} {}

  outcome::result<Networks> NetworksLoader::loadFrom(
      const std::string &path) const {
    pt::ptree tree;
    try {
      pt::read_json(path, tree);
    } catch (pt::json_parser_error &e) {
      SL_ERROR(logger_,
               "Parser error: {}, line {}: {}",
               e.filename(),
               e.line(),
               e.message());
      return Error::PARSER_ERROR;
    }
    return loadNetworks(tree);
  }

  outcome::result<Networks> NetworksLoader::loadFromString(
      std::string_view json) const {
    pt::ptree tree;
    std::istringstream stream{std::string{json}};
    try {
      pt::read_json(stream, tree);
    } catch (pt::json_parser_error &e) {
      SL_ERROR(logger_, "Parser error, line {}: {}", e.line(), e.message());
      return Error::PARSER_ERROR;
    }
    return loadNetworks(tree);
  }

  outcome::result<Networks> NetworksLoader::loadNetworks(
      const pt::ptree &tree) const {
    Networks networks;
    for (const auto &[name, entry] : tree) {
      if (name == kDefaultKey) {
        networks.default_name = entry.get_value<std::string>();
        continue;
      }
      OUTCOME_TRY(network, loadNetwork(entry));
      networks.all.emplace(name, std::move(network));
    }
    if (auto res = networks.validate(); not res) {
      SL_ERROR(logger_, "Invalid network config: {}", res.error().message());
      return res.error();
    }
    SL_DEBUG(logger_, "Loaded {} networks", networks.all.size());
    return networks;
  }

  outcome::result<Network> NetworksLoader::loadNetwork(
      const pt::ptree &tree) const {
    Network network;
    network.description = optionalString(tree, "description");

    OUTCOME_TRY(chain_context,
                ensure("chain_context",
                       tree.get_optional<std::string>("chain_context")));
    network.chain_context = std::move(chain_context);

    OUTCOME_TRY(rpc, ensure("rpc", tree.get_optional<std::string>("rpc")));
    network.rpc = std::move(rpc);

    OUTCOME_TRY(denomination,
                ensure("denomination", tree.get_child_optional("denomination")));
    OUTCOME_TRY(denomination_info, loadDenominationInfo(denomination));
    network.denomination = std::move(denomination_info);

    if (auto paratimes = tree.get_child_optional("paratimes")) {
      for (const auto &[name, entry] : paratimes.value()) {
        if (name == kDefaultKey) {
          network.paratimes.default_name = entry.get_value<std::string>();
          continue;
        }
        OUTCOME_TRY(paratime, loadParaTime(entry));
        network.paratimes.all.emplace(name, std::move(paratime));
      }
    }
    return network;
  }

  outcome::result<ParaTime> NetworksLoader::loadParaTime(
      const pt::ptree &tree) const {
    ParaTime paratime;
    paratime.description = optionalString(tree, "description");

    OUTCOME_TRY(id, ensure("id", tree.get_optional<std::string>("id")));
    auto id_res = common::Hash256::fromHex(id);
    if (not id_res) {
      SL_ERROR(logger_, "Malformed ParaTime id: {}", id);
      return ConfigError::MALFORMED_PARATIME_ID;
    }
    paratime.id = id_res.value();

    if (auto denominations = tree.get_child_optional("denominations")) {
      for (const auto &[name, entry] : denominations.value()) {
        OUTCOME_TRY(info, loadDenominationInfo(entry));
        paratime.denominations.emplace(name, std::move(info));
      }
    }
    paratime.consensus_denomination =
        optionalString(tree, "consensus_denomination");
    return paratime;
  }

  outcome::result<DenominationInfo> NetworksLoader::loadDenominationInfo(
      const pt::ptree &tree) const {
    OUTCOME_TRY(symbol,
                ensure("symbol", tree.get_optional<std::string>("symbol")));
    OUTCOME_TRY(decimals_text,
                ensure("decimals", tree.get_optional<std::string>("decimals")));
    auto decimals = tree.get_optional<unsigned>("decimals");
    if (not decimals
        or decimals.value() > std::numeric_limits<uint8_t>::max()) {
      SL_ERROR(logger_, "Malformed denomination decimals: {}", decimals_text);
      return Error::MALFORMED_ENTRY;
    }
    return DenominationInfo{.symbol = std::move(symbol),
                            .decimals = static_cast<uint8_t>(decimals.value())};
  }

}  // namespace oasis::config
