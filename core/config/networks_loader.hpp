/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/property_tree/ptree.hpp>

#include "config/network.hpp"
#include "log/logger.hpp"

namespace oasis::config {

  /**
   * @class NetworksLoader reads network configuration from JSON. Every
   * object level holds an optional "default" name next to named entries:
   *
   * {
   *   "default": "mainnet",
   *   "mainnet": {
   *     "chain_context": "<hex>", "rpc": "host:port",
   *     "denomination": {"symbol": "ROSE", "decimals": 9},
   *     "paratimes": {
   *       "default": "emerald",
   *       "emerald": {"id": "<hex>", "denominations": {"_": {...}}}
   *     }
   *   }
   * }
   *
   * Loaded configuration is validated before it is returned.
   */
  class NetworksLoader {
   public:
    enum class Error {
      MISSING_ENTRY = 1,
      PARSER_ERROR,
      MALFORMED_ENTRY,
    };

    NetworksLoader();

    outcome::result<Networks> loadFrom(const std::string &path) const;

    outcome::result<Networks> loadFromString(std::string_view json) const;

   private:
    outcome::result<Networks> loadNetworks(
        const boost::property_tree::ptree &tree) const;
    outcome::result<Network> loadNetwork(
        const boost::property_tree::ptree &tree) const;
    outcome::result<ParaTime> loadParaTime(
        const boost::property_tree::ptree &tree) const;
    outcome::result<DenominationInfo> loadDenominationInfo(
        const boost::property_tree::ptree &tree) const;

    template <typename T>
    outcome::result<std::decay_t<T>> ensure(std::string_view entry_name,
                                            boost::optional<T> opt_entry) const {
      if (not opt_entry) {
        SL_ERROR(logger_,
                 "Required '{}' entry not found in the network config",
                 entry_name);
        return Error::MISSING_ENTRY;
      }
      return opt_entry.value();
    }

    log::Logger logger_;
  };

}  // namespace oasis::config

OUTCOME_HPP_DECLARE_ERROR(oasis::config, NetworksLoader::Error);
