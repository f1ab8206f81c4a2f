/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/address_resolver.hpp"

#include "common/bytestr.hpp"
#include "log/logger.hpp"
#include "primitives/address_codec.hpp"

namespace oasis::config {

  namespace {
    constexpr std::string_view kPrefixOasis = "oasis1";
    constexpr std::string_view kPrefixEth = "0x";
    constexpr char kExplicitSeparator = ':';
    constexpr std::string_view kExplicitParaTime = "paratime";
    constexpr std::string_view kExplicitPool = "pool";

    log::Logger logger() {
      static auto logger = log::createLogger("AddressResolver", "config");
      return logger;
    }

    outcome::result<primitives::Address> poolAddress(std::string_view pool) {
      auto module_address = [](std::string_view module, std::string_view kind) {
        return primitives::addressForModule(module, str2byte(kind));
      };
      if (pool == "rewards") {
        return module_address("rewards", "reward-pool");
      }
      if (pool == "common") {
        return module_address("accounts", "common-pool");
      }
      if (pool == "fee-accumulator") {
        return module_address("accounts", "fee-accumulator");
      }
      SL_DEBUG(logger(), "Unsupported pool kind: {}", pool);
      return ConfigError::UNSUPPORTED_ADDRESS_KIND;
    }
  }  // namespace

  outcome::result<primitives::Address> resolveAddress(const Network &network,
                                                      std::string_view text) {
    if (text.starts_with(kPrefixOasis)) {
      return primitives::decodeBech32(text);
    }

    if (text.starts_with(kPrefixEth)) {
      auto eth =
          primitives::EthAddress::fromHex(text.substr(kPrefixEth.size()));
      if (not eth) {
        SL_DEBUG(logger(), "Malformed Ethereum address: {}", text);
        return ConfigError::MALFORMED_ADDRESS;
      }
      return primitives::addressFromEth(eth.value());
    }

    if (auto pos = text.find(kExplicitSeparator);
        pos != std::string_view::npos) {
      auto kind = text.substr(0, pos);
      auto data = text.substr(pos + 1);
      if (kind == kExplicitParaTime) {
        const auto *paratime = network.paratimes.find(std::string{data});
        if (paratime == nullptr) {
          SL_DEBUG(logger(), "ParaTime '{}' does not exist", data);
          return ConfigError::NOT_FOUND;
        }
        return primitives::addressFromRuntimeId(paratime->id);
      }
      if (kind == kExplicitPool) {
        return poolAddress(data);
      }
      SL_DEBUG(logger(), "Unsupported explicit address kind: {}", kind);
      return ConfigError::UNSUPPORTED_ADDRESS_KIND;
    }

    return ConfigError::MALFORMED_ADDRESS;
  }

}  // namespace oasis::config
