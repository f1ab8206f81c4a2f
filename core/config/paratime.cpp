/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/paratime.hpp"

#include <algorithm>

namespace oasis::config {

  outcome::result<void> validateIdentifier(std::string_view identifier) {
    auto allowed = [](char c) {
      return (c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z')
          or (c >= '0' and c <= '9') or c == '_' or c == '-';
    };
    if (identifier.empty() or not std::ranges::all_of(identifier, allowed)) {
      return ConfigError::MALFORMED_IDENTIFIER;
    }
    return outcome::success();
  }

  outcome::result<void> ParaTime::validate() const {
    for (const auto &[name, info] : denominations) {
      if (name.empty()) {
        return ConfigError::MALFORMED_DENOMINATION;
      }
      OUTCOME_TRY(info.validate());
    }
    if (not consensus_denomination.empty()
        and not findDenominationInfo(consensus_denomination)) {
      return ConfigError::INVALID_CONSENSUS_DENOMINATION;
    }
    return outcome::success();
  }

  DenominationInfo ParaTime::getDenominationInfo(
      std::string_view denomination) const {
    if (auto info = findDenominationInfo(denomination)) {
      return std::move(info.value());
    }
    return DenominationInfo{.symbol = std::string{denomination},
                            .decimals = kDefaultDecimals};
  }

  std::optional<DenominationInfo> ParaTime::findDenominationInfo(
      std::string_view denomination) const {
    std::string key{denomination.empty() ? kNativeDenominationKey
                                         : denomination};
    if (auto it = denominations.find(key); it != denominations.end()) {
      return it->second;
    }
    std::ranges::transform(key, key.begin(), [](char c) {
      return (c >= 'A' and c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    });
    if (auto it = denominations.find(key); it != denominations.end()) {
      return it->second;
    }
    return std::nullopt;
  }

}  // namespace oasis::config
