/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <optional>
#include <string>

#include "common/blob.hpp"
#include "config/denomination_info.hpp"
#include "config/registry.hpp"

namespace oasis::config {

  /// Key of the native denomination in the ParaTime denominations map
  constexpr std::string_view kNativeDenominationKey = "_";

  /// Decimals assumed for denominations missing from the config
  constexpr uint8_t kDefaultDecimals = 9;

  struct ParaTime {
    std::string description;
    common::Hash256 id;
    std::map<std::string, DenominationInfo> denominations;
    /// denomination representing consensus layer tokens, empty when
    /// consensus layer transfers are not supported
    std::string consensus_denomination;

    bool operator==(const ParaTime &) const = default;

    outcome::result<void> validate() const;

    /**
     * Denomination info of \param denomination, the native one for an empty
     * name. Falls back to the lowercase name and then to a default info with
     * the name as its symbol.
     */
    DenominationInfo getDenominationInfo(std::string_view denomination) const;

   private:
    std::optional<DenominationInfo> findDenominationInfo(
        std::string_view denomination) const;
  };

  using ParaTimes = Registry<ParaTime>;

}  // namespace oasis::config
