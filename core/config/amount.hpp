/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "config/network.hpp"
#include "primitives/token.hpp"

namespace oasis::config {

  /**
   * Converts a decimal amount like "1.5" into base units of \param info.
   * @return TOO_MANY_DECIMALS when info.decimals exceeds kMaxDecimals,
   * MALFORMED_AMOUNT for anything but digits with an optional
   * fraction of at most info.decimals digits, AMOUNT_OVERFLOW when the
   * result does not fit into a Quantity
   */
  outcome::result<primitives::Quantity> parseAmount(const DenominationInfo &info,
                                                    std::string_view amount);

  /**
   * Formats base units as "<whole>.<fraction> <symbol>", trailing zeros of
   * the fraction are dropped but at least one digit is kept.
   * @return TOO_MANY_DECIMALS when info.decimals exceeds kMaxDecimals
   */
  outcome::result<std::string> formatAmount(
      const DenominationInfo &info, const primitives::Quantity &amount);

  outcome::result<primitives::Quantity> parseConsensusDenomination(
      const Network &network, std::string_view amount);

  outcome::result<primitives::BaseUnits> parseParaTimeDenomination(
      const ParaTime &paratime,
      std::string_view amount,
      const primitives::Denomination &denomination);

  outcome::result<std::string> formatConsensusDenomination(
      const Network &network, const primitives::Quantity &amount);

  outcome::result<std::string> formatParaTimeDenomination(
      const ParaTime &paratime, const primitives::BaseUnits &amount);

}  // namespace oasis::config
