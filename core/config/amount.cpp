/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/amount.hpp"

#include <algorithm>
#include <limits>

#include <fmt/format.h>

namespace oasis::config {

  using primitives::Quantity;

  namespace {
    bool isDigits(std::string_view text) {
      return std::ranges::all_of(
          text, [](char c) { return c >= '0' and c <= '9'; });
    }

    Quantity pow10(uint8_t exponent) {
      Quantity result = 1;
      for (uint8_t i = 0; i < exponent; ++i) {
        result *= 10;
      }
      return result;
    }
  }  // namespace

  outcome::result<Quantity> parseAmount(const DenominationInfo &info,
                                        std::string_view amount) {
    if (info.decimals > kMaxDecimals) {
      return ConfigError::TOO_MANY_DECIMALS;
    }
    auto whole = amount;
    std::string_view fraction;
    if (auto dot = amount.find('.'); dot != std::string_view::npos) {
      whole = amount.substr(0, dot);
      fraction = amount.substr(dot + 1);
      if (fraction.empty()) {
        return ConfigError::MALFORMED_AMOUNT;
      }
    }
    if (whole.empty() or not isDigits(whole) or not isDigits(fraction)
        or fraction.size() > info.decimals) {
      return ConfigError::MALFORMED_AMOUNT;
    }

    const auto max = std::numeric_limits<Quantity>::max();
    Quantity value = 0;
    auto push_digit = [&](char c) -> outcome::result<void> {
      const unsigned digit = c - '0';
      if (value > (max - digit) / 10) {
        return ConfigError::AMOUNT_OVERFLOW;
      }
      value = value * 10 + digit;
      return outcome::success();
    };

    for (char c : whole) {
      OUTCOME_TRY(push_digit(c));
    }
    for (char c : fraction) {
      OUTCOME_TRY(push_digit(c));
    }
    for (size_t i = fraction.size(); i < info.decimals; ++i) {
      OUTCOME_TRY(push_digit('0'));
    }
    return value;
  }

  outcome::result<std::string> formatAmount(const DenominationInfo &info,
                                           const Quantity &amount) {
    // 10^39 does not fit into a Quantity
    if (info.decimals > kMaxDecimals) {
      return ConfigError::TOO_MANY_DECIMALS;
    }
    const auto divisor = pow10(info.decimals);
    const Quantity whole = amount / divisor;
    const Quantity fraction = amount % divisor;
    if (fraction == 0) {
      return fmt::format("{}.0 {}", whole.str(), info.symbol);
    }
    auto digits = fraction.str();
    digits.insert(0, info.decimals - digits.size(), '0');
    digits.erase(digits.find_last_not_of('0') + 1);
    return fmt::format("{}.{} {}", whole.str(), digits, info.symbol);
  }

  outcome::result<Quantity> parseConsensusDenomination(
      const Network &network, std::string_view amount) {
    return parseAmount(network.denomination, amount);
  }

  outcome::result<primitives::BaseUnits> parseParaTimeDenomination(
      const ParaTime &paratime,
      std::string_view amount,
      const primitives::Denomination &denomination) {
    OUTCOME_TRY(
        quantity,
        parseAmount(paratime.getDenominationInfo(denomination.name), amount));
    return primitives::BaseUnits{.amount = quantity,
                                 .denomination = denomination};
  }

  outcome::result<std::string> formatConsensusDenomination(
      const Network &network, const Quantity &amount) {
    return formatAmount(network.denomination, amount);
  }

  outcome::result<std::string> formatParaTimeDenomination(
      const ParaTime &paratime, const primitives::BaseUnits &amount) {
    return formatAmount(paratime.getDenominationInfo(amount.denomination.name),
                        amount.amount);
  }

}  // namespace oasis::config
