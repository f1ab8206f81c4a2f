/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/token.hpp"

namespace oasis::primitives {

  cbor::Value toCbor(const Quantity &quantity) {
    common::Buffer bytes;
    boost::multiprecision::export_bits(
        quantity, std::back_inserter(bytes), 8, true);
    // export_bits writes a single zero byte for zero
    if (quantity == 0) {
      bytes.clear();
    }
    return bytes;
  }

  outcome::result<void> fromCbor(const cbor::Value &value, Quantity &out) {
    const auto *bytes = value.get<common::Buffer>();
    if (bytes == nullptr) {
      return cbor::Error::UNEXPECTED_TYPE;
    }
    if (not bytes->empty() and bytes->front() == 0) {
      return cbor::Error::VALUE_OUT_OF_RANGE;
    }
    if (bytes->size() > sizeof(uint64_t) * 2) {
      return cbor::Error::VALUE_OUT_OF_RANGE;
    }
    out = 0;
    if (not bytes->empty()) {
      boost::multiprecision::import_bits(out, bytes->begin(), bytes->end(), 8);
    }
    return outcome::success();
  }

  cbor::Value toCbor(const BaseUnits &units) {
    return cbor::Array{
        toCbor(units.amount),
        common::Buffer::fromString(units.denomination.name),
    };
  }

  outcome::result<void> fromCbor(const cbor::Value &value, BaseUnits &out) {
    OUTCOME_TRY(items, cbor::asArray(value));
    if (items->size() != 2) {
      return cbor::Error::INVALID_LENGTH;
    }
    OUTCOME_TRY(fromCbor((*items)[0], out.amount));
    OUTCOME_TRY(denomination, cbor::asBytes((*items)[1]));
    if (denomination.size() > kMaxDenominationSize) {
      return cbor::Error::INVALID_LENGTH;
    }
    out.denomination.name = std::string{denomination.asString()};
    return outcome::success();
  }

}  // namespace oasis::primitives
