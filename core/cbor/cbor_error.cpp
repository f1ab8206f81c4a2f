/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cbor/cbor_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(oasis::cbor, Error, e) {
  using E = oasis::cbor::Error;
  switch (e) {
    case E::NOT_ENOUGH_DATA:
      return "CBOR: not enough data to decode an item";
    case E::TRAILING_DATA:
      return "CBOR: unexpected trailing data";
    case E::UNSUPPORTED_ITEM:
      return "CBOR: unsupported item (tag, float or undefined)";
    case E::INDEFINITE_LENGTH:
      return "CBOR: indefinite-length items are forbidden";
    case E::DUPLICATE_KEY:
      return "CBOR: duplicate map key";
    case E::TOO_DEEP:
      return "CBOR: nesting level exceeds the limit";
    case E::UNEXPECTED_TYPE:
      return "CBOR: item has unexpected type";
    case E::MISSING_FIELD:
      return "CBOR: required field is missing";
    case E::UNKNOWN_FIELD:
      return "CBOR: unknown field";
    case E::AMBIGUOUS_UNION:
      return "CBOR: exactly one variant must be present";
    case E::INVALID_LENGTH:
      return "CBOR: byte string has invalid length";
    case E::VALUE_OUT_OF_RANGE:
      return "CBOR: integer value out of range";
  }
  return "Unknown CBOR error";
}
