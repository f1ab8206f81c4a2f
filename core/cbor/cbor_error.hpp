/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace oasis::cbor {

  /**
   * @brief CBOR decoding and shape errors
   */
  enum class Error {
    NOT_ENOUGH_DATA = 1,  ///< input ended in the middle of an item
    TRAILING_DATA,        ///< bytes left after the top-level item
    UNSUPPORTED_ITEM,     ///< tags, floats and undefined are not accepted
    INDEFINITE_LENGTH,    ///< indefinite-length items are not canonical
    DUPLICATE_KEY,        ///< map contains the same key twice
    TOO_DEEP,             ///< nesting exceeds the decoder limit
    UNEXPECTED_TYPE,      ///< item has a different major type than expected
    MISSING_FIELD,        ///< required map entry is absent
    UNKNOWN_FIELD,        ///< map entry that the target type does not know
    AMBIGUOUS_UNION,      ///< sum type map with zero or several alternatives
    INVALID_LENGTH,       ///< fixed-size byte string has a wrong length
    VALUE_OUT_OF_RANGE,   ///< integer does not fit into the target type
  };

}  // namespace oasis::cbor

OUTCOME_HPP_DECLARE_ERROR(oasis::cbor, Error);
