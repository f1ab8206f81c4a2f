/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace oasis::callformat {

  enum class CallFormatError {
    UNSUPPORTED_FORMAT = 1,
    MISSING_PUBLIC_KEY,
    NON_EMPTY_METHOD,
    MALFORMED_ENVELOPE,
    MALFORMED_CALL,
    MALFORMED_RESULT,
    DECRYPTION_FAILED,
    UNEXPECTED_RESULT,
  };

}  // namespace oasis::callformat

OUTCOME_HPP_DECLARE_ERROR(oasis::callformat, CallFormatError);
