/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "callformat/call_format_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(oasis::callformat, CallFormatError, e) {
  using E = oasis::callformat::CallFormatError;
  switch (e) {
    case E::UNSUPPORTED_FORMAT:
      return "Unsupported call format";
    case E::MISSING_PUBLIC_KEY:
      return "Runtime call data public key is not set";
    case E::NON_EMPTY_METHOD:
      return "Encrypted call must have an empty method";
    case E::MALFORMED_ENVELOPE:
      return "Malformed call or result envelope";
    case E::MALFORMED_CALL:
      return "Decrypted call is malformed";
    case E::MALFORMED_RESULT:
      return "Decrypted result is malformed";
    case E::DECRYPTION_FAILED:
      return "Failed to open sealed envelope";
    case E::UNEXPECTED_RESULT:
      return "Unexpected plain successful result for an encrypted call";
  }
  return "Unknown call format error";
}
