/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/bech32.hpp"

#include <gtest/gtest.h>

#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using oasis::common::Bech32Error;
using oasis::common::bech32Decode;
using oasis::common::bech32Encode;

/**
 * @given 21-byte payload with a known text form
 * @when encode it with "oasis" prefix
 * @then the checksummed text matches
 */
TEST(Bech32, EncodeKnownPayload) {
  auto payload = "00c8006304c3316c1835a4569ff7fc933e9f1cc4de"_unhex;
  EXPECT_EQ(bech32Encode("oasis", payload),
            "oasis1qryqqccycvckcxp453tflalujvlf78xymcdqw4vz");
}

/**
 * @given text form of an address
 * @when decode and encode it again
 * @then prefix is lowercase and text is reproduced
 */
TEST(Bech32, DecodeEncode) {
  const std::string text = "oasis1qryqqccycvckcxp453tflalujvlf78xymcdqw4vz";
  EXPECT_OUTCOME_TRUE(decoded, bech32Decode(text));
  EXPECT_EQ(decoded.hrp, "oasis");
  EXPECT_EQ(decoded.data, "00c8006304c3316c1835a4569ff7fc933e9f1cc4de"_unhex);
  EXPECT_EQ(bech32Encode(decoded.hrp, decoded.data), text);
}

/**
 * @given uppercase text form
 * @when decode it
 * @then it is accepted and the prefix is lowercased
 */
TEST(Bech32, UppercaseAccepted) {
  EXPECT_OUTCOME_TRUE(
      decoded, bech32Decode("OASIS1QRYQQCCYCVCKCXP453TFLALUJVLF78XYMCDQW4VZ"));
  EXPECT_EQ(decoded.hrp, "oasis");
}

/**
 * @given text forms broken in different ways
 * @when decode them
 * @then each is rejected with the matching error
 */
TEST(Bech32, Malformed) {
  EXPECT_EC(bech32Decode("oasis1qryqqccycvckcxp453tflalujvlf78xymcdqw4va"),
            Bech32Error::INVALID_CHECKSUM);
  EXPECT_EC(bech32Decode("Oasis1qryqqccycvckcxp453tflalujvlf78xymcdqw4vz"),
            Bech32Error::MIXED_CASE);
  EXPECT_EC(bech32Decode("oasisqryqqccycvckcxp453tflalujvlf78xymcdqw4vz"),
            Bech32Error::MISSING_SEPARATOR);
  EXPECT_EC(bech32Decode("oasis1qryqqccycvckcxp453tflalujvlf78xymcdqw4vb"),
            Bech32Error::INVALID_CHARACTER);
}
