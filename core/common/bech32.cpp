/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/bech32.hpp"

#include <array>
#include <cctype>

OUTCOME_CPP_DEFINE_CATEGORY(oasis::common, Bech32Error, e) {
  using E = oasis::common::Bech32Error;
  switch (e) {
    case E::INVALID_LENGTH:
      return "Bech32 string has invalid length";
    case E::INVALID_CHARACTER:
      return "Bech32 string contains an invalid character";
    case E::MIXED_CASE:
      return "Bech32 string mixes upper and lower case";
    case E::MISSING_SEPARATOR:
      return "Bech32 string has no separator";
    case E::INVALID_CHECKSUM:
      return "Bech32 checksum mismatch";
    case E::INVALID_PADDING:
      return "Bech32 payload has non-zero padding";
  }
  return "Unknown Bech32Error";
}

namespace oasis::common {

  namespace {
    constexpr std::string_view kCharset = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";
    constexpr size_t kMaxLength = 90;
    constexpr size_t kChecksumLength = 6;

    uint32_t polymod(const std::vector<uint8_t> &values) {
      constexpr std::array<uint32_t, 5> kGenerator{
          0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3};
      uint32_t chk = 1;
      for (auto v : values) {
        uint8_t top = chk >> 25;
        chk = ((chk & 0x1ffffff) << 5) ^ v;
        for (size_t i = 0; i < kGenerator.size(); ++i) {
          if ((top >> i) & 1) {
            chk ^= kGenerator[i];
          }
        }
      }
      return chk;
    }

    std::vector<uint8_t> expandHrp(std::string_view hrp) {
      std::vector<uint8_t> out;
      out.reserve(hrp.size() * 2 + 1);
      for (char c : hrp) {
        out.push_back(static_cast<uint8_t>(c) >> 5);
      }
      out.push_back(0);
      for (char c : hrp) {
        out.push_back(static_cast<uint8_t>(c) & 31);
      }
      return out;
    }

    outcome::result<std::vector<uint8_t>> convertBits(BufferView in,
                                                      unsigned from,
                                                      unsigned to,
                                                      bool pad) {
      std::vector<uint8_t> out;
      uint32_t acc = 0;
      unsigned bits = 0;
      const uint32_t max_value = (1u << to) - 1;
      for (auto value : in) {
        acc = (acc << from) | value;
        bits += from;
        while (bits >= to) {
          bits -= to;
          out.push_back((acc >> bits) & max_value);
        }
      }
      if (pad) {
        if (bits > 0) {
          out.push_back((acc << (to - bits)) & max_value);
        }
      } else if (bits >= from || ((acc << (to - bits)) & max_value) != 0) {
        return Bech32Error::INVALID_PADDING;
      }
      return out;
    }
  }  // namespace

  std::string bech32Encode(std::string_view hrp, BufferView data) {
    // regrouping with padding never fails
    auto words = convertBits(data, 8, 5, true).value();

    auto values = expandHrp(hrp);
    values.insert(values.end(), words.begin(), words.end());
    values.resize(values.size() + kChecksumLength, 0);
    auto mod = polymod(values) ^ 1;

    std::string out{hrp};
    out.push_back('1');
    for (auto w : words) {
      out.push_back(kCharset[w]);
    }
    for (size_t i = 0; i < kChecksumLength; ++i) {
      out.push_back(kCharset[(mod >> (5 * (5 - i))) & 31]);
    }
    return out;
  }

  outcome::result<Bech32Data> bech32Decode(std::string_view str) {
    if (str.size() < 8 || str.size() > kMaxLength) {
      return Bech32Error::INVALID_LENGTH;
    }

    bool lower = false;
    bool upper = false;
    for (char c : str) {
      if (c < 33 || c > 126) {
        return Bech32Error::INVALID_CHARACTER;
      }
      lower |= c >= 'a' && c <= 'z';
      upper |= c >= 'A' && c <= 'Z';
    }
    if (lower && upper) {
      return Bech32Error::MIXED_CASE;
    }

    std::string normalized{str};
    for (auto &c : normalized) {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    auto pos = normalized.rfind('1');
    if (pos == std::string::npos) {
      return Bech32Error::MISSING_SEPARATOR;
    }
    if (pos == 0 || pos + kChecksumLength + 1 > normalized.size()) {
      return Bech32Error::INVALID_LENGTH;
    }

    std::string hrp = normalized.substr(0, pos);
    std::vector<uint8_t> words;
    words.reserve(normalized.size() - pos - 1);
    for (size_t i = pos + 1; i < normalized.size(); ++i) {
      auto idx = kCharset.find(normalized[i]);
      if (idx == std::string_view::npos) {
        return Bech32Error::INVALID_CHARACTER;
      }
      words.push_back(static_cast<uint8_t>(idx));
    }

    auto values = expandHrp(hrp);
    values.insert(values.end(), words.begin(), words.end());
    if (polymod(values) != 1) {
      return Bech32Error::INVALID_CHECKSUM;
    }

    words.resize(words.size() - kChecksumLength);
    OUTCOME_TRY(data, convertBits(words, 5, 8, false));
    return Bech32Data{.hrp = std::move(hrp), .data = Buffer{std::move(data)}};
  }

}  // namespace oasis::common
