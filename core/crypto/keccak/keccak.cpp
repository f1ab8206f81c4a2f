/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/keccak/keccak.hpp"

#include <array>
#include <bit>

namespace oasis::crypto {
  namespace {
    constexpr size_t kRate = 136;  // 1088 bits for 256-bit output

    constexpr std::array<uint64_t, 24> kRoundConstants{
        0x0000000000000001ull, 0x0000000000008082ull, 0x800000000000808aull,
        0x8000000080008000ull, 0x000000000000808bull, 0x0000000080000001ull,
        0x8000000080008081ull, 0x8000000000008009ull, 0x000000000000008aull,
        0x0000000000000088ull, 0x0000000080008009ull, 0x000000008000000aull,
        0x000000008000808bull, 0x800000000000008bull, 0x8000000000008089ull,
        0x8000000000008003ull, 0x8000000000008002ull, 0x8000000000000080ull,
        0x000000000000800aull, 0x800000008000000aull, 0x8000000080008081ull,
        0x8000000000008080ull, 0x0000000080000001ull, 0x8000000080008008ull,
    };

    constexpr std::array<int, 24> kRotations{
        1,  3,  6,  10, 15, 21, 28, 36, 45, 55, 2,  14,
        27, 41, 56, 8,  25, 43, 62, 18, 39, 61, 20, 44,
    };

    constexpr std::array<int, 24> kPi{
        10, 7,  11, 17, 18, 3, 5,  16, 8,  21, 24, 4,
        15, 23, 19, 13, 12, 2, 20, 14, 22, 9,  6,  1,
    };

    void keccakF1600(std::array<uint64_t, 25> &st) {
      std::array<uint64_t, 5> bc{};
      for (auto rc : kRoundConstants) {
        // theta
        for (size_t i = 0; i < 5; ++i) {
          bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];
        }
        for (size_t i = 0; i < 5; ++i) {
          auto t = bc[(i + 4) % 5] ^ std::rotl(bc[(i + 1) % 5], 1);
          for (size_t j = 0; j < 25; j += 5) {
            st[j + i] ^= t;
          }
        }
        // rho and pi
        auto t = st[1];
        for (size_t i = 0; i < 24; ++i) {
          auto j = kPi[i];
          auto tmp = st[j];
          st[j] = std::rotl(t, kRotations[i]);
          t = tmp;
        }
        // chi
        for (size_t j = 0; j < 25; j += 5) {
          for (size_t i = 0; i < 5; ++i) {
            bc[i] = st[j + i];
          }
          for (size_t i = 0; i < 5; ++i) {
            st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
          }
        }
        // iota
        st[0] ^= rc;
      }
    }

    void absorbBlock(std::array<uint64_t, 25> &st, const uint8_t *block) {
      for (size_t i = 0; i < kRate / 8; ++i) {
        uint64_t lane = 0;
        for (size_t b = 0; b < 8; ++b) {
          lane |= static_cast<uint64_t>(block[i * 8 + b]) << (8 * b);
        }
        st[i] ^= lane;
      }
      keccakF1600(st);
    }
  }  // namespace

  common::Hash256 keccak(common::BufferView buf) {
    std::array<uint64_t, 25> st{};
    size_t offset = 0;
    for (; buf.size() - offset >= kRate; offset += kRate) {
      absorbBlock(st, buf.data() + offset);
    }

    std::array<uint8_t, kRate> last{};
    std::copy(buf.begin() + offset, buf.end(), last.begin());
    last[buf.size() - offset] ^= 0x01;
    last[kRate - 1] ^= 0x80;
    absorbBlock(st, last.data());

    common::Hash256 out;
    for (size_t i = 0; i < out.size(); ++i) {
      out[i] = static_cast<uint8_t>(st[i / 8] >> (8 * (i % 8)));
    }
    return out;
  }
}  // namespace oasis::crypto
