/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/deoxysii/deoxysii.hpp"

#include <openssl/crypto.h>

OUTCOME_CPP_DEFINE_CATEGORY(oasis::crypto, DeoxysIIError, e) {
  using E = oasis::crypto::DeoxysIIError;
  switch (e) {
    case E::CIPHERTEXT_TOO_SHORT:
      return "Deoxys-II ciphertext is shorter than the tag";
    case E::AUTHENTICATION_FAILED:
      return "Deoxys-II message authentication failed";
  }
  return "Unknown Deoxys-II error";
}

namespace oasis::crypto {
  namespace {
    using Block = DeoxysII::Block;
    constexpr size_t kBlockSize = constants::deoxysii::BLOCK_SIZE;

    // tweak domain prefixes, stored in the upper nibble of the first byte
    constexpr uint8_t kPrefixAdBlock = 0x2;
    constexpr uint8_t kPrefixAdFinal = 0x6;
    constexpr uint8_t kPrefixMsgBlock = 0x0;
    constexpr uint8_t kPrefixMsgFinal = 0x4;
    constexpr uint8_t kPrefixTag = 0x1;

    constexpr std::array<uint8_t, 256> kSbox{
        0x63, 0x7c, 0x77, 0x7b, 0xf2, 0x6b, 0x6f, 0xc5, 0x30, 0x01, 0x67, 0x2b,
        0xfe, 0xd7, 0xab, 0x76, 0xca, 0x82, 0xc9, 0x7d, 0xfa, 0x59, 0x47, 0xf0,
        0xad, 0xd4, 0xa2, 0xaf, 0x9c, 0xa4, 0x72, 0xc0, 0xb7, 0xfd, 0x93, 0x26,
        0x36, 0x3f, 0xf7, 0xcc, 0x34, 0xa5, 0xe5, 0xf1, 0x71, 0xd8, 0x31, 0x15,
        0x04, 0xc7, 0x23, 0xc3, 0x18, 0x96, 0x05, 0x9a, 0x07, 0x12, 0x80, 0xe2,
        0xeb, 0x27, 0xb2, 0x75, 0x09, 0x83, 0x2c, 0x1a, 0x1b, 0x6e, 0x5a, 0xa0,
        0x52, 0x3b, 0xd6, 0xb3, 0x29, 0xe3, 0x2f, 0x84, 0x53, 0xd1, 0x00, 0xed,
        0x20, 0xfc, 0xb1, 0x5b, 0x6a, 0xcb, 0xbe, 0x39, 0x4a, 0x4c, 0x58, 0xcf,
        0xd0, 0xef, 0xaa, 0xfb, 0x43, 0x4d, 0x33, 0x85, 0x45, 0xf9, 0x02, 0x7f,
        0x50, 0x3c, 0x9f, 0xa8, 0x51, 0xa3, 0x40, 0x8f, 0x92, 0x9d, 0x38, 0xf5,
        0xbc, 0xb6, 0xda, 0x21, 0x10, 0xff, 0xf3, 0xd2, 0xcd, 0x0c, 0x13, 0xec,
        0x5f, 0x97, 0x44, 0x17, 0xc4, 0xa7, 0x7e, 0x3d, 0x64, 0x5d, 0x19, 0x73,
        0x60, 0x81, 0x4f, 0xdc, 0x22, 0x2a, 0x90, 0x88, 0x46, 0xee, 0xb8, 0x14,
        0xde, 0x5e, 0x0b, 0xdb, 0xe0, 0x32, 0x3a, 0x0a, 0x49, 0x06, 0x24, 0x5c,
        0xc2, 0xd3, 0xac, 0x62, 0x91, 0x95, 0xe4, 0x79, 0xe7, 0xc8, 0x37, 0x6d,
        0x8d, 0xd5, 0x4e, 0xa9, 0x6c, 0x56, 0xf4, 0xea, 0x65, 0x7a, 0xae, 0x08,
        0xba, 0x78, 0x25, 0x2e, 0x1c, 0xa6, 0xb4, 0xc6, 0xe8, 0xdd, 0x74, 0x1f,
        0x4b, 0xbd, 0x8b, 0x8a, 0x70, 0x3e, 0xb5, 0x66, 0x48, 0x03, 0xf6, 0x0e,
        0x61, 0x35, 0x57, 0xb9, 0x86, 0xc1, 0x1d, 0x9e, 0xe1, 0xf8, 0x98, 0x11,
        0x69, 0xd9, 0x8e, 0x94, 0x9b, 0x1e, 0x87, 0xe9, 0xce, 0x55, 0x28, 0xdf,
        0x8c, 0xa1, 0x89, 0x0d, 0xbf, 0xe6, 0x42, 0x68, 0x41, 0x99, 0x2d, 0x0f,
        0xb0, 0x54, 0xbb, 0x16,
    };

    constexpr std::array<uint8_t, constants::deoxysii::ROUNDS + 1> kRcon{
        0x2f, 0x5e, 0xbc, 0x63, 0xc6, 0x97, 0x35, 0x6a, 0xd4,
        0xb3, 0x7d, 0xfa, 0xef, 0xc5, 0x91, 0x39, 0x72,
    };

    constexpr std::array<size_t, kBlockSize> kTweakPermutation{
        1, 6, 11, 12, 5, 10, 15, 0, 9, 14, 3, 4, 13, 2, 7, 8};

    Block permute(const Block &in) {
      Block out;
      for (size_t i = 0; i < kBlockSize; ++i) {
        out[i] = in[kTweakPermutation[i]];
      }
      return out;
    }

    uint8_t lfsr2(uint8_t b) {
      return static_cast<uint8_t>((b << 1) | (((b >> 7) ^ (b >> 5)) & 1));
    }

    uint8_t lfsr3(uint8_t b) {
      return static_cast<uint8_t>((b >> 1) | (((b << 7) ^ (b << 1)) & 0x80));
    }

    uint8_t xtime(uint8_t b) {
      return static_cast<uint8_t>((b << 1) ^ ((b & 0x80) != 0 ? 0x1b : 0));
    }

    /// SubBytes, ShiftRows, MixColumns, AddRoundKey; bytes are column-major
    Block aesRound(const Block &state, const Block &round_key) {
      Block s;
      for (size_t c = 0; c < 4; ++c) {
        for (size_t r = 0; r < 4; ++r) {
          s[4 * c + r] = kSbox[state[4 * ((c + r) % 4) + r]];
        }
      }
      Block out;
      for (size_t c = 0; c < 4; ++c) {
        auto a0 = s[4 * c], a1 = s[4 * c + 1], a2 = s[4 * c + 2],
             a3 = s[4 * c + 3];
        auto all = static_cast<uint8_t>(a0 ^ a1 ^ a2 ^ a3);
        out[4 * c] = a0 ^ all ^ xtime(a0 ^ a1);
        out[4 * c + 1] = a1 ^ all ^ xtime(a1 ^ a2);
        out[4 * c + 2] = a2 ^ all ^ xtime(a2 ^ a3);
        out[4 * c + 3] = a3 ^ all ^ xtime(a3 ^ a0);
      }
      for (size_t i = 0; i < kBlockSize; ++i) {
        out[i] ^= round_key[i];
      }
      return out;
    }

    void xorInto(Block &acc, const Block &value) {
      for (size_t i = 0; i < kBlockSize; ++i) {
        acc[i] ^= value[i];
      }
    }

    Block makeTweak(uint8_t prefix, uint64_t index) {
      Block tweak{};
      tweak[0] = static_cast<uint8_t>(prefix << 4);
      for (size_t i = 0; i < 8; ++i) {
        tweak[15 - i] = static_cast<uint8_t>(index >> (8 * i));
      }
      return tweak;
    }

    Block padBlock(common::BufferView tail) {
      Block block{};
      std::copy(tail.begin(), tail.end(), block.begin());
      block[tail.size()] = 0x80;
      return block;
    }

    Block toBlock(common::BufferView view) {
      Block block;
      std::copy(view.begin(), view.end(), block.begin());
      return block;
    }
  }  // namespace

  DeoxysII::DeoxysII(const DeoxysIIKey &key) {
    auto bytes = key.unsafeBytes();
    Block tk2;
    Block tk3;
    SecureCleanGuard guard2{tk2};
    SecureCleanGuard guard3{tk3};
    std::copy(bytes.begin() + kBlockSize, bytes.end(), tk2.begin());
    std::copy(bytes.begin(), bytes.begin() + kBlockSize, tk3.begin());

    for (size_t round = 0; round < derived_keys_.size(); ++round) {
      Block rc{1, 2, 4, 8};
      std::fill(rc.begin() + 4, rc.begin() + 8, kRcon[round]);
      auto &stk = derived_keys_[round];
      for (size_t i = 0; i < kBlockSize; ++i) {
        stk[i] = tk2[i] ^ tk3[i] ^ rc[i];
      }
      for (auto &b : tk2) {
        b = lfsr2(b);
      }
      for (auto &b : tk3) {
        b = lfsr3(b);
      }
      tk2 = permute(tk2);
      tk3 = permute(tk3);
    }
  }

  DeoxysII::~DeoxysII() {
    OPENSSL_cleanse(derived_keys_.data(), sizeof(derived_keys_));
  }

  Block DeoxysII::encryptBlock(const Block &tweak, const Block &block) const {
    auto tk1 = tweak;
    Block state = block;
    for (size_t i = 0; i < kBlockSize; ++i) {
      state[i] ^= derived_keys_[0][i] ^ tk1[i];
    }
    for (size_t round = 1; round < derived_keys_.size(); ++round) {
      tk1 = permute(tk1);
      Block round_key = derived_keys_[round];
      xorInto(round_key, tk1);
      state = aesRound(state, round_key);
    }
    return state;
  }

  Block DeoxysII::computeTag(const DeoxysIINonce &nonce,
                             common::BufferView message,
                             common::BufferView additional_data) const {
    Block auth{};

    uint64_t index = 0;
    auto ad = additional_data;
    for (; ad.size() >= kBlockSize; ad.dropFirst(kBlockSize), ++index) {
      xorInto(auth,
              encryptBlock(makeTweak(kPrefixAdBlock, index),
                           toBlock(ad.first(kBlockSize))));
    }
    if (not ad.empty()) {
      xorInto(auth,
              encryptBlock(makeTweak(kPrefixAdFinal, index), padBlock(ad)));
    }

    index = 0;
    auto msg = message;
    for (; msg.size() >= kBlockSize; msg.dropFirst(kBlockSize), ++index) {
      xorInto(auth,
              encryptBlock(makeTweak(kPrefixMsgBlock, index),
                           toBlock(msg.first(kBlockSize))));
    }
    if (not msg.empty()) {
      xorInto(auth,
              encryptBlock(makeTweak(kPrefixMsgFinal, index), padBlock(msg)));
    }

    Block tweak{};
    tweak[0] = static_cast<uint8_t>(kPrefixTag << 4);
    std::copy(nonce.begin(), nonce.end(), tweak.begin() + 1);
    return encryptBlock(tweak, auth);
  }

  void DeoxysII::applyKeystream(const Block &tag,
                                const DeoxysIINonce &nonce,
                                common::BufferView in,
                                uint8_t *out) const {
    Block input{};
    std::copy(nonce.begin(), nonce.end(), input.begin() + 1);

    for (uint64_t index = 0; not in.empty(); ++index) {
      auto tweak = tag;
      tweak[0] |= 0x80;
      for (size_t i = 0; i < 8; ++i) {
        tweak[15 - i] ^= static_cast<uint8_t>(index >> (8 * i));
      }
      auto stream = encryptBlock(tweak, input);
      auto n = std::min(in.size(), kBlockSize);
      for (size_t i = 0; i < n; ++i) {
        *out++ = in[i] ^ stream[i];
      }
      in.dropFirst(n);
    }
  }

  common::Buffer DeoxysII::seal(const DeoxysIINonce &nonce,
                                common::BufferView plaintext,
                                common::BufferView additional_data) const {
    auto tag = computeTag(nonce, plaintext, additional_data);
    common::Buffer out(plaintext.size() + tag.size(), 0);
    applyKeystream(tag, nonce, plaintext, out.data());
    std::copy(tag.begin(), tag.end(), out.begin() + plaintext.size());
    return out;
  }

  outcome::result<common::Buffer> DeoxysII::open(
      const DeoxysIINonce &nonce,
      common::BufferView ciphertext,
      common::BufferView additional_data) const {
    if (ciphertext.size() < constants::deoxysii::TAG_SIZE) {
      return DeoxysIIError::CIPHERTEXT_TOO_SHORT;
    }
    auto body_size = ciphertext.size() - constants::deoxysii::TAG_SIZE;
    auto tag = toBlock(ciphertext.subspan(body_size));

    common::Buffer plaintext(body_size, 0);
    applyKeystream(tag, nonce, ciphertext.first(body_size), plaintext.data());

    auto expected = computeTag(nonce, plaintext, additional_data);
    if (CRYPTO_memcmp(expected.data(), tag.data(), tag.size()) != 0) {
      OPENSSL_cleanse(plaintext.data(), plaintext.size());
      return DeoxysIIError::AUTHENTICATION_FAILED;
    }
    return plaintext;
  }
}  // namespace oasis::crypto
