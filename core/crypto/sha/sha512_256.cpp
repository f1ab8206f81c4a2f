/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/sha/sha512_256.hpp"

#include <memory>
#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace oasis::crypto {
  namespace {
    using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
  }

  common::Hash256 sha512_256(std::string_view input) {
    return sha512_256(
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        {reinterpret_cast<const uint8_t *>(input.data()), input.size()});
  }

  common::Hash256 sha512_256(common::BufferView input) {
    return sha512_256({input});
  }

  common::Hash256 sha512_256(std::initializer_list<common::BufferView> parts) {
    common::Hash256 out;
    EvpMdCtxPtr ctx{EVP_MD_CTX_new(), &EVP_MD_CTX_free};
    if (ctx == nullptr
        or EVP_DigestInit_ex(ctx.get(), EVP_sha512_256(), nullptr) != 1) {
      throw std::runtime_error("SHA-512/256 is not available");
    }
    for (const auto &part : parts) {
      if (EVP_DigestUpdate(ctx.get(), part.data(), part.size()) != 1) {
        throw std::runtime_error("SHA-512/256 update failed");
      }
    }
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1
        or len != out.size()) {
      throw std::runtime_error("SHA-512/256 finalization failed");
    }
    return out;
  }

  common::Hash256 hmacSha512_256(common::BufferView key,
                                 common::BufferView data) {
    common::Hash256 out;
    unsigned int len = 0;
    if (HMAC(EVP_sha512_256(),
             key.data(),
             static_cast<int>(key.size()),
             data.data(),
             data.size(),
             out.data(),
             &len)
        == nullptr) {
      throw std::runtime_error("HMAC-SHA-512/256 is not available");
    }
    return out;
  }
}  // namespace oasis::crypto
