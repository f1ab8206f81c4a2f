/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/x25519/x25519_provider_impl.hpp"

#include <memory>

#include <openssl/evp.h>

OUTCOME_CPP_DEFINE_CATEGORY(oasis::crypto, X25519ProviderImpl::Error, e) {
  using E = oasis::crypto::X25519ProviderImpl::Error;
  switch (e) {
    case E::KEY_GENERATION_FAILED:
      return "Failed to generate x25519 key pair";
    case E::INVALID_KEY:
      return "Invalid x25519 key";
    case E::DERIVATION_FAILED:
      return "x25519 key agreement failed";
  }
  return "Unknown error in x25519 provider";
}

namespace oasis::crypto {
  namespace {
    using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
    using EvpPkeyCtxPtr =
        std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;

    EvpPkeyPtr makePrivate(const X25519PrivateKey &secret_key) {
      return {EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519,
                                           nullptr,
                                           secret_key.unsafeBytes().data(),
                                           secret_key.size()),
              &EVP_PKEY_free};
    }

    EvpPkeyPtr makePublic(const X25519PublicKey &public_key) {
      return {EVP_PKEY_new_raw_public_key(
                  EVP_PKEY_X25519, nullptr, public_key.data(), public_key.size()),
              &EVP_PKEY_free};
    }
  }  // namespace

  X25519ProviderImpl::X25519ProviderImpl()
      : logger_{log::createLogger("X25519Provider", "x25519")} {}

  outcome::result<X25519Keypair> X25519ProviderImpl::generateKeypair() const {
    EvpPkeyCtxPtr ctx{EVP_PKEY_CTX_new_id(EVP_PKEY_X25519, nullptr),
                      &EVP_PKEY_CTX_free};
    EVP_PKEY *raw = nullptr;
    if (ctx == nullptr or EVP_PKEY_keygen_init(ctx.get()) != 1
        or EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
      SL_ERROR(logger_, "Failed to generate x25519 key pair");
      return Error::KEY_GENERATION_FAILED;
    }
    EvpPkeyPtr pkey{raw, &EVP_PKEY_free};

    std::array<uint8_t, constants::x25519::PRIVKEY_SIZE> secret{};
    SecureCleanGuard guard{secret};
    size_t len = secret.size();
    if (EVP_PKEY_get_raw_private_key(pkey.get(), secret.data(), &len) != 1) {
      return Error::KEY_GENERATION_FAILED;
    }
    X25519Keypair keypair{.secret_key = {}, .public_key = {}};
    len = keypair.public_key.size();
    if (EVP_PKEY_get_raw_public_key(
            pkey.get(), keypair.public_key.data(), &len)
        != 1) {
      return Error::KEY_GENERATION_FAILED;
    }
    keypair.secret_key = X25519PrivateKey::from(std::move(guard));
    return keypair;
  }

  outcome::result<X25519Keypair> X25519ProviderImpl::keypairFromSecret(
      const X25519PrivateKey &secret_key) const {
    auto pkey = makePrivate(secret_key);
    if (pkey == nullptr) {
      return Error::INVALID_KEY;
    }
    X25519Keypair keypair{.secret_key = secret_key, .public_key = {}};
    size_t len = keypair.public_key.size();
    if (EVP_PKEY_get_raw_public_key(
            pkey.get(), keypair.public_key.data(), &len)
        != 1) {
      return Error::INVALID_KEY;
    }
    return keypair;
  }

  outcome::result<X25519SharedSecret> X25519ProviderImpl::dh(
      const X25519PrivateKey &secret_key,
      const X25519PublicKey &peer_public_key) const {
    auto own = makePrivate(secret_key);
    auto peer = makePublic(peer_public_key);
    if (own == nullptr or peer == nullptr) {
      return Error::INVALID_KEY;
    }
    EvpPkeyCtxPtr ctx{EVP_PKEY_CTX_new(own.get(), nullptr), &EVP_PKEY_CTX_free};
    if (ctx == nullptr or EVP_PKEY_derive_init(ctx.get()) != 1
        or EVP_PKEY_derive_set_peer(ctx.get(), peer.get()) != 1) {
      return Error::DERIVATION_FAILED;
    }
    std::array<uint8_t, constants::x25519::SHARED_SECRET_SIZE> shared{};
    SecureCleanGuard guard{shared};
    size_t len = shared.size();
    if (EVP_PKEY_derive(ctx.get(), shared.data(), &len) != 1
        or len != shared.size()) {
      SL_DEBUG(logger_, "x25519 key agreement with {} failed", peer_public_key);
      return Error::DERIVATION_FAILED;
    }
    return X25519SharedSecret::from(std::move(guard));
  }
}  // namespace oasis::crypto
