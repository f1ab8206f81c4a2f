/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/secp256k1/secp256k1_provider_impl.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(oasis::crypto, Secp256k1ProviderError, e) {
  using E = oasis::crypto::Secp256k1ProviderError;
  switch (e) {
    case E::INVALID_ARGUMENT:
      return "invalid argument occured";
    case E::INVALID_PUBLIC_KEY:
      return "public key is not a valid compressed secp256k1 point";
    case E::INVALID_SIGNATURE_ENCODING:
      return "signature is not a valid DER-encoded ECDSA signature";
    case E::SIGN_FAILED:
      return "secp256k1 signing operation failed";
    case E::SERIALIZATION_FAILED:
      return "secp256k1 serialization failed";
  }
  return "unknown Secp256k1ProviderError error occured";
}

namespace oasis::crypto {
  namespace {
    using ContextPtr =
        std::unique_ptr<secp256k1_context, void (*)(secp256k1_context *)>;

    ContextPtr makeContext() {
      return {secp256k1_context_create(SECP256K1_CONTEXT_SIGN
                                       | SECP256K1_CONTEXT_VERIFY),
              secp256k1_context_destroy};
    }

    outcome::result<secp256k1::PublicKey> serializeUntagged(
        const secp256k1_context *context, const secp256k1_pubkey &pubkey) {
      secp256k1::UncompressedPublicKey full;
      size_t outputlen = full.size();
      if (1
          != secp256k1_ec_pubkey_serialize(context,
                                           full.data(),
                                           &outputlen,
                                           &pubkey,
                                           SECP256K1_EC_UNCOMPRESSED)) {
        return Secp256k1ProviderError::SERIALIZATION_FAILED;
      }
      return secp256k1::PublicKey::fromSpan(full.view().subspan(1));
    }
  }  // namespace

  namespace secp256k1 {
    outcome::result<PublicKey> decompressPublicKey(
        const Secp256k1PublicKey &public_key) {
      // parse and serialize need no precomputed tables
      static const ContextPtr context{
          secp256k1_context_create(SECP256K1_CONTEXT_VERIFY),
          secp256k1_context_destroy};
      secp256k1_pubkey pubkey;
      if (1
          != secp256k1_ec_pubkey_parse(
              context.get(), &pubkey, public_key.data(), public_key.size())) {
        return Secp256k1ProviderError::INVALID_PUBLIC_KEY;
      }
      return serializeUntagged(context.get(), pubkey);
    }
  }  // namespace secp256k1

  Secp256k1ProviderImpl::Secp256k1ProviderImpl()
      : context_(makeContext()),
        logger_{log::createLogger("Secp256k1Provider", "secp256k1")} {}

  outcome::result<secp256k1_pubkey> Secp256k1ProviderImpl::parsePublicKey(
      const Secp256k1PublicKey &public_key) const {
    secp256k1_pubkey pubkey;
    if (1
        != secp256k1_ec_pubkey_parse(
            context_.get(), &pubkey, public_key.data(), public_key.size())) {
      return Secp256k1ProviderError::INVALID_PUBLIC_KEY;
    }
    return pubkey;
  }

  outcome::result<Secp256k1Keypair> Secp256k1ProviderImpl::generateKeypair(
      const Secp256k1PrivateKey &secret_key) const {
    if (1
        != secp256k1_ec_seckey_verify(context_.get(),
                                      secret_key.unsafeBytes().data())) {
      return Secp256k1ProviderError::INVALID_ARGUMENT;
    }
    secp256k1_pubkey pubkey;
    if (1
        != secp256k1_ec_pubkey_create(
            context_.get(), &pubkey, secret_key.unsafeBytes().data())) {
      return Secp256k1ProviderError::INVALID_ARGUMENT;
    }
    Secp256k1Keypair keypair{.secret_key = secret_key, .public_key = {}};
    size_t outputlen = keypair.public_key.size();
    if (1
        != secp256k1_ec_pubkey_serialize(context_.get(),
                                         keypair.public_key.data(),
                                         &outputlen,
                                         &pubkey,
                                         SECP256K1_EC_COMPRESSED)) {
      return Secp256k1ProviderError::SERIALIZATION_FAILED;
    }
    return keypair;
  }

  outcome::result<secp256k1::PublicKey> Secp256k1ProviderImpl::decompress(
      const Secp256k1PublicKey &public_key) const {
    OUTCOME_TRY(pubkey, parsePublicKey(public_key));
    return serializeUntagged(context_.get(), pubkey);
  }

  outcome::result<Secp256k1Signature> Secp256k1ProviderImpl::signPrehashed(
      const secp256k1::MessageHash &digest,
      const Secp256k1PrivateKey &secret_key) const {
    secp256k1_ecdsa_signature sig;
    if (1
        != secp256k1_ecdsa_sign(context_.get(),
                                &sig,
                                digest.data(),
                                secret_key.unsafeBytes().data(),
                                secp256k1_nonce_function_rfc6979,
                                nullptr)) {
      SL_ERROR(logger_, "Error during secp256k1 sign");
      return Secp256k1ProviderError::SIGN_FAILED;
    }
    Secp256k1Signature der(secp256k1::constants::kMaxDerSignatureSize, 0);
    size_t outputlen = der.size();
    if (1
        != secp256k1_ecdsa_signature_serialize_der(
            context_.get(), der.data(), &outputlen, &sig)) {
      return Secp256k1ProviderError::SERIALIZATION_FAILED;
    }
    der.resize(outputlen);
    return der;
  }

  outcome::result<bool> Secp256k1ProviderImpl::verifyPrehashed(
      const secp256k1::MessageHash &digest,
      common::BufferView signature,
      const Secp256k1PublicKey &public_key) const {
    OUTCOME_TRY(pubkey, parsePublicKey(public_key));
    secp256k1_ecdsa_signature sig;
    if (1
        != secp256k1_ecdsa_signature_parse_der(
            context_.get(), &sig, signature.data(), signature.size())) {
      SL_DEBUG(logger_, "Malformed DER signature {}", signature);
      return Secp256k1ProviderError::INVALID_SIGNATURE_ENCODING;
    }
    // libsecp256k1 accepts only lower-S form
    secp256k1_ecdsa_signature_normalize(context_.get(), &sig, &sig);
    return 1
        == secp256k1_ecdsa_verify(
               context_.get(), &sig, digest.data(), &pubkey);
  }
}  // namespace oasis::crypto
