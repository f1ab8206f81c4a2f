/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/signature/signature_verifier_impl.hpp"

#include <boost/assert.hpp>

#include "common/visitor.hpp"
#include "crypto/signature/signer.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(oasis::crypto, SignatureVerifierImpl::Error, e) {
  using E = oasis::crypto::SignatureVerifierImpl::Error;
  switch (e) {
    case E::MALFORMED_SIGNATURE:
      return "Signature has a wrong length for its scheme";
    case E::UNSUPPORTED_SCHEME:
      return "No verifier is configured for the signature scheme";
  }
  return "Unknown signature verifier error";
}

namespace oasis::crypto {

  SignatureVerifierImpl::SignatureVerifierImpl(
      std::shared_ptr<Ed25519Provider> ed25519_provider,
      std::shared_ptr<Secp256k1Provider> secp256k1_provider,
      std::shared_ptr<Sr25519Verifier> sr25519_verifier)
      : ed25519_provider_{std::move(ed25519_provider)},
        secp256k1_provider_{std::move(secp256k1_provider)},
        sr25519_verifier_{std::move(sr25519_verifier)},
        logger_{log::createLogger("SignatureVerifier", "crypto")} {
    BOOST_ASSERT(ed25519_provider_ != nullptr);
    BOOST_ASSERT(secp256k1_provider_ != nullptr);
  }

  outcome::result<bool> SignatureVerifierImpl::verify(
      const PublicKey &public_key,
      common::BufferView context,
      common::BufferView message,
      common::BufferView signature) const {
    return visit_in_place(
        public_key.key,
        [&](const Ed25519PublicKey &key) -> outcome::result<bool> {
          auto sig_res = Ed25519Signature::fromSpan(signature);
          if (not sig_res) {
            return Error::MALFORMED_SIGNATURE;
          }
          auto digest = prepareSignerMessage(context, message);
          return ed25519_provider_->verify(sig_res.value(), digest, key);
        },
        [&](const Secp256k1PublicKey &key) -> outcome::result<bool> {
          auto digest = prepareSignerMessage(context, message);
          return secp256k1_provider_->verifyPrehashed(digest, signature, key);
        },
        [&](const Sr25519PublicKey &key) -> outcome::result<bool> {
          if (sr25519_verifier_ == nullptr) {
            SL_WARN(logger_,
                    "sr25519 signature by {} can not be verified",
                    key);
            return Error::UNSUPPORTED_SCHEME;
          }
          auto sig_res = Sr25519Signature::fromSpan(signature);
          if (not sig_res) {
            return Error::MALFORMED_SIGNATURE;
          }
          return sr25519_verifier_->verify(
              sig_res.value(), context, message, key);
        });
  }

}  // namespace oasis::crypto
