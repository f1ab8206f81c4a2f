/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/signature/public_key.hpp"

#include "common/visitor.hpp"
#include "crypto/secp256k1/secp256k1_provider_impl.hpp"

namespace oasis::crypto {
  namespace {
    constexpr std::string_view kEd25519 = "ed25519";
    constexpr std::string_view kSecp256k1 = "secp256k1";
    constexpr std::string_view kSr25519 = "sr25519";
  }  // namespace

  common::BufferView PublicKey::view() const {
    return std::visit([](const auto &k) { return k.view(); }, key);
  }

  std::string_view PublicKey::schemeName() const {
    return visit_in_place(
        key,
        [](const Ed25519PublicKey &) { return kEd25519; },
        [](const Secp256k1PublicKey &) { return kSecp256k1; },
        [](const Sr25519PublicKey &) { return kSr25519; });
  }

  cbor::Value toCbor(const PublicKey &public_key) {
    return cbor::Map{{public_key.schemeName(), public_key.view()}};
  }

  outcome::result<void> fromCbor(const cbor::Value &value, PublicKey &out) {
    OUTCOME_TRY(reader, cbor::MapReader::open(value));
    OUTCOME_TRY(scheme, reader.soleKey());
    OUTCOME_TRY(raw, reader.required(scheme));
    if (scheme == kEd25519) {
      OUTCOME_TRY(blob, cbor::asBlob<Ed25519PublicKey::size()>(*raw));
      out.key = Ed25519PublicKey{blob};
    } else if (scheme == kSecp256k1) {
      OUTCOME_TRY(blob, cbor::asBlob<Secp256k1PublicKey::size()>(*raw));
      Secp256k1PublicKey key{blob};
      OUTCOME_TRY(secp256k1::decompressPublicKey(key));
      out.key = key;
    } else if (scheme == kSr25519) {
      OUTCOME_TRY(blob, cbor::asBlob<Sr25519PublicKey::size()>(*raw));
      out.key = Sr25519PublicKey{blob};
    } else {
      return cbor::Error::UNKNOWN_FIELD;
    }
    return reader.finish();
  }

}  // namespace oasis::crypto
