/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "callformat/impl/call_format_codec_impl.hpp"

#include <boost/assert.hpp>
#include <boost/endian/conversion.hpp>

#include "common/visitor.hpp"
#include "primitives/callformat.hpp"

namespace oasis::callformat {

  using primitives::Call;
  using primitives::CallFormat;
  using primitives::CallResult;

  CallFormatCodecImpl::CallFormatCodecImpl(
      std::shared_ptr<crypto::X25519Provider> x25519_provider,
      std::shared_ptr<crypto::CSPRNG> random)
      : x25519_provider_{std::move(x25519_provider)},
        random_{std::move(random)},
        box_{x25519_provider_},
        logger_{log::createLogger("CallFormatCodec", "callformat")} {
    BOOST_ASSERT(x25519_provider_ != nullptr);
    BOOST_ASSERT(random_ != nullptr);
  }

  outcome::result<crypto::DeoxysIINonce> CallFormatCodecImpl::randomNonce()
      const {
    auto bytes = random_->randomBytes(crypto::constants::deoxysii::NONCE_SIZE);
    return crypto::DeoxysIINonce::fromSpan(bytes);
  }

  outcome::result<EncodedCall> CallFormatCodecImpl::encodeCall(
      const Call &call, CallFormat format, const EncodeConfig &config) const {
    switch (format) {
      case CallFormat::PLAIN:
        return EncodedCall{.call = call, .metadata = std::nullopt};
      case CallFormat::ENCRYPTED_X25519_DEOXYSII:
        break;
      default:
        return CallFormatError::UNSUPPORTED_FORMAT;
    }

    if (not config.public_key) {
      return CallFormatError::MISSING_PUBLIC_KEY;
    }
    const auto &runtime_pk = *config.public_key;

    crypto::X25519Keypair keypair;
    if (config.keypair) {
      keypair = *config.keypair;
    } else {
      OUTCOME_TRY(generated, x25519_provider_->generateKeypair());
      keypair = std::move(generated);
    }

    crypto::DeoxysIINonce nonce;
    if (config.nonce) {
      nonce = *config.nonce;
    } else {
      OUTCOME_TRY(random_nonce, randomNonce());
      nonce = random_nonce;
    }

    auto raw_call = cbor::encode(call);
    OUTCOME_TRY(sealed,
                box_.seal(nonce,
                          raw_call,
                          common::BufferView{},
                          runtime_pk,
                          keypair.secret_key));

    primitives::CallEnvelopeX25519DeoxysII envelope{
        .pk = keypair.public_key,
        .nonce = nonce,
        .epoch = config.epoch,
        .data = std::move(sealed),
    };
    SL_TRACE(logger_,
             "Sealed call of {} bytes for runtime key {}",
             raw_call.size(),
             runtime_pk);

    return EncodedCall{
        .call = Call{.format = format,
                     .method = "",
                     .body = toCbor(envelope),
                     .read_only = call.read_only},
        .metadata = CallMetadata{.keypair = std::move(keypair),
                                 .peer_public_key = runtime_pk},
    };
  }

  outcome::result<CallResult> CallFormatCodecImpl::decodeResult(
      const CallResult &result,
      const std::optional<CallMetadata> &metadata) const {
    if (not metadata) {
      return result;
    }

    const auto *unknown = if_type<CallResult::Unknown>(result.result);
    if (unknown == nullptr) {
      if (result.isSuccess()) {
        SL_DEBUG(logger_, "Plain successful result for an encrypted call");
        return CallFormatError::UNEXPECTED_RESULT;
      }
      // failed before the call format was processed
      return result;
    }

    primitives::ResultEnvelopeX25519DeoxysII envelope;
    if (auto res = fromCbor(unknown->value, envelope); not res) {
      SL_DEBUG(logger_, "Malformed result envelope: {}", res.error().message());
      return CallFormatError::MALFORMED_ENVELOPE;
    }

    auto plaintext = box_.open(envelope.nonce,
                               envelope.data,
                               common::BufferView{},
                               metadata->peer_public_key,
                               metadata->keypair.secret_key);
    if (not plaintext) {
      SL_DEBUG(logger_,
               "Failed to open result envelope: {}",
               plaintext.error().message());
      return CallFormatError::DECRYPTION_FAILED;
    }

    auto output = cbor::decode<CallResult>(plaintext.value());
    if (not output) {
      SL_DEBUG(logger_, "Malformed result: {}", output.error().message());
      return CallFormatError::MALFORMED_RESULT;
    }
    return output.value();
  }

  outcome::result<DecodedCall> CallFormatCodecImpl::decodeCall(
      const Call &call, const crypto::X25519Keypair &runtime_keypair) const {
    switch (call.format) {
      case CallFormat::PLAIN:
        return DecodedCall{.call = call, .metadata = std::nullopt};
      case CallFormat::ENCRYPTED_X25519_DEOXYSII:
        break;
      default:
        return CallFormatError::UNSUPPORTED_FORMAT;
    }

    if (not call.method.empty()) {
      return CallFormatError::NON_EMPTY_METHOD;
    }

    primitives::CallEnvelopeX25519DeoxysII envelope;
    if (auto res = fromCbor(call.body, envelope); not res) {
      SL_DEBUG(logger_, "Malformed call envelope: {}", res.error().message());
      return CallFormatError::MALFORMED_ENVELOPE;
    }

    auto plaintext = box_.open(envelope.nonce,
                               envelope.data,
                               common::BufferView{},
                               envelope.pk,
                               runtime_keypair.secret_key);
    if (not plaintext) {
      SL_DEBUG(logger_,
               "Failed to open call envelope from {}: {}",
               envelope.pk,
               plaintext.error().message());
      return CallFormatError::DECRYPTION_FAILED;
    }

    auto inner = cbor::decode<Call>(plaintext.value());
    if (not inner) {
      SL_DEBUG(logger_, "Malformed call: {}", inner.error().message());
      return CallFormatError::MALFORMED_CALL;
    }

    return DecodedCall{
        .call = std::move(inner.value()),
        .metadata = CallMetadata{.keypair = runtime_keypair,
                                 .peer_public_key = envelope.pk},
    };
  }

  outcome::result<CallResult> CallFormatCodecImpl::encodeResult(
      const CallResult &result,
      const std::optional<CallMetadata> &metadata,
      uint64_t round,
      uint32_t index) const {
    if (not metadata) {
      return result;
    }

    // round (be64) || index (be32) || 00 00 00
    crypto::DeoxysIINonce nonce;
    boost::endian::store_big_u64(nonce.data(), round);
    boost::endian::store_big_u32(nonce.data() + sizeof(round), index);

    OUTCOME_TRY(sealed,
                box_.seal(nonce,
                          cbor::encode(result),
                          common::BufferView{},
                          metadata->peer_public_key,
                          metadata->keypair.secret_key));

    primitives::ResultEnvelopeX25519DeoxysII envelope{
        .nonce = nonce,
        .data = std::move(sealed),
    };
    return CallResult{CallResult::Unknown{toCbor(envelope)}};
  }

}  // namespace oasis::callformat
