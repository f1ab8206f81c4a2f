/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "callformat/call_format_codec.hpp"
#include "crypto/mrae/mrae_box.hpp"
#include "crypto/random_generator.hpp"
#include "crypto/x25519_provider.hpp"
#include "log/logger.hpp"

namespace oasis::callformat {

  class CallFormatCodecImpl : public CallFormatCodec {
   public:
    CallFormatCodecImpl(std::shared_ptr<crypto::X25519Provider> x25519_provider,
                        std::shared_ptr<crypto::CSPRNG> random);

    outcome::result<EncodedCall> encodeCall(
        const primitives::Call &call,
        primitives::CallFormat format,
        const EncodeConfig &config) const override;

    outcome::result<primitives::CallResult> decodeResult(
        const primitives::CallResult &result,
        const std::optional<CallMetadata> &metadata) const override;

    outcome::result<DecodedCall> decodeCall(
        const primitives::Call &call,
        const crypto::X25519Keypair &runtime_keypair) const override;

    outcome::result<primitives::CallResult> encodeResult(
        const primitives::CallResult &result,
        const std::optional<CallMetadata> &metadata,
        uint64_t round,
        uint32_t index) const override;

   private:
    outcome::result<crypto::DeoxysIINonce> randomNonce() const;

    std::shared_ptr<crypto::X25519Provider> x25519_provider_;
    std::shared_ptr<crypto::CSPRNG> random_;
    crypto::MraeBox box_;
    log::Logger logger_;
  };

}  // namespace oasis::callformat
