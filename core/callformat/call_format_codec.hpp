/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "callformat/call_format_error.hpp"
#include "crypto/deoxysii/deoxysii.hpp"
#include "crypto/x25519_types.hpp"
#include "primitives/transaction.hpp"

namespace oasis::callformat {

  /**
   * Call encoding parameters
   */
  struct EncodeConfig {
    /// runtime call data key, required by encrypted formats
    std::optional<crypto::X25519PublicKey> public_key;
    /// epoch the runtime key belongs to
    std::optional<uint64_t> epoch;
    /// ephemeral key pair, generated when not set
    std::optional<crypto::X25519Keypair> keypair;
    /// sealing nonce, drawn from the CSPRNG when not set
    std::optional<crypto::DeoxysIINonce> nonce;
  };

  /**
   * Key material of one side of an encrypted call, kept until its result is
   * decoded (client) or encoded (runtime)
   */
  struct CallMetadata {
    crypto::X25519Keypair keypair;
    crypto::X25519PublicKey peer_public_key;
  };

  /// Call as sent, with metadata absent for plain calls
  struct EncodedCall {
    primitives::Call call;
    std::optional<CallMetadata> metadata;
  };

  /// Call as executed, with metadata absent for plain calls
  struct DecodedCall {
    primitives::Call call;
    std::optional<CallMetadata> metadata;
  };

  /**
   * @class CallFormatCodec converts calls and results between the plain form
   * and the form they travel in
   */
  class CallFormatCodec {
   public:
    virtual ~CallFormatCodec() = default;

    /**
     * Client side: encodes \param call with \param format. Encrypted calls
     * are sealed for config.public_key with a fresh ephemeral key and nonce.
     */
    virtual outcome::result<EncodedCall> encodeCall(
        const primitives::Call &call,
        primitives::CallFormat format,
        const EncodeConfig &config) const = 0;

    /**
     * Client side: recovers the result of a call encoded with \param
     * metadata. Failures reported before decryption are returned unchanged.
     */
    virtual outcome::result<primitives::CallResult> decodeResult(
        const primitives::CallResult &result,
        const std::optional<CallMetadata> &metadata) const = 0;

    /**
     * Runtime side: opens an encrypted call with the runtime key pair
     */
    virtual outcome::result<DecodedCall> decodeCall(
        const primitives::Call &call,
        const crypto::X25519Keypair &runtime_keypair) const = 0;

    /**
     * Runtime side: seals \param result of the \param index-th call executed
     * in \param round
     */
    virtual outcome::result<primitives::CallResult> encodeResult(
        const primitives::CallResult &result,
        const std::optional<CallMetadata> &metadata,
        uint64_t round,
        uint32_t index) const = 0;
  };

}  // namespace oasis::callformat
