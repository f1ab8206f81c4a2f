/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/blob.hpp"

namespace oasis::crypto {

  /// Base domain separation context for transaction signatures
  constexpr std::string_view kTxSignatureContextBase =
      "oasis-runtime-sdk/tx: v0";

  /**
   * Binds the base context to a particular runtime on a particular consensus
   * chain: base + " for chain " + hex(SHA-512/256(runtime_id || chain_context))
   * @param runtime_id - 32-byte runtime identifier
   * @param consensus_chain_context - hex string identifying the consensus
   * chain
   */
  std::string deriveChainContext(std::string_view base,
                                 const common::Hash256 &runtime_id,
                                 std::string_view consensus_chain_context);

  /**
   * Runtime instance on a consensus chain that transaction signatures are
   * bound to
   */
  struct ChainContext {
    common::Hash256 runtime_id;
    /// hex string identifying the consensus chain
    std::string consensus_chain_context;

    bool operator==(const ChainContext &) const = default;
  };

  std::string txSignatureContext(const ChainContext &chain);

}  // namespace oasis::crypto
