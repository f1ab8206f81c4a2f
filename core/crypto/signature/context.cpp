/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/signature/context.hpp"

#include <fmt/format.h>

#include "crypto/sha/sha512_256.hpp"

namespace oasis::crypto {

  std::string deriveChainContext(std::string_view base,
                                 const common::Hash256 &runtime_id,
                                 std::string_view consensus_chain_context) {
    auto digest = sha512_256(
        {runtime_id.view(),
         common::BufferView{std::span<const char>{consensus_chain_context}}});
    return fmt::format("{} for chain {}", base, digest.toHex());
  }

  std::string txSignatureContext(const ChainContext &chain) {
    return deriveChainContext(kTxSignatureContextBase,
                              chain.runtime_id,
                              chain.consensus_chain_context);
  }

}  // namespace oasis::crypto
