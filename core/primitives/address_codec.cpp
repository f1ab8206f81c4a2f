/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/address_codec.hpp"

#include <stdexcept>

#include "common/bech32.hpp"
#include "common/visitor.hpp"
#include "crypto/keccak/keccak.hpp"
#include "crypto/secp256k1/secp256k1_provider_impl.hpp"
#include "crypto/sha/sha512_256.hpp"
#include "log/logger.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(oasis::primitives, AddressError, e) {
  using E = oasis::primitives::AddressError;
  switch (e) {
    case E::MALFORMED:
      return "Malformed address";
  }
  return "Unknown address error";
}

namespace oasis::primitives {
  namespace {
    common::BufferView bytesOf(std::string_view str) {
      return common::BufferView{std::span<const char>{str}};
    }

    log::Logger &logger() {
      static auto logger = log::createLogger("AddressCodec", "address");
      return logger;
    }
  }  // namespace

  Address deriveAddress(std::string_view context, common::BufferView data) {
    const uint8_t version = constants::address::VERSION;
    auto digest = crypto::sha512_256(
        {bytesOf(context), common::BufferView{&version, 1}, data});
    Address address;
    address[0] = version;
    std::copy_n(digest.begin(), Address::size() - 1, address.begin() + 1);
    return address;
  }

  Address addressFromSigSpec(const SignatureAddressSpec &spec) {
    return visit_in_place(
        spec.spec,
        [](const SignatureAddressSpec::Ed25519 &s) {
          return deriveAddress(address_context::kEd25519, s.key.view());
        },
        [](const SignatureAddressSpec::Secp256k1Eth &s) {
          auto eth = ethAddressFromPublicKey(s.key);
          if (eth.has_error()) {
            throw std::invalid_argument(
                fmt::format("cannot derive address of secp256k1 key {}: {}",
                            s.key.toHex(),
                            eth.error().message()));
          }
          return addressFromEth(eth.value());
        },
        [](const SignatureAddressSpec::Sr25519 &s) {
          return deriveAddress(address_context::kSr25519, s.key.view());
        });
  }

  Address addressFromMultisig(const MultisigConfig &config) {
    auto encoded = cbor::encode(config);
    return deriveAddress(address_context::kMultisig, encoded);
  }

  Address addressForModule(std::string_view module, common::BufferView kind) {
    common::Buffer data;
    data.put(module).put(".").put(kind);
    return deriveAddress(address_context::kModule, data);
  }

  Address addressFromRuntimeId(const common::Hash256 &runtime_id) {
    return deriveAddress(address_context::kRuntime, runtime_id.view());
  }

  Address addressFromEth(const EthAddress &eth_address) {
    return deriveAddress(address_context::kSecp256k1Eth, eth_address.view());
  }

  outcome::result<EthAddress> ethAddressFromPublicKey(
      const crypto::Secp256k1PublicKey &public_key) {
    OUTCOME_TRY(point, crypto::secp256k1::decompressPublicKey(public_key));
    auto digest = crypto::keccak(point.view());
    return EthAddress::fromSpan(
        digest.view().subspan(digest.size() - EthAddress::size()));
  }

  std::string encodeBech32(const Address &address) {
    return common::bech32Encode(kAddressBech32Hrp, address.view());
  }

  outcome::result<Address> decodeBech32(std::string_view text) {
    auto decoded = common::bech32Decode(text);
    if (decoded.has_error()) {
      SL_DEBUG(logger(),
               "Bad bech32 address '{}': {}",
               text,
               decoded.error().message());
      return AddressError::MALFORMED;
    }
    auto &[hrp, data] = decoded.value();
    if (hrp != kAddressBech32Hrp) {
      SL_DEBUG(logger(), "Address '{}' has unexpected prefix '{}'", text, hrp);
      return AddressError::MALFORMED;
    }
    if (data.size() != Address::size()
        or data[0] != constants::address::VERSION) {
      SL_DEBUG(logger(), "Address '{}' has wrong length or version", text);
      return AddressError::MALFORMED;
    }
    return Address::fromSpan(data);
  }

  cbor::Value toCbor(const Address &address) {
    return address.view();
  }

  outcome::result<void> fromCbor(const cbor::Value &value, Address &out) {
    OUTCOME_TRY(blob, cbor::asBlob<Address::size()>(value));
    out = Address{blob};
    return outcome::success();
  }

}  // namespace oasis::primitives
