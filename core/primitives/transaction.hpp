/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "cbor/cbor.hpp"
#include "primitives/address.hpp"
#include "primitives/multisig.hpp"
#include "primitives/signature_address_spec.hpp"
#include "primitives/token.hpp"

namespace oasis::primitives {

  /// The only transaction version accepted by encoders and decoders
  constexpr uint16_t kLatestTransactionVersion = 1;

  enum class TransactionError {
    UNSUPPORTED_VERSION = 1,
    NO_SIGNERS,
    WRONG_PROOF_COUNT,
    PROOF_MISMATCH,
    MISSING_SIGNATURE,
  };

  /**
   * Encoding of the call and of its result
   */
  enum class CallFormat : uint8_t {
    PLAIN = 0,
    ENCRYPTED_X25519_DEOXYSII = 1,
  };

  std::string_view toString(CallFormat format);

  /**
   * Method call; the body is a CBOR value for plain calls and a call
   * envelope for encrypted ones
   */
  struct Call {
    CallFormat format = CallFormat::PLAIN;
    std::string method;
    cbor::Value body;
    bool read_only = false;

    bool operator==(const Call &) const = default;
  };

  /**
   * Fee paid on behalf of the signer by a module-specific proxy
   */
  struct FeeProxy {
    std::string module;
    common::Buffer id;

    bool operator==(const FeeProxy &) const = default;
  };

  struct Fee {
    BaseUnits amount;
    uint64_t gas = 0;
    uint32_t consensus_messages = 0;
    std::optional<FeeProxy> proxy;

    bool operator==(const Fee &) const = default;

    /**
     * @return amount per unit of gas, zero when either of them is zero
     */
    Quantity gasPrice() const;
  };

  /**
   * Specification of how a signer slot is authenticated
   */
  struct AddressSpec {
    std::variant<SignatureAddressSpec, MultisigConfig> spec;

    bool operator==(const AddressSpec &) const = default;

    Address address() const;
  };

  struct SignerInfo {
    AddressSpec address_spec;
    uint64_t nonce = 0;

    bool operator==(const SignerInfo &) const = default;
  };

  /**
   * Authentication proof for one signer slot
   */
  struct AuthProof {
    /// single signature, empty while the slot is not signed yet
    struct Signature {
      common::Buffer signature;
      bool operator==(const Signature &) const = default;
    };

    /// one optional signature per multisig signer
    struct Multisig {
      std::vector<std::optional<common::Buffer>> signatures;
      bool operator==(const Multisig &) const = default;
    };

    /// runtime module authentication, never accepted from clients
    struct Module {
      std::string name;
      bool operator==(const Module &) const = default;
    };

    std::variant<Signature, Multisig, Module> proof;

    bool operator==(const AuthProof &) const = default;
  };

  /**
   * Signature that has to be verified, with the position it comes from
   */
  struct SignatureCheck {
    size_t slot;
    /// index inside a multisig slot, nullopt for single signatures
    std::optional<size_t> sub_slot;
    crypto::PublicKey public_key;
    common::Buffer signature;
  };

  /**
   * Checks that \param proof has the kind and, for multisig, the number of
   * entries that \param spec requires. Missing signatures are allowed.
   */
  outcome::result<void> checkProofShape(const AddressSpec &spec,
                                        const AuthProof &proof);

  /**
   * Pairs address spec of a slot with its proof and returns the signatures
   * that have to be verified
   */
  outcome::result<std::vector<SignatureCheck>> batch(const AddressSpec &spec,
                                                     const AuthProof &proof,
                                                     size_t slot);

  struct AuthInfo {
    std::vector<SignerInfo> signer_info;
    Fee fee;
    std::optional<uint64_t> not_before;
    std::optional<uint64_t> not_after;

    bool operator==(const AuthInfo &) const = default;
  };

  struct Transaction {
    uint16_t version = kLatestTransactionVersion;
    Call call;
    AuthInfo auth_info;

    bool operator==(const Transaction &) const = default;

    /**
     * Plain call of \param method with \param body.
     * @param fee - nullopt means zero native tokens
     */
    static Transaction make(std::optional<Fee> fee,
                            std::string method,
                            cbor::Value body);

    /**
     * Call with an already sealed envelope as its body
     */
    static Transaction makeEncrypted(std::optional<Fee> fee,
                                     cbor::Value envelope);

    /**
     * Fails when version is not the latest or there are no signers
     */
    outcome::result<void> validateBasic() const;

    void appendSignerInfo(AddressSpec address_spec, uint64_t nonce);

    void appendAuthSignature(SignatureAddressSpec spec, uint64_t nonce);

    void appendAuthMultisig(MultisigConfig config, uint64_t nonce);
  };

  /**
   * Encoded transaction together with proofs aligned with its signer slots
   */
  struct UnverifiedTransaction {
    common::Buffer body;
    std::vector<AuthProof> auth_proofs;

    bool operator==(const UnverifiedTransaction &) const = default;

    /// SHA-512/256 of the canonical encoding
    common::Hash256 hash() const;
  };

  /**
   * Unsigned call used for read-only queries and gas estimation. Encodes
   * as a transaction without signer slots, which is never executable.
   */
  struct QueryRequest {
    Call call;
    Fee fee;

    bool operator==(const QueryRequest &) const = default;

    Transaction toTransaction() const;
  };

  struct FailedCallResult {
    std::string module;
    uint32_t code = 0;
    std::string message;

    bool operator==(const FailedCallResult &) const = default;

    std::string toString() const;
  };

  /**
   * Result of a method call
   */
  struct CallResult {
    struct Ok {
      cbor::Value value;
      bool operator==(const Ok &) const = default;
    };

    /// result still sealed in an envelope
    struct Unknown {
      cbor::Value value;
      bool operator==(const Unknown &) const = default;
    };

    std::variant<Ok, FailedCallResult, Unknown> result;

    bool operator==(const CallResult &) const = default;

    bool isSuccess() const;

    bool isUnknown() const;
  };

  cbor::Value toCbor(const Call &call);
  outcome::result<void> fromCbor(const cbor::Value &value, Call &out);

  cbor::Value toCbor(const FeeProxy &proxy);
  outcome::result<void> fromCbor(const cbor::Value &value, FeeProxy &out);

  cbor::Value toCbor(const Fee &fee);
  outcome::result<void> fromCbor(const cbor::Value &value, Fee &out);

  cbor::Value toCbor(const AddressSpec &spec);
  outcome::result<void> fromCbor(const cbor::Value &value, AddressSpec &out);

  cbor::Value toCbor(const SignerInfo &info);
  outcome::result<void> fromCbor(const cbor::Value &value, SignerInfo &out);

  cbor::Value toCbor(const AuthProof &proof);
  outcome::result<void> fromCbor(const cbor::Value &value, AuthProof &out);

  cbor::Value toCbor(const AuthInfo &info);
  outcome::result<void> fromCbor(const cbor::Value &value, AuthInfo &out);

  cbor::Value toCbor(const Transaction &tx);

  /// Rejects any version other than the latest
  outcome::result<void> fromCbor(const cbor::Value &value, Transaction &out);

  cbor::Value toCbor(const UnverifiedTransaction &ut);
  outcome::result<void> fromCbor(const cbor::Value &value,
                                 UnverifiedTransaction &out);

  cbor::Value toCbor(const QueryRequest &query);

  cbor::Value toCbor(const FailedCallResult &result);
  outcome::result<void> fromCbor(const cbor::Value &value,
                                 FailedCallResult &out);

  cbor::Value toCbor(const CallResult &result);
  outcome::result<void> fromCbor(const cbor::Value &value, CallResult &out);

}  // namespace oasis::primitives

OUTCOME_HPP_DECLARE_ERROR(oasis::primitives, TransactionError);
