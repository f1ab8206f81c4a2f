/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/transaction.hpp"

#include <limits>

#include <fmt/format.h>

#include "common/visitor.hpp"
#include "crypto/sha/sha512_256.hpp"
#include "primitives/address_codec.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(oasis::primitives, TransactionError, e) {
  using E = oasis::primitives::TransactionError;
  switch (e) {
    case E::UNSUPPORTED_VERSION:
      return "Unsupported transaction version";
    case E::NO_SIGNERS:
      return "Transaction has no signer info";
    case E::WRONG_PROOF_COUNT:
      return "Number of auth proofs differs from number of signers";
    case E::PROOF_MISMATCH:
      return "Auth proof does not match address spec of the signer";
    case E::MISSING_SIGNATURE:
      return "Signer slot is not signed";
  }
  return "Unknown transaction error";
}

namespace oasis::primitives {
  namespace {
    template <typename T>
    outcome::result<T> asNarrowUint(const cbor::Value &value) {
      OUTCOME_TRY(number, cbor::asUint(value));
      if (number > std::numeric_limits<T>::max()) {
        return cbor::Error::VALUE_OUT_OF_RANGE;
      }
      return static_cast<T>(number);
    }

    template <typename T>
    outcome::result<T> decodeField(const cbor::Value &value) {
      T out{};
      OUTCOME_TRY(fromCbor(value, out));
      return out;
    }

    Fee zeroFee() {
      return Fee{.amount = BaseUnits{.amount = 0,
                                     .denomination = Denomination::native()}};
    }
  }  // namespace

  std::string_view toString(CallFormat format) {
    switch (format) {
      case CallFormat::PLAIN:
        return "plain";
      case CallFormat::ENCRYPTED_X25519_DEOXYSII:
        return "encrypted/x25519-deoxysii";
    }
    return "[unknown]";
  }

  Quantity Fee::gasPrice() const {
    if (gas == 0 or amount.amount == 0) {
      return 0;
    }
    return amount.amount / gas;
  }

  Address AddressSpec::address() const {
    return visit_in_place(
        spec,
        [](const SignatureAddressSpec &s) { return addressFromSigSpec(s); },
        [](const MultisigConfig &c) { return addressFromMultisig(c); });
  }

  outcome::result<void> checkProofShape(const AddressSpec &spec,
                                        const AuthProof &proof) {
    if (is_type<SignatureAddressSpec>(spec.spec)) {
      if (not is_type<AuthProof::Signature>(proof.proof)) {
        return TransactionError::PROOF_MISMATCH;
      }
      return outcome::success();
    }
    const auto &config = std::get<MultisigConfig>(spec.spec);
    const auto *multisig = if_type<AuthProof::Multisig>(proof.proof);
    if (multisig == nullptr) {
      return TransactionError::PROOF_MISMATCH;
    }
    if (multisig->signatures.size() != config.signers.size()) {
      return TransactionError::WRONG_PROOF_COUNT;
    }
    return outcome::success();
  }

  outcome::result<std::vector<SignatureCheck>> batch(const AddressSpec &spec,
                                                     const AuthProof &proof,
                                                     size_t slot) {
    if (const auto *sig_spec = if_type<SignatureAddressSpec>(spec.spec)) {
      const auto *sig = if_type<AuthProof::Signature>(proof.proof);
      if (sig == nullptr) {
        return TransactionError::PROOF_MISMATCH;
      }
      if (sig->signature.empty()) {
        return TransactionError::MISSING_SIGNATURE;
      }
      return std::vector<SignatureCheck>{
          SignatureCheck{.slot = slot,
                         .sub_slot = std::nullopt,
                         .public_key = sig_spec->publicKey(),
                         .signature = sig->signature}};
    }

    const auto &config = std::get<MultisigConfig>(spec.spec);
    const auto *multisig = if_type<AuthProof::Multisig>(proof.proof);
    if (multisig == nullptr) {
      return TransactionError::PROOF_MISMATCH;
    }
    OUTCOME_TRY(selected, config.batch(multisig->signatures));
    std::vector<SignatureCheck> checks;
    checks.reserve(selected.size());
    for (auto &s : selected) {
      checks.push_back(SignatureCheck{.slot = slot,
                                      .sub_slot = s.signer_index,
                                      .public_key = std::move(s.public_key),
                                      .signature = std::move(s.signature)});
    }
    return checks;
  }

  Transaction Transaction::make(std::optional<Fee> fee,
                                std::string method,
                                cbor::Value body) {
    Transaction tx;
    tx.call = Call{.format = CallFormat::PLAIN,
                   .method = std::move(method),
                   .body = std::move(body)};
    tx.auth_info.fee = fee ? std::move(*fee) : zeroFee();
    return tx;
  }

  Transaction Transaction::makeEncrypted(std::optional<Fee> fee,
                                         cbor::Value envelope) {
    Transaction tx;
    tx.call = Call{.format = CallFormat::ENCRYPTED_X25519_DEOXYSII,
                   .method = "",
                   .body = std::move(envelope)};
    tx.auth_info.fee = fee ? std::move(*fee) : zeroFee();
    return tx;
  }

  outcome::result<void> Transaction::validateBasic() const {
    if (version != kLatestTransactionVersion) {
      return TransactionError::UNSUPPORTED_VERSION;
    }
    if (auth_info.signer_info.empty()) {
      return TransactionError::NO_SIGNERS;
    }
    return outcome::success();
  }

  void Transaction::appendSignerInfo(AddressSpec address_spec, uint64_t nonce) {
    auth_info.signer_info.push_back(
        SignerInfo{.address_spec = std::move(address_spec), .nonce = nonce});
  }

  void Transaction::appendAuthSignature(SignatureAddressSpec spec,
                                        uint64_t nonce) {
    appendSignerInfo(AddressSpec{std::move(spec)}, nonce);
  }

  void Transaction::appendAuthMultisig(MultisigConfig config, uint64_t nonce) {
    appendSignerInfo(AddressSpec{std::move(config)}, nonce);
  }

  common::Hash256 UnverifiedTransaction::hash() const {
    return crypto::sha512_256(cbor::encode(*this));
  }

  Transaction QueryRequest::toTransaction() const {
    Transaction tx;
    tx.call = call;
    tx.auth_info.fee = fee;
    return tx;
  }

  std::string FailedCallResult::toString() const {
    return fmt::format(
        "module: {} code: {} message: {}", module, code, message);
  }

  bool CallResult::isSuccess() const {
    return not is_type<FailedCallResult>(result);
  }

  bool CallResult::isUnknown() const {
    return is_type<Unknown>(result);
  }

  cbor::Value toCbor(const Call &call) {
    cbor::Map map;
    if (call.format != CallFormat::PLAIN) {
      map.emplace_back("format", static_cast<uint8_t>(call.format));
    }
    if (not call.method.empty()) {
      map.emplace_back("method", call.method);
    }
    map.emplace_back("body", call.body);
    if (call.read_only) {
      map.emplace_back("ro", true);
    }
    return map;
  }

  outcome::result<void> fromCbor(const cbor::Value &value, Call &out) {
    OUTCOME_TRY(reader, cbor::MapReader::open(value));
    out = Call{};
    if (const auto *format = reader.optional("format")) {
      OUTCOME_TRY(f, asNarrowUint<uint8_t>(*format));
      if (f > static_cast<uint8_t>(CallFormat::ENCRYPTED_X25519_DEOXYSII)) {
        return cbor::Error::VALUE_OUT_OF_RANGE;
      }
      out.format = static_cast<CallFormat>(f);
    }
    if (const auto *method = reader.optional("method")) {
      OUTCOME_TRY(m, cbor::asText(*method));
      out.method = std::move(m);
    }
    OUTCOME_TRY(body, reader.required("body"));
    out.body = *body;
    if (const auto *ro = reader.optional("ro")) {
      OUTCOME_TRY(flag, cbor::asBool(*ro));
      out.read_only = flag;
    }
    return reader.finish();
  }

  cbor::Value toCbor(const FeeProxy &proxy) {
    return cbor::Map{
        {"module", proxy.module},
        {"id", proxy.id},
    };
  }

  outcome::result<void> fromCbor(const cbor::Value &value, FeeProxy &out) {
    OUTCOME_TRY(reader, cbor::MapReader::open(value));
    OUTCOME_TRY(module, reader.required("module"));
    OUTCOME_TRY(module_name, cbor::asText(*module));
    OUTCOME_TRY(id, reader.required("id"));
    OUTCOME_TRY(id_bytes, cbor::asBytes(*id));
    out.module = std::move(module_name);
    out.id = std::move(id_bytes);
    return reader.finish();
  }

  cbor::Value toCbor(const Fee &fee) {
    cbor::Map map;
    map.emplace_back("amount", toCbor(fee.amount));
    if (fee.gas != 0) {
      map.emplace_back("gas", fee.gas);
    }
    if (fee.consensus_messages != 0) {
      map.emplace_back("consensus_messages", fee.consensus_messages);
    }
    if (fee.proxy) {
      map.emplace_back("proxy", toCbor(*fee.proxy));
    }
    return map;
  }

  outcome::result<void> fromCbor(const cbor::Value &value, Fee &out) {
    OUTCOME_TRY(reader, cbor::MapReader::open(value));
    out = Fee{};
    OUTCOME_TRY(amount, reader.required("amount"));
    OUTCOME_TRY(fromCbor(*amount, out.amount));
    if (const auto *gas = reader.optional("gas")) {
      OUTCOME_TRY(g, cbor::asUint(*gas));
      out.gas = g;
    }
    if (const auto *messages = reader.optional("consensus_messages")) {
      OUTCOME_TRY(m, asNarrowUint<uint32_t>(*messages));
      out.consensus_messages = m;
    }
    if (const auto *proxy = reader.optional("proxy")) {
      OUTCOME_TRY(p, decodeField<FeeProxy>(*proxy));
      out.proxy = std::move(p);
    }
    return reader.finish();
  }

  cbor::Value toCbor(const AddressSpec &spec) {
    return visit_in_place(
        spec.spec,
        [](const SignatureAddressSpec &s) {
          return cbor::Value{cbor::Map{{"signature", toCbor(s)}}};
        },
        [](const MultisigConfig &c) {
          return cbor::Value{cbor::Map{{"multisig", toCbor(c)}}};
        });
  }

  outcome::result<void> fromCbor(const cbor::Value &value, AddressSpec &out) {
    OUTCOME_TRY(reader, cbor::MapReader::open(value));
    OUTCOME_TRY(kind, reader.soleKey());
    OUTCOME_TRY(inner, reader.required(kind));
    if (kind == "signature") {
      OUTCOME_TRY(s, decodeField<SignatureAddressSpec>(*inner));
      out.spec = std::move(s);
    } else if (kind == "multisig") {
      OUTCOME_TRY(c, decodeField<MultisigConfig>(*inner));
      out.spec = std::move(c);
    } else {
      return cbor::Error::UNKNOWN_FIELD;
    }
    return reader.finish();
  }

  cbor::Value toCbor(const SignerInfo &info) {
    return cbor::Map{
        {"address_spec", toCbor(info.address_spec)},
        {"nonce", info.nonce},
    };
  }

  outcome::result<void> fromCbor(const cbor::Value &value, SignerInfo &out) {
    OUTCOME_TRY(reader, cbor::MapReader::open(value));
    OUTCOME_TRY(spec, reader.required("address_spec"));
    OUTCOME_TRY(fromCbor(*spec, out.address_spec));
    OUTCOME_TRY(nonce, reader.required("nonce"));
    OUTCOME_TRY(n, cbor::asUint(*nonce));
    out.nonce = n;
    return reader.finish();
  }

  cbor::Value toCbor(const AuthProof &proof) {
    return visit_in_place(
        proof.proof,
        [](const AuthProof::Signature &p) {
          return cbor::Value{cbor::Map{{"signature", p.signature}}};
        },
        [](const AuthProof::Multisig &p) {
          cbor::Array signatures;
          signatures.reserve(p.signatures.size());
          for (const auto &signature : p.signatures) {
            if (signature) {
              signatures.emplace_back(*signature);
            } else {
              signatures.emplace_back(cbor::Null{});
            }
          }
          return cbor::Value{cbor::Map{{"multisig", std::move(signatures)}}};
        },
        [](const AuthProof::Module &p) {
          return cbor::Value{cbor::Map{{"module", p.name}}};
        });
  }

  outcome::result<void> fromCbor(const cbor::Value &value, AuthProof &out) {
    OUTCOME_TRY(reader, cbor::MapReader::open(value));
    OUTCOME_TRY(kind, reader.soleKey());
    OUTCOME_TRY(inner, reader.required(kind));
    if (kind == "signature") {
      OUTCOME_TRY(signature, cbor::asBytes(*inner));
      out.proof = AuthProof::Signature{std::move(signature)};
    } else if (kind == "multisig") {
      OUTCOME_TRY(items, cbor::asArray(*inner));
      AuthProof::Multisig multisig;
      multisig.signatures.reserve(items->size());
      for (const auto &item : *items) {
        if (item.isNull()) {
          multisig.signatures.emplace_back(std::nullopt);
          continue;
        }
        OUTCOME_TRY(signature, cbor::asBytes(item));
        multisig.signatures.emplace_back(std::move(signature));
      }
      out.proof = std::move(multisig);
    } else if (kind == "module") {
      OUTCOME_TRY(name, cbor::asText(*inner));
      out.proof = AuthProof::Module{std::move(name)};
    } else {
      return cbor::Error::UNKNOWN_FIELD;
    }
    return reader.finish();
  }

  cbor::Value toCbor(const AuthInfo &info) {
    cbor::Array signers;
    signers.reserve(info.signer_info.size());
    for (const auto &si : info.signer_info) {
      signers.emplace_back(toCbor(si));
    }
    cbor::Map map;
    map.emplace_back("si", std::move(signers));
    map.emplace_back("fee", toCbor(info.fee));
    if (info.not_before) {
      map.emplace_back("not_before", *info.not_before);
    }
    if (info.not_after) {
      map.emplace_back("not_after", *info.not_after);
    }
    return map;
  }

  outcome::result<void> fromCbor(const cbor::Value &value, AuthInfo &out) {
    OUTCOME_TRY(reader, cbor::MapReader::open(value));
    out = AuthInfo{};
    OUTCOME_TRY(signers, reader.required("si"));
    if (not signers->isNull()) {
      OUTCOME_TRY(items, cbor::asArray(*signers));
      out.signer_info.reserve(items->size());
      for (const auto &item : *items) {
        OUTCOME_TRY(si, decodeField<SignerInfo>(item));
        out.signer_info.push_back(std::move(si));
      }
    }
    OUTCOME_TRY(fee, reader.required("fee"));
    OUTCOME_TRY(fromCbor(*fee, out.fee));
    if (const auto *not_before = reader.optional("not_before")) {
      OUTCOME_TRY(round, cbor::asUint(*not_before));
      out.not_before = round;
    }
    if (const auto *not_after = reader.optional("not_after")) {
      OUTCOME_TRY(round, cbor::asUint(*not_after));
      out.not_after = round;
    }
    return reader.finish();
  }

  cbor::Value toCbor(const Transaction &tx) {
    return cbor::Map{
        {"v", tx.version},
        {"call", toCbor(tx.call)},
        {"ai", toCbor(tx.auth_info)},
    };
  }

  outcome::result<void> fromCbor(const cbor::Value &value, Transaction &out) {
    OUTCOME_TRY(reader, cbor::MapReader::open(value));
    OUTCOME_TRY(version, reader.required("v"));
    OUTCOME_TRY(v, asNarrowUint<uint16_t>(*version));
    if (v != kLatestTransactionVersion) {
      return TransactionError::UNSUPPORTED_VERSION;
    }
    out.version = v;
    OUTCOME_TRY(call, reader.required("call"));
    OUTCOME_TRY(fromCbor(*call, out.call));
    OUTCOME_TRY(auth_info, reader.required("ai"));
    OUTCOME_TRY(fromCbor(*auth_info, out.auth_info));
    return reader.finish();
  }

  cbor::Value toCbor(const UnverifiedTransaction &ut) {
    cbor::Array proofs;
    proofs.reserve(ut.auth_proofs.size());
    for (const auto &proof : ut.auth_proofs) {
      proofs.emplace_back(toCbor(proof));
    }
    return cbor::Array{ut.body, std::move(proofs)};
  }

  outcome::result<void> fromCbor(const cbor::Value &value,
                                 UnverifiedTransaction &out) {
    OUTCOME_TRY(items, cbor::asArray(value));
    if (items->size() != 2) {
      return cbor::Error::INVALID_LENGTH;
    }
    OUTCOME_TRY(body, cbor::asBytes((*items)[0]));
    out.body = std::move(body);
    out.auth_proofs.clear();
    const auto &proofs_value = (*items)[1];
    if (proofs_value.isNull()) {
      return outcome::success();
    }
    OUTCOME_TRY(proofs, cbor::asArray(proofs_value));
    out.auth_proofs.reserve(proofs->size());
    for (const auto &item : *proofs) {
      OUTCOME_TRY(proof, decodeField<AuthProof>(item));
      out.auth_proofs.push_back(std::move(proof));
    }
    return outcome::success();
  }

  cbor::Value toCbor(const QueryRequest &query) {
    return toCbor(query.toTransaction());
  }

  cbor::Value toCbor(const FailedCallResult &result) {
    cbor::Map map;
    map.emplace_back("module", result.module);
    map.emplace_back("code", result.code);
    if (not result.message.empty()) {
      map.emplace_back("message", result.message);
    }
    return map;
  }

  outcome::result<void> fromCbor(const cbor::Value &value,
                                 FailedCallResult &out) {
    OUTCOME_TRY(reader, cbor::MapReader::open(value));
    out = FailedCallResult{};
    OUTCOME_TRY(module, reader.required("module"));
    OUTCOME_TRY(module_name, cbor::asText(*module));
    out.module = std::move(module_name);
    OUTCOME_TRY(code, reader.required("code"));
    OUTCOME_TRY(c, asNarrowUint<uint32_t>(*code));
    out.code = c;
    if (const auto *message = reader.optional("message")) {
      OUTCOME_TRY(m, cbor::asText(*message));
      out.message = std::move(m);
    }
    return reader.finish();
  }

  cbor::Value toCbor(const CallResult &result) {
    return visit_in_place(
        result.result,
        [](const CallResult::Ok &r) {
          return cbor::Value{cbor::Map{{"ok", r.value}}};
        },
        [](const FailedCallResult &r) {
          return cbor::Value{cbor::Map{{"fail", toCbor(r)}}};
        },
        [](const CallResult::Unknown &r) {
          return cbor::Value{cbor::Map{{"unknown", r.value}}};
        });
  }

  outcome::result<void> fromCbor(const cbor::Value &value, CallResult &out) {
    OUTCOME_TRY(reader, cbor::MapReader::open(value));
    OUTCOME_TRY(kind, reader.soleKey());
    OUTCOME_TRY(inner, reader.required(kind));
    if (kind == "ok") {
      out.result = CallResult::Ok{*inner};
    } else if (kind == "fail") {
      OUTCOME_TRY(failed, decodeField<FailedCallResult>(*inner));
      out.result = std::move(failed);
    } else if (kind == "unknown") {
      out.result = CallResult::Unknown{*inner};
    } else {
      return cbor::Error::UNKNOWN_FIELD;
    }
    return reader.finish();
  }

}  // namespace oasis::primitives
