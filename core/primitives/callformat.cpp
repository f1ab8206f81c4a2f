/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/callformat.hpp"

namespace oasis::primitives {

  cbor::Value toCbor(const CallEnvelopeX25519DeoxysII &envelope) {
    cbor::Map map;
    map.emplace_back("pk", envelope.pk.view());
    map.emplace_back("nonce", envelope.nonce.view());
    if (envelope.epoch and *envelope.epoch != 0) {
      map.emplace_back("epoch", *envelope.epoch);
    }
    map.emplace_back("data", envelope.data);
    return map;
  }

  outcome::result<void> fromCbor(const cbor::Value &value,
                                 CallEnvelopeX25519DeoxysII &out) {
    OUTCOME_TRY(reader, cbor::MapReader::open(value));
    OUTCOME_TRY(pk, reader.required("pk"));
    OUTCOME_TRY(pk_blob, cbor::asBlob<crypto::X25519PublicKey::size()>(*pk));
    out.pk = crypto::X25519PublicKey{pk_blob};
    OUTCOME_TRY(nonce, reader.required("nonce"));
    OUTCOME_TRY(nonce_blob,
                cbor::asBlob<crypto::DeoxysIINonce::size()>(*nonce));
    out.nonce = crypto::DeoxysIINonce{nonce_blob};
    out.epoch.reset();
    if (const auto *epoch = reader.optional("epoch")) {
      OUTCOME_TRY(e, cbor::asUint(*epoch));
      out.epoch = e;
    }
    OUTCOME_TRY(data, reader.required("data"));
    OUTCOME_TRY(bytes, cbor::asBytes(*data));
    out.data = std::move(bytes);
    return reader.finish();
  }

  cbor::Value toCbor(const ResultEnvelopeX25519DeoxysII &envelope) {
    return cbor::Map{
        {"nonce", envelope.nonce.view()},
        {"data", envelope.data},
    };
  }

  outcome::result<void> fromCbor(const cbor::Value &value,
                                 ResultEnvelopeX25519DeoxysII &out) {
    OUTCOME_TRY(reader, cbor::MapReader::open(value));
    OUTCOME_TRY(nonce, reader.required("nonce"));
    OUTCOME_TRY(nonce_blob,
                cbor::asBlob<crypto::DeoxysIINonce::size()>(*nonce));
    out.nonce = crypto::DeoxysIINonce{nonce_blob};
    OUTCOME_TRY(data, reader.required("data"));
    OUTCOME_TRY(bytes, cbor::asBytes(*data));
    out.data = std::move(bytes);
    return reader.finish();
  }

}  // namespace oasis::primitives
