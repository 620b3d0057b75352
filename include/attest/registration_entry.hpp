#pragma once

#include "types.hpp"
#include "crypto.hpp"
#include "json_canonicalization.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace attest
{

    /**
     * One attestation in the registration ledger.
     *
     * Lifecycle: draft -> chain signed -> chained (chain_hash stamped) ->
     * persisted -> optionally identity signed. Once chained only the identity
     * fields may be added.
     */
    struct RegistrationEntry
    {
        std::string proof_name;       // Human label, not unique
        nlohmann::json payload;       // Opaque attestation content
        int64_t timestamp{0};         // Unix seconds, advisory only
        std::string prev_chain_hash;  // Predecessor's chain_hash or genesis sentinel
        std::string chain_public_key; // Hex SEC1 point of the chain key

        std::optional<std::string> chain_signature; // Hex DER ECDSA
        std::optional<std::string> chain_hash;      // Lowercase hex SHA-256

        std::optional<std::string> identity_fingerprint;
        std::optional<std::string> identity_signature;  // Base64 Ed25519
        std::optional<std::string> identity_public_key; // Base64 Ed25519

        /**
         * Fields left out of the bytes covered by chain_signature and chain_hash
         */
        static const json::CanonicalCodec::FieldSet &chain_exclusions();

        /**
         * Fields left out of the bytes covered by identity_signature
         */
        static const json::CanonicalCodec::FieldSet &identity_exclusions();

        /**
         * Serialize all present fields; absent optionals are omitted
         */
        nlohmann::json to_json() const;

        static Result<RegistrationEntry> from_json(const nlohmann::json &j);

        Result<crypto::Bytes> chain_content_bytes() const;

        Result<crypto::Bytes> identity_content_bytes() const;

        bool is_chained() const { return chain_hash.has_value(); }

        bool is_identity_signed() const
        {
            return identity_signature.has_value() && identity_public_key.has_value();
        }
    };

} // namespace attest
