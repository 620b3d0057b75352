#include "attest/registration_entry.hpp"
#include "attest/chain_link.hpp"
#include <fmt/format.h>

namespace attest
{

    using Json = nlohmann::json;

    namespace
    {
        Result<std::optional<std::string>> optional_string(const Json &j, const char *key)
        {
            if (!j.contains(key) || j.at(key).is_null())
            {
                return std::optional<std::string>{};
            }
            if (!j.at(key).is_string())
            {
                return std::unexpected(AttestError::invalid_input(
                    fmt::format("Field '{}' must be a string", key)));
            }
            return std::optional<std::string>{j.at(key).get<std::string>()};
        }
    } // namespace

    const json::CanonicalCodec::FieldSet &RegistrationEntry::chain_exclusions()
    {
        static const json::CanonicalCodec::FieldSet fields = {
            "chain_signature",
            "chain_hash",
            "identity_signature",
            "identity_fingerprint",
            "identity_public_key"};
        return fields;
    }

    const json::CanonicalCodec::FieldSet &RegistrationEntry::identity_exclusions()
    {
        static const json::CanonicalCodec::FieldSet fields = {
            "chain_signature",
            "identity_signature",
            "identity_public_key"};
        return fields;
    }

    Json RegistrationEntry::to_json() const
    {
        Json j = {
            {"proof_name", proof_name},
            {"payload", payload},
            {"timestamp", timestamp},
            {"prev_chain_hash", prev_chain_hash},
            {"chain_public_key", chain_public_key}};

        if (chain_signature)
            j["chain_signature"] = *chain_signature;
        if (chain_hash)
            j["chain_hash"] = *chain_hash;
        if (identity_fingerprint)
            j["identity_fingerprint"] = *identity_fingerprint;
        if (identity_signature)
            j["identity_signature"] = *identity_signature;
        if (identity_public_key)
            j["identity_public_key"] = *identity_public_key;

        return j;
    }

    Result<RegistrationEntry> RegistrationEntry::from_json(const Json &j)
    {
        if (!j.is_object())
        {
            return std::unexpected(AttestError::invalid_input("Registration entry must be a JSON object"));
        }

        RegistrationEntry entry;
        try
        {
            entry.proof_name = j.at("proof_name").get<std::string>();
            entry.payload = j.at("payload");
            entry.timestamp = j.at("timestamp").get<int64_t>();
            entry.prev_chain_hash = j.at("prev_chain_hash").get<std::string>();
            entry.chain_public_key = j.at("chain_public_key").get<std::string>();
        }
        catch (const Json::exception &e)
        {
            return std::unexpected(AttestError::invalid_input(
                fmt::format("Failed to parse RegistrationEntry: {}", e.what())));
        }

        struct OptionalField
        {
            const char *key;
            std::optional<std::string> *target;
        };
        const OptionalField optional_fields[] = {
            {"chain_signature", &entry.chain_signature},
            {"chain_hash", &entry.chain_hash},
            {"identity_fingerprint", &entry.identity_fingerprint},
            {"identity_signature", &entry.identity_signature},
            {"identity_public_key", &entry.identity_public_key}};

        for (const auto &field : optional_fields)
        {
            auto value = optional_string(j, field.key);
            if (!value)
            {
                return std::unexpected(value.error());
            }
            *field.target = std::move(*value);
        }

        if (entry.prev_chain_hash != ChainLink::genesis() && !ChainLink::is_digest(entry.prev_chain_hash))
        {
            return std::unexpected(AttestError::invalid_input(
                fmt::format("prev_chain_hash '{}' is neither a digest nor the genesis sentinel", entry.prev_chain_hash)));
        }
        if (entry.chain_hash && !ChainLink::is_digest(*entry.chain_hash))
        {
            return std::unexpected(AttestError::invalid_input(
                fmt::format("chain_hash '{}' is not a SHA-256 hex digest", *entry.chain_hash)));
        }

        return entry;
    }

    Result<crypto::Bytes> RegistrationEntry::chain_content_bytes() const
    {
        return json::CanonicalCodec::encode(to_json(), chain_exclusions());
    }

    Result<crypto::Bytes> RegistrationEntry::identity_content_bytes() const
    {
        return json::CanonicalCodec::encode(to_json(), identity_exclusions());
    }

} // namespace attest
