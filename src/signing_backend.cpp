#include "attest/signing_backend.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <cstring>

namespace attest
{

    namespace
    {
        std::string upper(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::toupper(c)); });
            return value;
        }
    } // namespace

    // ========== EcdsaChainBackend ==========

    EcdsaChainBackend::EcdsaChainBackend(crypto::Secp256k1KeyPair keypair)
        : keypair_(std::move(keypair))
    {
    }

    Result<std::shared_ptr<EcdsaChainBackend>> EcdsaChainBackend::create()
    {
        auto keypair = crypto::Secp256k1KeyPair::generate();
        if (!keypair)
        {
            return std::unexpected(AttestError::signing_backend(keypair.error().what()));
        }
        return std::make_shared<EcdsaChainBackend>(std::move(*keypair));
    }

    std::string EcdsaChainBackend::scheme() const
    {
        return "ecdsa-secp256k1-sha256";
    }

    Result<void> EcdsaChainBackend::check_key_ref(const std::string &key_ref) const
    {
        if (key_ref != kKeyRef)
        {
            return std::unexpected(AttestError::signing_backend(
                fmt::format("Unknown chain key reference '{}'", key_ref)));
        }
        return {};
    }

    Result<std::string> EcdsaChainBackend::sign(const crypto::Bytes &payload, const std::string &key_ref)
    {
        if (auto ok = check_key_ref(key_ref); !ok)
        {
            return std::unexpected(ok.error());
        }

        auto signature = keypair_.sign(payload);
        if (!signature)
        {
            return std::unexpected(AttestError::signing_backend(signature.error().what()));
        }
        return crypto::Hex::encode(*signature);
    }

    Result<bool> EcdsaChainBackend::verify(
        const crypto::Bytes &payload,
        const std::string &signature,
        const std::string &public_key,
        const std::string &fingerprint)
    {
        auto sig_bytes = crypto::Hex::decode(signature);
        if (!sig_bytes)
        {
            return std::unexpected(AttestError::invalid_input("Chain signature is not hex"));
        }
        auto key_bytes = crypto::Hex::decode(public_key);
        if (!key_bytes)
        {
            return std::unexpected(AttestError::invalid_input("Chain public key is not hex"));
        }
        if (!fingerprint.empty() && upper(fingerprint) != fingerprint_of(public_key))
        {
            return false;
        }
        return crypto::Secp256k1KeyPair::verify(payload, *sig_bytes, *key_bytes);
    }

    Result<std::string> EcdsaChainBackend::export_public_key(const std::string &key_ref)
    {
        if (auto ok = check_key_ref(key_ref); !ok)
        {
            return std::unexpected(ok.error());
        }
        return crypto::Hex::encode(keypair_.public_key());
    }

    std::string EcdsaChainBackend::fingerprint_of(const std::string &public_key) const
    {
        auto key_bytes = crypto::Hex::decode(public_key);
        if (!key_bytes)
        {
            return {};
        }
        auto hash = crypto::SHA256::hash(*key_bytes);
        return upper(crypto::Hex::encode(crypto::Bytes(hash.begin(), hash.begin() + 20)));
    }

    // ========== Ed25519IdentityBackend ==========

    std::string Ed25519IdentityBackend::add_identity(const crypto::IdentityKey &identity)
    {
        std::lock_guard lock(mutex_);
        identities_.insert_or_assign(identity.fingerprint(), identity);
        return identity.fingerprint();
    }

    bool Ed25519IdentityBackend::has_identity(const std::string &fingerprint) const
    {
        std::lock_guard lock(mutex_);
        return identities_.contains(fingerprint);
    }

    Result<crypto::IdentityKey> Ed25519IdentityBackend::find(const std::string &fingerprint) const
    {
        std::lock_guard lock(mutex_);
        auto it = identities_.find(fingerprint);
        if (it == identities_.end())
        {
            return std::unexpected(AttestError::signing_backend(
                fmt::format("No identity key for fingerprint '{}'", fingerprint)));
        }
        return it->second;
    }

    std::string Ed25519IdentityBackend::scheme() const
    {
        return "ed25519";
    }

    Result<std::string> Ed25519IdentityBackend::sign(const crypto::Bytes &payload, const std::string &key_ref)
    {
        auto identity = find(key_ref);
        if (!identity)
        {
            return std::unexpected(identity.error());
        }
        return identity->sign_detached(payload);
    }

    Result<bool> Ed25519IdentityBackend::verify(
        const crypto::Bytes &payload,
        const std::string &signature,
        const std::string &public_key,
        const std::string &fingerprint)
    {
        auto key_bytes = crypto::Base64::decode(public_key);
        if (!key_bytes || key_bytes->size() != crypto::Ed25519PublicKey{}.size())
        {
            return std::unexpected(AttestError::invalid_input("Identity public key is not a base64 Ed25519 key"));
        }
        auto sig_bytes = crypto::Base64::decode(signature);
        if (!sig_bytes || sig_bytes->size() != crypto::Ed25519Signature{}.size())
        {
            return std::unexpected(AttestError::invalid_input("Identity signature is not a base64 Ed25519 signature"));
        }

        crypto::Ed25519PublicKey pk;
        std::memcpy(pk.data(), key_bytes->data(), pk.size());
        crypto::Ed25519Signature sig;
        std::memcpy(sig.data(), sig_bytes->data(), sig.size());

        // The embedded key must be the one the fingerprint names
        if (!fingerprint.empty() && upper(fingerprint) != crypto::IdentityKey::fingerprint_of(pk))
        {
            return false;
        }
        return crypto::Ed25519KeyPair::verify(payload, sig, pk);
    }

    Result<std::string> Ed25519IdentityBackend::export_public_key(const std::string &key_ref)
    {
        auto identity = find(key_ref);
        if (!identity)
        {
            return std::unexpected(identity.error());
        }
        return identity->public_key_b64();
    }

    std::string Ed25519IdentityBackend::fingerprint_of(const std::string &public_key) const
    {
        auto key_bytes = crypto::Base64::decode(public_key);
        if (!key_bytes || key_bytes->size() != crypto::Ed25519PublicKey{}.size())
        {
            return {};
        }
        crypto::Ed25519PublicKey pk;
        std::memcpy(pk.data(), key_bytes->data(), pk.size());
        return crypto::IdentityKey::fingerprint_of(pk);
    }

} // namespace attest
