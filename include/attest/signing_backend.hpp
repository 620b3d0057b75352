#pragma once

#include "types.hpp"
#include "crypto.hpp"
#include "ecdsa.hpp"
#include <map>
#include <mutex>
#include <string>

namespace attest
{

    /**
     * External signing collaborator.
     *
     * Key material crosses this interface as opaque strings: the core stores
     * and passes back whatever export_public_key returns without inspecting it.
     */
    class SigningBackend
    {
    public:
        virtual ~SigningBackend() = default;

        /**
         * Name of the signature scheme (e.g. "ecdsa-secp256k1-sha256")
         */
        virtual std::string scheme() const = 0;

        /**
         * Sign payload with the key addressed by key_ref
         * @return Encoded signature or SigningBackendError
         */
        virtual Result<std::string> sign(const crypto::Bytes &payload, const std::string &key_ref) = 0;

        /**
         * Check a signature against an exported public key.
         * A non-empty fingerprint must match fingerprint_of(public_key).
         * @return false for a bad signature, error for undecodable input
         */
        virtual Result<bool> verify(
            const crypto::Bytes &payload,
            const std::string &signature,
            const std::string &public_key,
            const std::string &fingerprint) = 0;

        virtual Result<std::string> export_public_key(const std::string &key_ref) = 0;

        /**
         * Stable identifier of an exported public key, empty if undecodable
         */
        virtual std::string fingerprint_of(const std::string &public_key) const = 0;
    };

    /**
     * Ephemeral per-ledger chain key (ECDSA secp256k1, SHA-256).
     * Signatures and public keys are hex encoded.
     */
    class EcdsaChainBackend : public SigningBackend
    {
    public:
        static constexpr const char *kKeyRef = "chain";

        explicit EcdsaChainBackend(crypto::Secp256k1KeyPair keypair);

        /**
         * Generate a fresh chain key
         */
        static Result<std::shared_ptr<EcdsaChainBackend>> create();

        std::string scheme() const override;
        Result<std::string> sign(const crypto::Bytes &payload, const std::string &key_ref) override;
        Result<bool> verify(
            const crypto::Bytes &payload,
            const std::string &signature,
            const std::string &public_key,
            const std::string &fingerprint) override;
        Result<std::string> export_public_key(const std::string &key_ref) override;
        std::string fingerprint_of(const std::string &public_key) const override;

    private:
        Result<void> check_key_ref(const std::string &key_ref) const;

        crypto::Secp256k1KeyPair keypair_;
    };

    /**
     * Long-lived external identities (Ed25519), addressed by fingerprint.
     * Signatures and public keys are base64 encoded.
     */
    class Ed25519IdentityBackend : public SigningBackend
    {
    public:
        /**
         * Make an identity available for signing
         * @return The identity's fingerprint (its key reference)
         */
        std::string add_identity(const crypto::IdentityKey &identity);

        bool has_identity(const std::string &fingerprint) const;

        std::string scheme() const override;
        Result<std::string> sign(const crypto::Bytes &payload, const std::string &key_ref) override;
        Result<bool> verify(
            const crypto::Bytes &payload,
            const std::string &signature,
            const std::string &public_key,
            const std::string &fingerprint) override;
        Result<std::string> export_public_key(const std::string &key_ref) override;
        std::string fingerprint_of(const std::string &public_key) const override;

    private:
        Result<crypto::IdentityKey> find(const std::string &fingerprint) const;

        mutable std::mutex mutex_;
        std::map<std::string, crypto::IdentityKey> identities_;
    };

} // namespace attest
