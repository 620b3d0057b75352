#pragma once

#include "types.hpp"
#include "crypto.hpp"
#include <memory>

struct evp_pkey_st;

namespace attest::crypto
{

    /**
     * ECDSA key pair over secp256k1 with SHA-256 (OpenSSL 3 EVP).
     *
     * Used for the ephemeral chain identity of a ledger instance. Signatures
     * are DER encoded; public keys are SEC1 uncompressed points (65 bytes).
     */
    class Secp256k1KeyPair
    {
    public:
        static Result<Secp256k1KeyPair> generate();

        /**
         * Sign a message, returns DER encoded ECDSA signature
         */
        Result<Bytes> sign(const Bytes &message) const;

        /**
         * Encoded public point
         */
        const Bytes &public_key() const { return public_key_; }

        /**
         * Verify a DER signature against an encoded public point.
         * Malformed keys or signatures verify as false.
         */
        static bool verify(
            const Bytes &message,
            const Bytes &der_signature,
            const Bytes &public_key);

    private:
        std::shared_ptr<evp_pkey_st> pkey_;
        Bytes public_key_;
    };

} // namespace attest::crypto
