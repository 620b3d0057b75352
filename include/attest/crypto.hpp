#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <array>
#include <cstdint>

namespace attest::crypto
{

    // Type aliases for clarity
    using Bytes = std::vector<uint8_t>;
    using Ed25519PublicKey = std::array<uint8_t, 32>;
    using Ed25519SecretKey = std::array<uint8_t, 64>;
    using Ed25519Signature = std::array<uint8_t, 64>;
    using SHA256Hash = std::array<uint8_t, 32>;
    using AESKey = std::array<uint8_t, 32>;
    using AESNonce = std::array<uint8_t, 12>;

    /**
     * Ed25519 key pair for detached signing and verification
     */
    class Ed25519KeyPair
    {
    public:
        Ed25519PublicKey public_key;
        Ed25519SecretKey secret_key;

        /**
         * Generate a new random key pair
         */
        static Result<Ed25519KeyPair> generate();

        /**
         * Load key pair from seed bytes (32 bytes)
         */
        static Result<Ed25519KeyPair> from_seed(const std::array<uint8_t, 32> &seed);

        /**
         * Load from separate public/secret key bytes, checking that they belong together
         */
        static Result<Ed25519KeyPair> from_keys(
            const Ed25519PublicKey &public_key,
            const Ed25519SecretKey &secret_key);

        /**
         * Sign a message, returns 64-byte detached signature
         */
        Ed25519Signature sign(const Bytes &message) const;

        /**
         * Verify detached signature against message
         */
        static bool verify(
            const Bytes &message,
            const Ed25519Signature &signature,
            const Ed25519PublicKey &public_key);
    };

    /**
     * AES-256-GCM encryption/decryption (identity key files at rest)
     */
    class AES256GCM
    {
    public:
        /**
         * Encrypt plaintext with given key
         * Output format: [12-byte nonce][ciphertext][16-byte tag]
         */
        static Result<Bytes> encrypt(
            const AESKey &key,
            const Bytes &plaintext,
            const Bytes &associated_data = {});

        /**
         * Decrypt ciphertext produced by encrypt()
         */
        static Result<Bytes> decrypt(
            const AESKey &key,
            const Bytes &ciphertext_with_nonce,
            const Bytes &associated_data = {});
    };

    /**
     * SHA-256 hashing
     */
    class SHA256
    {
    public:
        static SHA256Hash hash(const Bytes &data);

        /**
         * Convert hash to lowercase hex string
         */
        static std::string to_hex(const SHA256Hash &hash);
    };

    /**
     * Hex encoding/decoding (chain keys and signatures)
     */
    class Hex
    {
    public:
        static std::string encode(const Bytes &data);

        static Result<Bytes> decode(const std::string &hex);
    };

    /**
     * Base64 encoding/decoding (standard alphabet)
     */
    class Base64
    {
    public:
        static std::string encode(const Bytes &data);

        static Result<Bytes> decode(const std::string &encoded);
    };

    /**
     * Cryptographically secure random number generation
     */
    class SecureRandom
    {
    public:
        static void fill_bytes(Bytes &buffer);

        static Bytes generate_bytes(size_t n);
    };

    /**
     * Long-lived external identity: an Ed25519 key pair addressed by fingerprint.
     *
     * The fingerprint is the uppercase hex of the first 20 bytes of
     * SHA-256(public key), i.e. 40 characters.
     */
    class IdentityKey
    {
    private:
        Ed25519KeyPair keypair;
        std::string fingerprint_;

    public:
        /**
         * Generate a new random identity
         */
        static Result<IdentityKey> generate();

        static IdentityKey from_keypair(const Ed25519KeyPair &kp);

        /**
         * Derive the fingerprint of a raw Ed25519 public key
         */
        static std::string fingerprint_of(const Ed25519PublicKey &public_key);

        /**
         * Load from unencrypted JSON key file
         */
        static Result<IdentityKey> load_from_file(const std::string &path);

        /**
         * Save to unencrypted JSON key file
         */
        Result<void> save_to_file(const std::string &path, const std::string &purpose) const;

        /**
         * Load from encrypted JSON key file
         */
        static Result<IdentityKey> load_encrypted(const std::string &path, const AESKey &encryption_key);

        /**
         * Save to encrypted JSON key file; the fingerprint is bound as associated data
         */
        Result<void> save_encrypted(
            const std::string &path,
            const AESKey &encryption_key,
            const std::string &purpose) const;

        /**
         * Load either format, decrypting with ATTEST_KEY_ENCRYPTION_KEY when needed
         */
        static Result<IdentityKey> load(const std::string &path);

        const std::string &fingerprint() const { return fingerprint_; }

        std::string public_key_b64() const;

        /**
         * Sign bytes, returns base64 detached signature
         */
        std::string sign_detached(const Bytes &message) const;
    };

    /**
     * Key file encryption key from the environment
     */
    class KeyManager
    {
    public:
        /**
         * Read ATTEST_KEY_ENCRYPTION_KEY (base64, 32 bytes once decoded)
         */
        static Result<AESKey> get_encryption_key();
    };

} // namespace attest::crypto
