#include "attest/crypto.hpp"
#include <sodium.h>
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <cstring>
#include <cstdlib>
#include <fstream>
#include <filesystem>
#include <chrono>
#include <ctime>

using json = nlohmann::json;

namespace attest::crypto
{

    // Initialize libsodium on library load
    static struct SodiumInitializer
    {
        SodiumInitializer()
        {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("Failed to initialize libsodium");
            }
        }
    } sodium_initializer;

    namespace
    {
        std::string now_iso8601()
        {
            auto now = std::chrono::system_clock::now();
            auto time_t_now = std::chrono::system_clock::to_time_t(now);
            std::tm tm_utc;
            gmtime_r(&time_t_now, &tm_utc);
            char timestamp[32];
            std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
            return timestamp;
        }

        Result<json> read_json_file(const std::string &path)
        {
            std::ifstream file(path);
            if (!file)
            {
                return std::unexpected(AttestError(ErrorCode::IOError, fmt::format("Failed to open key file: {}", path)));
            }

            try
            {
                json j;
                file >> j;
                return j;
            }
            catch (const json::exception &e)
            {
                return std::unexpected(AttestError(ErrorCode::ParsingError, fmt::format("Invalid JSON in key file: {}", e.what())));
            }
        }

        Result<void> write_json_file(const std::string &path, const json &j)
        {
            std::filesystem::path p(path);
            if (p.has_parent_path())
            {
                std::error_code ec;
                std::filesystem::create_directories(p.parent_path(), ec);
                if (ec)
                {
                    return std::unexpected(AttestError(ErrorCode::IOError, fmt::format("Failed to create key directory: {}", ec.message())));
                }
            }

            std::ofstream file(path, std::ios::trunc);
            if (!file)
            {
                return std::unexpected(AttestError(ErrorCode::IOError, fmt::format("Failed to open key file for writing: {}", path)));
            }
            file << j.dump(2);
            if (!file)
            {
                return std::unexpected(AttestError(ErrorCode::IOError, fmt::format("Failed to write key file: {}", path)));
            }
            return {};
        }

        Result<std::string> string_field(const json &j, const std::string &name)
        {
            if (!j.contains(name) || !j[name].is_string())
            {
                return std::unexpected(AttestError::invalid_input(fmt::format("Missing or non-string {} in key file", name)));
            }
            return j[name].get<std::string>();
        }

        Result<Ed25519SecretKey> decode_secret_key(const std::string &b64)
        {
            auto decoded = Base64::decode(b64);
            if (!decoded)
            {
                return std::unexpected(decoded.error());
            }
            if (decoded->size() != 64)
            {
                return std::unexpected(AttestError::invalid_input("Invalid Ed25519 secret key length"));
            }
            Ed25519SecretKey secret;
            std::copy_n(decoded->begin(), 64, secret.begin());
            return secret;
        }

        Result<IdentityKey> identity_from_secret(const Ed25519SecretKey &secret)
        {
            std::array<uint8_t, 32> seed;
            std::copy_n(secret.begin(), 32, seed.begin());

            auto keypair = Ed25519KeyPair::from_seed(seed);
            if (!keypair)
            {
                return std::unexpected(keypair.error());
            }
            return IdentityKey::from_keypair(*keypair);
        }

        Result<void> check_fingerprint(const IdentityKey &key, const json &j)
        {
            if (!j.contains("fingerprint"))
            {
                return {};
            }
            auto declared = string_field(j, "fingerprint");
            if (!declared)
            {
                return std::unexpected(declared.error());
            }
            if (*declared != key.fingerprint())
            {
                return std::unexpected(AttestError::crypto(fmt::format(
                    "Key file fingerprint {} does not match key material ({})",
                    *declared,
                    key.fingerprint())));
            }
            return {};
        }
    } // namespace

    // ============================================================================
    // Ed25519KeyPair Implementation
    // ============================================================================

    Result<Ed25519KeyPair> Ed25519KeyPair::generate()
    {
        Ed25519KeyPair keypair;

        if (crypto_sign_keypair(keypair.public_key.data(), keypair.secret_key.data()) != 0)
        {
            return std::unexpected(AttestError::crypto("Failed to generate Ed25519 keypair"));
        }

        return keypair;
    }

    Result<Ed25519KeyPair> Ed25519KeyPair::from_seed(const std::array<uint8_t, 32> &seed)
    {
        Ed25519KeyPair keypair;

        if (crypto_sign_seed_keypair(keypair.public_key.data(), keypair.secret_key.data(), seed.data()) != 0)
        {
            return std::unexpected(AttestError::crypto("Failed to derive Ed25519 keypair from seed"));
        }

        return keypair;
    }

    Result<Ed25519KeyPair> Ed25519KeyPair::from_keys(
        const Ed25519PublicKey &public_key,
        const Ed25519SecretKey &secret_key)
    {
        Ed25519KeyPair keypair;
        keypair.public_key = public_key;
        keypair.secret_key = secret_key;

        Ed25519PublicKey derived_pubkey;
        if (crypto_sign_ed25519_sk_to_pk(derived_pubkey.data(), secret_key.data()) != 0)
        {
            return std::unexpected(AttestError::crypto("Invalid secret key"));
        }

        if (std::memcmp(public_key.data(), derived_pubkey.data(), 32) != 0)
        {
            return std::unexpected(AttestError::crypto("Public key does not match secret key"));
        }

        return keypair;
    }

    Ed25519Signature Ed25519KeyPair::sign(const Bytes &message) const
    {
        Ed25519Signature signature;
        unsigned long long sig_len;

        crypto_sign_detached(
            signature.data(),
            &sig_len,
            message.data(),
            message.size(),
            secret_key.data());

        return signature;
    }

    bool Ed25519KeyPair::verify(
        const Bytes &message,
        const Ed25519Signature &signature,
        const Ed25519PublicKey &public_key)
    {
        return crypto_sign_verify_detached(
                   signature.data(),
                   message.data(),
                   message.size(),
                   public_key.data()) == 0;
    }

    // ============================================================================
    // AES256GCM Implementation
    // ============================================================================

    Result<Bytes> AES256GCM::encrypt(
        const AESKey &key,
        const Bytes &plaintext,
        const Bytes &associated_data)
    {
        if (crypto_aead_aes256gcm_is_available() == 0)
        {
            return std::unexpected(AttestError::crypto("AES-256-GCM is not supported on this CPU"));
        }

        AESNonce nonce;
        randombytes_buf(nonce.data(), nonce.size());

        // Allocate output: nonce + ciphertext + tag
        Bytes output(nonce.size() + plaintext.size() + crypto_aead_aes256gcm_ABYTES);
        std::copy(nonce.begin(), nonce.end(), output.begin());

        unsigned long long ciphertext_len;
        if (crypto_aead_aes256gcm_encrypt(
                output.data() + nonce.size(),
                &ciphertext_len,
                plaintext.data(),
                plaintext.size(),
                associated_data.data(),
                associated_data.size(),
                nullptr, // nsec (not used)
                nonce.data(),
                key.data()) != 0)
        {
            return std::unexpected(AttestError::crypto("AES-256-GCM encryption failed"));
        }

        output.resize(nonce.size() + ciphertext_len);
        return output;
    }

    Result<Bytes> AES256GCM::decrypt(
        const AESKey &key,
        const Bytes &ciphertext_with_nonce,
        const Bytes &associated_data)
    {
        if (crypto_aead_aes256gcm_is_available() == 0)
        {
            return std::unexpected(AttestError::crypto("AES-256-GCM is not supported on this CPU"));
        }

        if (ciphertext_with_nonce.size() < 12 + crypto_aead_aes256gcm_ABYTES)
        {
            return std::unexpected(AttestError::crypto("Ciphertext too short"));
        }

        AESNonce nonce;
        std::copy(ciphertext_with_nonce.begin(), ciphertext_with_nonce.begin() + 12, nonce.begin());

        Bytes plaintext(ciphertext_with_nonce.size() - 12 - crypto_aead_aes256gcm_ABYTES);
        unsigned long long plaintext_len;

        if (crypto_aead_aes256gcm_decrypt(
                plaintext.data(),
                &plaintext_len,
                nullptr,
                ciphertext_with_nonce.data() + 12,
                ciphertext_with_nonce.size() - 12,
                associated_data.data(),
                associated_data.size(),
                nonce.data(),
                key.data()) != 0)
        {
            return std::unexpected(AttestError::crypto("AES-256-GCM decryption failed (authentication failed)"));
        }

        plaintext.resize(plaintext_len);
        return plaintext;
    }

    // ============================================================================
    // SHA256 Implementation
    // ============================================================================

    SHA256Hash SHA256::hash(const Bytes &data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(), data.data(), data.size());
        return output;
    }

    std::string SHA256::to_hex(const SHA256Hash &hash)
    {
        return Hex::encode(Bytes(hash.begin(), hash.end()));
    }

    // ============================================================================
    // Hex Implementation
    // ============================================================================

    std::string Hex::encode(const Bytes &data)
    {
        std::string hex(data.size() * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
        hex.resize(data.size() * 2);
        return hex;
    }

    Result<Bytes> Hex::decode(const std::string &hex)
    {
        if (hex.size() % 2 != 0)
        {
            return std::unexpected(AttestError::invalid_input("Odd-length hex string"));
        }

        Bytes decoded(hex.size() / 2);
        size_t decoded_len;
        const char *end = nullptr;

        if (sodium_hex2bin(
                decoded.data(),
                decoded.size(),
                hex.c_str(),
                hex.size(),
                nullptr, // no ignored characters
                &decoded_len,
                &end) != 0 ||
            end != hex.c_str() + hex.size())
        {
            return std::unexpected(AttestError::invalid_input("Invalid hex encoding"));
        }

        decoded.resize(decoded_len);
        return decoded;
    }

    // ============================================================================
    // Base64 Implementation
    // ============================================================================

    std::string Base64::encode(const Bytes &data)
    {
        size_t b64_len = sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_ORIGINAL);
        std::string encoded(b64_len, '\0');

        sodium_bin2base64(
            encoded.data(),
            b64_len,
            data.data(),
            data.size(),
            sodium_base64_VARIANT_ORIGINAL);

        // Remove null terminator
        encoded.resize(std::strlen(encoded.c_str()));
        return encoded;
    }

    Result<Bytes> Base64::decode(const std::string &encoded)
    {
        Bytes decoded(encoded.size()); // Worst case size
        size_t decoded_len;

        if (sodium_base642bin(
                decoded.data(),
                decoded.size(),
                encoded.c_str(),
                encoded.size(),
                nullptr,
                &decoded_len,
                nullptr,
                sodium_base64_VARIANT_ORIGINAL) != 0)
        {
            return std::unexpected(AttestError::invalid_input("Invalid base64 encoding"));
        }

        decoded.resize(decoded_len);
        return decoded;
    }

    // ============================================================================
    // SecureRandom Implementation
    // ============================================================================

    void SecureRandom::fill_bytes(Bytes &buffer)
    {
        randombytes_buf(buffer.data(), buffer.size());
    }

    Bytes SecureRandom::generate_bytes(size_t n)
    {
        Bytes buffer(n);
        randombytes_buf(buffer.data(), n);
        return buffer;
    }

    // ============================================================================
    // IdentityKey Implementation
    // ============================================================================

    Result<IdentityKey> IdentityKey::generate()
    {
        auto kp = Ed25519KeyPair::generate();
        if (!kp)
        {
            return std::unexpected(kp.error());
        }
        return from_keypair(*kp);
    }

    IdentityKey IdentityKey::from_keypair(const Ed25519KeyPair &kp)
    {
        IdentityKey key;
        key.keypair = kp;
        key.fingerprint_ = fingerprint_of(kp.public_key);
        return key;
    }

    std::string IdentityKey::fingerprint_of(const Ed25519PublicKey &public_key)
    {
        auto digest = SHA256::hash(Bytes(public_key.begin(), public_key.end()));
        std::string hex = Hex::encode(Bytes(digest.begin(), digest.begin() + 20));
        for (auto &c : hex)
        {
            if (c >= 'a' && c <= 'f')
                c = static_cast<char>(c - 'a' + 'A');
        }
        return hex;
    }

    Result<IdentityKey> IdentityKey::load_from_file(const std::string &path)
    {
        auto j = read_json_file(path);
        if (!j)
        {
            return std::unexpected(j.error());
        }

        auto private_b64 = string_field(*j, "private_key_b64");
        if (!private_b64)
        {
            return std::unexpected(private_b64.error());
        }

        auto secret = decode_secret_key(*private_b64);
        if (!secret)
        {
            return std::unexpected(secret.error());
        }

        auto key = identity_from_secret(*secret);
        if (!key)
        {
            return key;
        }

        if (auto fp = check_fingerprint(*key, *j); !fp)
        {
            return std::unexpected(fp.error());
        }
        return key;
    }

    Result<void> IdentityKey::save_to_file(const std::string &path, const std::string &purpose) const
    {
        json j;
        j["fingerprint"] = fingerprint_;
        j["public_key_b64"] = public_key_b64();
        j["private_key_b64"] = Base64::encode(Bytes(keypair.secret_key.begin(), keypair.secret_key.end()));
        j["purpose"] = purpose;
        j["created_at"] = now_iso8601();

        return write_json_file(path, j);
    }

    Result<IdentityKey> IdentityKey::load_encrypted(const std::string &path, const AESKey &encryption_key)
    {
        auto j = read_json_file(path);
        if (!j)
        {
            return std::unexpected(j.error());
        }

        auto encrypted_b64 = string_field(*j, "encrypted_private_key_b64");
        if (!encrypted_b64)
        {
            return std::unexpected(encrypted_b64.error());
        }
        auto fingerprint = string_field(*j, "fingerprint");
        if (!fingerprint)
        {
            return std::unexpected(fingerprint.error());
        }

        auto encrypted = Base64::decode(*encrypted_b64);
        if (!encrypted)
        {
            return std::unexpected(encrypted.error());
        }

        auto decrypted = AES256GCM::decrypt(encryption_key, *encrypted, Bytes(fingerprint->begin(), fingerprint->end()));
        if (!decrypted)
        {
            return std::unexpected(decrypted.error());
        }

        if (decrypted->size() != 64)
        {
            sodium_memzero(decrypted->data(), decrypted->size());
            return std::unexpected(AttestError::invalid_input("Invalid Ed25519 secret key length"));
        }

        Ed25519SecretKey secret;
        std::copy_n(decrypted->begin(), 64, secret.begin());
        sodium_memzero(decrypted->data(), decrypted->size());

        auto key = identity_from_secret(secret);
        sodium_memzero(secret.data(), secret.size());
        if (!key)
        {
            return key;
        }

        if (auto fp = check_fingerprint(*key, *j); !fp)
        {
            return std::unexpected(fp.error());
        }
        return key;
    }

    Result<void> IdentityKey::save_encrypted(
        const std::string &path,
        const AESKey &encryption_key,
        const std::string &purpose) const
    {
        Bytes secret(keypair.secret_key.begin(), keypair.secret_key.end());
        auto encrypted = AES256GCM::encrypt(encryption_key, secret, Bytes(fingerprint_.begin(), fingerprint_.end()));
        sodium_memzero(secret.data(), secret.size());
        if (!encrypted)
        {
            return std::unexpected(encrypted.error());
        }

        json j;
        j["version"] = 1;
        j["fingerprint"] = fingerprint_;
        j["public_key_b64"] = public_key_b64();
        j["encrypted_private_key_b64"] = Base64::encode(*encrypted);
        j["purpose"] = purpose;
        j["created_at"] = now_iso8601();

        return write_json_file(path, j);
    }

    Result<IdentityKey> IdentityKey::load(const std::string &path)
    {
        auto j = read_json_file(path);
        if (!j)
        {
            return std::unexpected(j.error());
        }

        if (!j->contains("encrypted_private_key_b64"))
        {
            return load_from_file(path);
        }

        auto encryption_key = KeyManager::get_encryption_key();
        if (!encryption_key)
        {
            return std::unexpected(encryption_key.error());
        }
        return load_encrypted(path, *encryption_key);
    }

    std::string IdentityKey::public_key_b64() const
    {
        return Base64::encode(Bytes(keypair.public_key.begin(), keypair.public_key.end()));
    }

    std::string IdentityKey::sign_detached(const Bytes &message) const
    {
        auto sig = keypair.sign(message);
        return Base64::encode(Bytes(sig.begin(), sig.end()));
    }

    // ============================================================================
    // KeyManager Implementation
    // ============================================================================

    Result<AESKey> KeyManager::get_encryption_key()
    {
        const char *env_key = std::getenv("ATTEST_KEY_ENCRYPTION_KEY");
        if (env_key == nullptr)
        {
            return std::unexpected(AttestError::config("ATTEST_KEY_ENCRYPTION_KEY is not set"));
        }

        auto decoded = Base64::decode(env_key);
        if (!decoded)
        {
            return std::unexpected(decoded.error());
        }

        if (decoded->size() != 32)
        {
            return std::unexpected(AttestError::config("ATTEST_KEY_ENCRYPTION_KEY must be 32 bytes when base64-decoded"));
        }

        AESKey key;
        std::copy_n(decoded->begin(), 32, key.begin());
        return key;
    }

} // namespace attest::crypto
