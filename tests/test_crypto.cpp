#include <catch2/catch_test_macros.hpp>
#include "attest/crypto.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>

using namespace attest::crypto;
using attest::testing::TempDir;

namespace
{
    AESKey random_key()
    {
        auto bytes = SecureRandom::generate_bytes(32);
        AESKey key{};
        std::copy(bytes.begin(), bytes.end(), key.begin());
        return key;
    }
}

TEST_CASE("Ed25519 signing and verification", "[crypto]")
{
    auto keypair = Ed25519KeyPair::generate().value();

    std::string message = "register me";
    Bytes message_bytes(message.begin(), message.end());

    auto signature = keypair.sign(message_bytes);
    REQUIRE(Ed25519KeyPair::verify(message_bytes, signature, keypair.public_key));

    message_bytes[0] ^= 0x01;
    REQUIRE_FALSE(Ed25519KeyPair::verify(message_bytes, signature, keypair.public_key));
}

TEST_CASE("Ed25519 keys must belong together", "[crypto]")
{
    auto a = Ed25519KeyPair::generate().value();
    auto b = Ed25519KeyPair::generate().value();

    REQUIRE(Ed25519KeyPair::from_keys(a.public_key, a.secret_key).has_value());
    REQUIRE_FALSE(Ed25519KeyPair::from_keys(b.public_key, a.secret_key).has_value());
}

TEST_CASE("AES-256-GCM binds associated data", "[crypto]")
{
    auto key = random_key();

    std::string plaintext = "secret key material";
    Bytes plaintext_bytes(plaintext.begin(), plaintext.end());
    Bytes aad = {'F', 'P'};

    auto encrypted = AES256GCM::encrypt(key, plaintext_bytes, aad);
    REQUIRE(encrypted.has_value());
    REQUIRE(encrypted->size() == plaintext_bytes.size() + 12 + 16);

    auto decrypted = AES256GCM::decrypt(key, *encrypted, aad);
    REQUIRE(decrypted.has_value());
    REQUIRE(*decrypted == plaintext_bytes);

    auto wrong_aad = AES256GCM::decrypt(key, *encrypted, Bytes{'X'});
    REQUIRE_FALSE(wrong_aad.has_value());
    REQUIRE(wrong_aad.error().code == attest::ErrorCode::CryptoError);
}

TEST_CASE("SHA-256 of known input", "[crypto]")
{
    auto hex = SHA256::to_hex(SHA256::hash(Bytes{'a', 'b', 'c'}));
    REQUIRE(hex == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE(SHA256::to_hex(SHA256::hash(Bytes{})) ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("Hex and Base64 reject malformed input", "[crypto]")
{
    REQUIRE(Hex::encode(Bytes{0x00, 0xab, 0xff}) == "00abff");
    REQUIRE(Hex::decode("00abff").value() == Bytes{0x00, 0xab, 0xff});
    REQUIRE_FALSE(Hex::decode("abc").has_value());
    REQUIRE_FALSE(Hex::decode("zz").has_value());

    REQUIRE(Base64::encode(Bytes{'h', 'i'}) == "aGk=");
    REQUIRE(Base64::decode("aGk=").value() == Bytes{'h', 'i'});
    REQUIRE_FALSE(Base64::decode("***").has_value());
}

TEST_CASE("Secure random generation", "[crypto]")
{
    auto bytes1 = SecureRandom::generate_bytes(32);
    auto bytes2 = SecureRandom::generate_bytes(32);

    REQUIRE(bytes1.size() == 32);
    REQUIRE(bytes1 != bytes2);
}

TEST_CASE("Identity fingerprint is 40 uppercase hex characters", "[crypto][identity]")
{
    auto identity = IdentityKey::generate().value();
    const auto &fp = identity.fingerprint();

    REQUIRE(fp.size() == 40);
    for (char c : fp)
    {
        REQUIRE(((c >= '0' && c <= '9') || (c >= 'A' && c <= 'F')));
    }
    auto public_bytes = Base64::decode(identity.public_key_b64()).value();
    REQUIRE(public_bytes.size() == 32);
    Ed25519PublicKey public_key{};
    std::copy(public_bytes.begin(), public_bytes.end(), public_key.begin());
    REQUIRE(fp == IdentityKey::fingerprint_of(public_key));
}

TEST_CASE("Identity key file round trip", "[crypto][identity]")
{
    TempDir dir;
    auto identity = IdentityKey::generate().value();

    SECTION("plain key file")
    {
        auto path = (dir / "keys/identity.json").string();
        REQUIRE(identity.save_to_file(path, "member").has_value());

        auto loaded = IdentityKey::load_from_file(path);
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->fingerprint() == identity.fingerprint());

        Bytes message = {1, 2, 3};
        REQUIRE(loaded->sign_detached(message) == identity.sign_detached(message));
    }

    SECTION("encrypted key file")
    {
        auto path = (dir / "identity.enc.json").string();
        auto key = random_key();
        REQUIRE(identity.save_encrypted(path, key, "member").has_value());

        auto loaded = IdentityKey::load_encrypted(path, key);
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->fingerprint() == identity.fingerprint());

        auto wrong = IdentityKey::load_encrypted(path, random_key());
        REQUIRE_FALSE(wrong.has_value());
    }

    SECTION("declared fingerprint must match the key")
    {
        auto path = (dir / "identity.json").string();
        REQUIRE(identity.save_to_file(path, "member").has_value());

        nlohmann::json j;
        {
            std::ifstream in(path);
            in >> j;
        }
        j["fingerprint"] = std::string(40, 'A');
        {
            std::ofstream out(path, std::ios::trunc);
            out << j.dump();
        }

        REQUIRE_FALSE(IdentityKey::load_from_file(path).has_value());
    }

    SECTION("missing file is an IO error")
    {
        auto loaded = IdentityKey::load_from_file((dir / "absent.json").string());
        REQUIRE_FALSE(loaded.has_value());
        REQUIRE(loaded.error().code == attest::ErrorCode::IOError);
    }
}

TEST_CASE("KeyManager requires a 32 byte key", "[crypto]")
{
    ::unsetenv("ATTEST_KEY_ENCRYPTION_KEY");
    auto missing = KeyManager::get_encryption_key();
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code == attest::ErrorCode::ConfigError);

    ::setenv("ATTEST_KEY_ENCRYPTION_KEY", Base64::encode(Bytes(16, 0x11)).c_str(), 1);
    REQUIRE_FALSE(KeyManager::get_encryption_key().has_value());

    ::setenv("ATTEST_KEY_ENCRYPTION_KEY", Base64::encode(Bytes(32, 0x22)).c_str(), 1);
    auto key = KeyManager::get_encryption_key();
    REQUIRE(key.has_value());
    REQUIRE((*key)[0] == 0x22);

    ::unsetenv("ATTEST_KEY_ENCRYPTION_KEY");
}
