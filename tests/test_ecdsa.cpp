#include <catch2/catch_test_macros.hpp>
#include "attest/ecdsa.hpp"
#include "attest/signing_backend.hpp"
#include <string>

using namespace attest;
using namespace attest::crypto;

TEST_CASE("secp256k1 signing and verification", "[ecdsa]")
{
    auto keypair = Secp256k1KeyPair::generate();
    REQUIRE(keypair.has_value());

    // SEC1 uncompressed point
    REQUIRE(keypair->public_key().size() == 65);
    REQUIRE(keypair->public_key()[0] == 0x04);

    std::string text = R"({"v":1})";
    Bytes message(text.begin(), text.end());

    auto signature = keypair->sign(message);
    REQUIRE(signature.has_value());
    REQUIRE(signature->front() == 0x30); // DER SEQUENCE

    REQUIRE(Secp256k1KeyPair::verify(message, *signature, keypair->public_key()));

    message.back() = '}' + 1;
    REQUIRE_FALSE(Secp256k1KeyPair::verify(message, *signature, keypair->public_key()));
}

TEST_CASE("secp256k1 verification rejects foreign keys and garbage", "[ecdsa]")
{
    auto a = Secp256k1KeyPair::generate().value();
    auto b = Secp256k1KeyPair::generate().value();

    Bytes message = {'x'};
    auto signature = a.sign(message).value();

    REQUIRE_FALSE(Secp256k1KeyPair::verify(message, signature, b.public_key()));
    REQUIRE_FALSE(Secp256k1KeyPair::verify(message, Bytes{0x30, 0x00}, a.public_key()));
    REQUIRE_FALSE(Secp256k1KeyPair::verify(message, signature, Bytes{0x04, 0x01}));
    REQUIRE_FALSE(Secp256k1KeyPair::verify(message, Bytes{}, a.public_key()));
}

TEST_CASE("Chain backend signs only with its own key reference", "[ecdsa][backend]")
{
    auto backend = EcdsaChainBackend::create().value();
    Bytes payload = {'p'};

    auto unknown = backend->sign(payload, "someone-else");
    REQUIRE_FALSE(unknown.has_value());
    REQUIRE(unknown.error().code == ErrorCode::SigningBackendError);

    auto signature = backend->sign(payload, EcdsaChainBackend::kKeyRef);
    REQUIRE(signature.has_value());
    auto public_key = backend->export_public_key(EcdsaChainBackend::kKeyRef).value();
    REQUIRE(public_key.size() == 130);

    auto ok = backend->verify(payload, *signature, public_key, "");
    REQUIRE(ok.has_value());
    REQUIRE(*ok);

    auto malformed = backend->verify(payload, "not-hex", public_key, "");
    REQUIRE_FALSE(malformed.has_value());

    REQUIRE(backend->fingerprint_of(public_key).size() == 40);
}
