#include <catch2/catch_test_macros.hpp>
#include "attest/chain_link.hpp"
#include "attest/registration_entry.hpp"

using namespace attest;

TEST_CASE("Chain link hashes predecessor then content", "[chain]")
{
    std::string prev = "abc";
    crypto::Bytes content = {'d', 'e', 'f'};

    REQUIRE(ChainLink::compute(prev, content) == crypto::SHA256::to_hex(crypto::SHA256::hash(crypto::Bytes{'a', 'b', 'c', 'd', 'e', 'f'})));
    REQUIRE(ChainLink::compute(prev, content) != ChainLink::compute("abd", content));
    REQUIRE(ChainLink::compute(prev, content) == ChainLink::compute(prev, content));
}

TEST_CASE("Genesis sentinel can never be a digest", "[chain]")
{
    const auto &genesis = ChainLink::genesis();
    REQUIRE(genesis == "genesis_public_" + std::string(64, '0'));
    REQUIRE_FALSE(ChainLink::is_digest(genesis));

    auto link = ChainLink::compute(genesis, {});
    REQUIRE(ChainLink::is_digest(link));
    REQUIRE_FALSE(ChainLink::is_digest(std::string(64, 'A')));
}

TEST_CASE("Registration entry exclusion sets", "[chain][entry]")
{
    RegistrationEntry entry;
    entry.proof_name = "proof";
    entry.payload = {{"v", 1}};
    entry.timestamp = 1700000000;
    entry.prev_chain_hash = ChainLink::genesis();
    entry.chain_public_key = "04ab";

    auto unsigned_bytes = entry.chain_content_bytes().value();

    entry.chain_signature = "3044";
    entry.chain_hash = ChainLink::compute(ChainLink::genesis(), unsigned_bytes);
    entry.identity_fingerprint = "FP";
    entry.identity_signature = "sig";
    entry.identity_public_key = "pk";

    SECTION("chain content ignores signatures, chain hash and identity fields")
    {
        REQUIRE(entry.chain_content_bytes().value() == unsigned_bytes);
        std::string text(unsigned_bytes.begin(), unsigned_bytes.end());
        REQUIRE(text == R"({"chain_public_key":"04ab","payload":{"v":1},"prev_chain_hash":")" +
                            ChainLink::genesis() + R"(","proof_name":"proof","timestamp":1700000000})");
    }

    SECTION("identity content binds chain hash and fingerprint")
    {
        auto identity_bytes = entry.identity_content_bytes().value();
        std::string text(identity_bytes.begin(), identity_bytes.end());
        REQUIRE(text.find("\"chain_hash\":\"" + *entry.chain_hash + "\"") != std::string::npos);
        REQUIRE(text.find("\"identity_fingerprint\":\"FP\"") != std::string::npos);
        REQUIRE(text.find("chain_signature") == std::string::npos);
        REQUIRE(text.find("identity_signature") == std::string::npos);

        entry.identity_fingerprint = "OTHER";
        REQUIRE(entry.identity_content_bytes().value() != identity_bytes);
    }

    SECTION("JSON round trip keeps optional fields")
    {
        auto parsed = RegistrationEntry::from_json(entry.to_json());
        REQUIRE(parsed.has_value());
        REQUIRE(parsed->to_json() == entry.to_json());
        REQUIRE(parsed->is_identity_signed());
    }
}

TEST_CASE("Registration entry parsing rejects malformed records", "[entry]")
{
    REQUIRE_FALSE(RegistrationEntry::from_json(nlohmann::json::array()).has_value());
    REQUIRE_FALSE(RegistrationEntry::from_json({{"proof_name", "x"}}).has_value());

    nlohmann::json j = {
        {"proof_name", "x"},
        {"payload", nullptr},
        {"timestamp", 1},
        {"prev_chain_hash", ChainLink::genesis()},
        {"chain_public_key", "04"},
        {"chain_hash", 42}};
    auto parsed = RegistrationEntry::from_json(j);
    REQUIRE_FALSE(parsed.has_value());
    REQUIRE(parsed.error().code == ErrorCode::InvalidInput);

    SECTION("chain hashes must have digest shape")
    {
        j["chain_hash"] = std::string(64, 'A');
        REQUIRE_FALSE(RegistrationEntry::from_json(j).has_value());

        j["chain_hash"] = ChainLink::compute(ChainLink::genesis(), {});
        REQUIRE(RegistrationEntry::from_json(j).has_value());

        j["prev_chain_hash"] = "genesis";
        auto bad_prev = RegistrationEntry::from_json(j);
        REQUIRE_FALSE(bad_prev.has_value());
        REQUIRE(bad_prev.error().code == ErrorCode::InvalidInput);

        j["prev_chain_hash"] = j["chain_hash"];
        REQUIRE(RegistrationEntry::from_json(j).has_value());
    }
}
