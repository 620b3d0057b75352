#include <catch2/catch_test_macros.hpp>
#include "attest/audit.hpp"
#include "attest/chain_link.hpp"
#include "attest/json_canonicalization.hpp"
#include "test_support.hpp"
#include <fstream>
#include <regex>
#include <string>

using namespace attest;
using namespace attest::testing;
using Json = nlohmann::json;

TEST_CASE("Audit events carry a UTC timestamp", "[audit]")
{
    auto event = AuditEvent::now("FP1", "identity.verify", "FP1", "ok");
    REQUIRE(std::regex_match(event.ts, std::regex(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z)")));
    REQUIRE(event.details.is_object());

    auto j = event.to_json();
    REQUIRE(j["actor"] == "FP1");
    REQUIRE(j["action"] == "identity.verify");
    REQUIRE(j["result"] == "ok");
}

TEST_CASE("AuditChain links each event to the previous one", "[audit]")
{
    AuditChain chain;
    REQUIRE_FALSE(chain.head().has_value());

    AuditEvent first{"2024-01-01T00:00:00.000Z", "cli", "ledger.append", "abc", "ok", Json::object()};
    AuditEvent second{"2024-01-01T00:00:01.000Z", "FP1", "gate.deny", "FP1", "denied", Json{{"reason", "not registered"}}};

    auto h1 = chain.append(first);
    auto h2 = chain.append(second);
    REQUIRE(h1.has_value());
    REQUIRE(h2.has_value());

    auto bytes1 = json::CanonicalCodec::encode(first.to_json()).value();
    auto bytes2 = json::CanonicalCodec::encode(second.to_json()).value();
    REQUIRE(*h1 == ChainLink::compute(ChainLink::genesis(), bytes1));
    REQUIRE(*h2 == ChainLink::compute(*h1, bytes2));
    REQUIRE(chain.head() == *h2);
    REQUIRE(chain.size() == 2);

    SECTION("a long chain is tracked by its head alone")
    {
        std::string expected = *h2;
        for (int i = 0; i < 1000; ++i)
        {
            AuditEvent event{"2024-01-01T00:00:02.000Z", "cli", "ledger.append", std::to_string(i), "ok", Json::object()};
            expected = ChainLink::compute(expected, json::CanonicalCodec::encode(event.to_json()).value());
            REQUIRE(chain.append(event).value() == expected);
        }
        REQUIRE(chain.size() == 1002);
        REQUIRE(chain.head() == expected);
    }

    SECTION("reordering events changes the chain")
    {
        AuditChain swapped;
        REQUIRE(swapped.append(second).value() != *h2);
    }
}

TEST_CASE("AuditLogger writes one chained JSON line per event", "[audit]")
{
    CapturedAudit audit;
    audit.logger()->record("cli", "ledger.append", "hash-1", "ok", {{"proof_name", "p1"}});
    audit.logger()->record("FP2", "gate.deny", "FP2", "denied", {{"reason", "not registered"}});

    auto events = audit.events();
    REQUIRE(events.size() == 2);
    REQUIRE(events[0]["details"]["proof_name"] == "p1");
    REQUIRE(events[1]["action"] == "gate.deny");

    REQUIRE(events[0].contains("chain_hash"));
    REQUIRE(events[1]["chain_hash"] == *audit.logger()->head());

    // The chain hash covers the event without its own chain_hash field
    auto replay = events[1];
    replay.erase("chain_hash");
    auto bytes = json::CanonicalCodec::encode(replay).value();
    REQUIRE(ChainLink::compute(events[0]["chain_hash"].get<std::string>(), bytes) == events[1]["chain_hash"]);
}

TEST_CASE("Audit log file receives the events", "[audit]")
{
    TempDir dir;
    auto path = (dir / "audit.log").string();

    auto audit = AuditLogger::open(path);
    REQUIRE(audit.has_value());
    (*audit)->record("cli", "proposal.submit", "0123abcd", "ok");

    std::ifstream in(path);
    std::string line;
    REQUIRE(std::getline(in, line));
    REQUIRE(line.find("\"action\":\"proposal.submit\"") != std::string::npos);
    REQUIRE(line.find("chain_hash") != std::string::npos);
}

TEST_CASE("Logging level names", "[audit][logging]")
{
    REQUIRE(init_logging("debug").has_value());
    REQUIRE(init_logging("off").has_value());
    REQUIRE(init_logging("info").has_value());

    auto bad = init_logging("loud");
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == ErrorCode::ConfigError);
}
