#include <catch2/catch_test_macros.hpp>
#include "attest/identity_verifier.hpp"
#include "attest/ledger.hpp"
#include "test_support.hpp"
#include <thread>
#include <utility>

using namespace attest;
using namespace attest::testing;
using Json = nlohmann::json;

namespace
{
    /**
     * A ledger plus an identity backend, producing identity-signed entries
     */
    struct Fixture
    {
        std::shared_ptr<InMemoryLedgerStore> ledger_store = std::make_shared<InMemoryLedgerStore>();
        std::shared_ptr<InMemoryRegistrationStore> registry = std::make_shared<InMemoryRegistrationStore>();
        std::shared_ptr<Ed25519IdentityBackend> identities = std::make_shared<Ed25519IdentityBackend>();
        std::unique_ptr<Ledger> ledger;

        Fixture()
        {
            auto opened = Ledger::open(ledger_store, make_chain_identity());
            REQUIRE(opened.has_value());
            ledger = std::move(*opened);
        }

        RegistrationEntry signed_entry(const SigningIdentity &identity, const std::string &name)
        {
            auto entry = ledger->append(Json{{"member", name}}, name);
            REQUIRE(entry.has_value());
            auto signed_result = ledger->attach_identity_signature(*entry, identity);
            REQUIRE(signed_result.has_value());
            return *signed_result;
        }

        std::pair<std::string, RegistrationEntry> new_member(const std::string &name)
        {
            auto key = crypto::IdentityKey::generate().value();
            identities->add_identity(key);
            return {key.fingerprint(), signed_entry(SigningIdentity(identities, key.fingerprint()), name)};
        }
    };
}

TEST_CASE("Registered label identity verifies, unknown one does not", "[verifier]")
{
    Fixture fx;
    auto labels = std::make_shared<LabelBackend>();

    auto entry = fx.signed_entry(SigningIdentity(labels, "FP1"), "self-signed");
    REQUIRE(entry.identity_fingerprint == "FP1");
    fx.registry->seed("FP1", entry);

    IdentityVerifier verifier(fx.registry, SigningIdentity::verifier(labels));
    REQUIRE(verifier.verify("FP1").ok);
    REQUIRE(verifier.cached("FP1"));

    auto unknown = verifier.verify("FP2");
    REQUIRE_FALSE(unknown.ok);
    REQUIRE(unknown.reason == "not registered");
    REQUIRE_FALSE(verifier.cached("FP2"));
}

TEST_CASE("Second verification is served from the cache", "[verifier][cache]")
{
    Fixture fx;
    auto [fingerprint, entry] = fx.new_member("alice");
    fx.registry->seed(fingerprint, entry);

    auto counting = std::make_shared<CountingBackend>(fx.identities);
    IdentityVerifier verifier(fx.registry, SigningIdentity::verifier(counting));

    REQUIRE(verifier.verify(fingerprint).ok);
    REQUIRE(counting->verify_calls.load() == 1);
    REQUIRE(fx.registry->reads.load() == 1);

    auto second = verifier.verify(fingerprint);
    REQUIRE(second.ok);
    REQUIRE(second.reason == "cached");
    REQUIRE(counting->verify_calls.load() == 1);
    REQUIRE(fx.registry->reads.load() == 1);

    SECTION("invalidate forces re-verification")
    {
        verifier.invalidate(fingerprint);
        REQUIRE_FALSE(verifier.cached(fingerprint));
        REQUIRE(verifier.verify(fingerprint).ok);
        REQUIRE(counting->verify_calls.load() == 2);
    }

    SECTION("clear empties the cache")
    {
        verifier.clear();
        REQUIRE(verifier.cache_size() == 0);
        REQUIRE(verifier.verify(fingerprint).ok);
        REQUIRE(counting->verify_calls.load() == 2);
    }
}

TEST_CASE("A record replaced while it is being read is not cached", "[verifier][cache]")
{
    Fixture fx;
    auto [fingerprint, entry] = fx.new_member("alice");
    fx.registry->seed(fingerprint, entry);
    IdentityVerifier verifier(fx.registry, SigningIdentity::verifier(fx.identities));

    auto replaced = entry;
    replaced.payload["member"] = "eve";

    SECTION("invalidated during the read")
    {
        bool replace = true;
        fx.registry->after_get = [&](const std::string &fp)
        {
            if (std::exchange(replace, false))
            {
                fx.registry->seed(fp, replaced);
                verifier.invalidate(fp);
            }
        };

        REQUIRE(verifier.verify(fingerprint).ok);
        REQUIRE_FALSE(verifier.cached(fingerprint));
        REQUIRE_FALSE(verifier.verify(fingerprint).ok);
        REQUIRE(verifier.cache_size() == 0);
    }

    SECTION("cleared during the read")
    {
        bool clear = true;
        fx.registry->after_get = [&](const std::string &)
        {
            if (std::exchange(clear, false))
            {
                verifier.clear();
            }
        };

        REQUIRE(verifier.verify(fingerprint).ok);
        REQUIRE_FALSE(verifier.cached(fingerprint));
        REQUIRE(verifier.verify(fingerprint).ok);
        REQUIRE(verifier.cached(fingerprint));
    }

    SECTION("invalidating another member does not block caching")
    {
        fx.registry->after_get = [&](const std::string &) { verifier.invalidate("FP-other"); };

        REQUIRE(verifier.verify(fingerprint).ok);
        REQUIRE(verifier.cached(fingerprint));
    }
}

TEST_CASE("Chain-valid entry without a valid identity signature is rejected", "[verifier]")
{
    Fixture fx;
    auto [fingerprint, entry] = fx.new_member("bob");
    IdentityVerifier verifier(fx.registry, SigningIdentity::verifier(fx.identities));

    REQUIRE(fx.ledger->verify_chain().value().intact());
    REQUIRE(fx.ledger->verify_chain_signature(entry).ok);

    SECTION("signature missing")
    {
        auto stripped = entry;
        stripped.identity_signature.reset();
        fx.registry->seed(fingerprint, stripped);

        auto outcome = verifier.verify(fingerprint);
        REQUIRE_FALSE(outcome.ok);
        REQUIRE(outcome.reason == "missing identity signature");
    }

    SECTION("signature from another identity")
    {
        auto [other_fp, other_entry] = fx.new_member("mallory");
        auto forged = entry;
        forged.identity_signature = other_entry.identity_signature;
        fx.registry->seed(fingerprint, forged);

        REQUIRE_FALSE(verifier.verify(fingerprint).ok);
    }

    SECTION("identity content tampered after signing")
    {
        auto tampered = entry;
        tampered.payload["member"] = "eve";
        fx.registry->seed(fingerprint, tampered);

        REQUIRE_FALSE(verifier.verify(fingerprint).ok);
    }

    SECTION("embedded key is not the claimed identity")
    {
        auto [other_fp, other_entry] = fx.new_member("mallory");
        // Another member's record relabelled with this fingerprint
        auto swapped = other_entry;
        swapped.identity_fingerprint = fingerprint;
        fx.registry->seed(fingerprint, swapped);

        REQUIRE_FALSE(verifier.verify(fingerprint).ok);
    }

    SECTION("record filed under a different fingerprint")
    {
        fx.registry->seed("FP2", entry);
        auto outcome = verifier.verify("FP2");
        REQUIRE_FALSE(outcome.ok);
        REQUIRE(outcome.reason.find("fingerprint mismatch") != std::string::npos);
    }

    REQUIRE(verifier.cache_size() == 0);
}

TEST_CASE("Verification tolerates backend failures", "[verifier]")
{
    Fixture fx;
    auto [fingerprint, entry] = fx.new_member("carol");
    fx.registry->seed(fingerprint, entry);

    IdentityVerifier verifier(fx.registry,
                              SigningIdentity::verifier(std::make_shared<FaultyBackend>(FaultyBackend::Mode::Throw)));
    REQUIRE_FALSE(verifier.verify(fingerprint).ok);
    REQUIRE_FALSE(verifier.cached(fingerprint));
}

TEST_CASE("Malformed fingerprints never reach the store", "[verifier]")
{
    Fixture fx;
    IdentityVerifier verifier(fx.registry, SigningIdentity::verifier(fx.identities));

    REQUIRE_FALSE(verifier.verify("../../etc/passwd").ok);
    REQUIRE_FALSE(verifier.verify("").ok);
    REQUIRE(fx.registry->reads.load() == 0);
}

TEST_CASE("Registering members", "[verifier][registry]")
{
    Fixture fx;
    IdentityVerifier verifier(fx.registry, SigningIdentity::verifier(fx.identities));
    auto [fingerprint, entry] = fx.new_member("dave");

    REQUIRE(verifier.register_member(entry).has_value());
    REQUIRE(verifier.verify(fingerprint).ok);
    REQUIRE(verifier.cached(fingerprint));

    SECTION("re-registration drops the cached verification")
    {
        REQUIRE(verifier.register_member(entry).has_value());
        REQUIRE_FALSE(verifier.cached(fingerprint));
    }

    SECTION("invalid signatures are refused")
    {
        auto forged = entry;
        forged.proof_name = "dave-forged";
        auto refused = verifier.register_member(forged);
        REQUIRE_FALSE(refused.has_value());
        REQUIRE(refused.error().code == ErrorCode::InvalidInput);
        REQUIRE(fx.registry->get(fingerprint).value()->proof_name == "dave");
    }

    SECTION("entries without a fingerprint are refused")
    {
        auto anonymous = entry;
        anonymous.identity_fingerprint.reset();
        REQUIRE_FALSE(verifier.register_member(anonymous).has_value());
    }

    SECTION("members are listed with their verification status")
    {
        auto [other_fp, other_entry] = fx.new_member("erin");
        REQUIRE(verifier.register_member(other_entry).has_value());

        auto broken = other_entry;
        broken.identity_signature = entry.identity_signature;
        fx.registry->seed(other_fp, broken);

        auto members = verifier.list_members();
        REQUIRE(members.has_value());
        REQUIRE(members->size() == 2);
        for (const auto &member : *members)
        {
            if (member.fingerprint == fingerprint)
            {
                REQUIRE(member.verified);
                REQUIRE(member.proof_name == "dave");
            }
            else
            {
                REQUIRE(member.fingerprint == other_fp);
                REQUIRE_FALSE(member.verified);
            }
        }
    }
}

TEST_CASE("Concurrent verification keeps the cache consistent", "[verifier][concurrency]")
{
    Fixture fx;
    IdentityVerifier verifier(fx.registry, SigningIdentity::verifier(fx.identities));

    std::vector<std::string> fingerprints;
    for (int i = 0; i < 4; ++i)
    {
        auto [fingerprint, entry] = fx.new_member("member-" + std::to_string(i));
        fx.registry->seed(fingerprint, entry);
        fingerprints.push_back(fingerprint);
    }

    std::atomic<int> failures{0};
    std::vector<std::thread> readers;
    for (int t = 0; t < 8; ++t)
    {
        readers.emplace_back([&]()
        {
            for (const auto &fp : fingerprints)
            {
                if (!verifier.verify(fp).ok)
                {
                    ++failures;
                }
            }
        });
    }
    for (auto &reader : readers)
    {
        reader.join();
    }

    REQUIRE(failures.load() == 0);
    REQUIRE(verifier.cache_size() == fingerprints.size());
}
