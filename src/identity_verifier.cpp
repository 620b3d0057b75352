#include "attest/identity_verifier.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <mutex>

namespace attest
{

    nlohmann::json MemberInfo::to_json() const
    {
        return nlohmann::json{{"fingerprint", fingerprint},
                              {"proof_name", proof_name},
                              {"timestamp", timestamp},
                              {"verified", verified},
                              {"reason", reason}};
    }

    IdentityVerifier::IdentityVerifier(
        std::shared_ptr<RegistrationStore> store,
        SigningIdentity verifier,
        std::shared_ptr<AuditLogger> audit)
        : store_(std::move(store)), verifier_(std::move(verifier)), audit_(std::move(audit))
    {
    }

    void IdentityVerifier::audit(const std::string &fingerprint, const std::string &action, const Verification &outcome) const
    {
        if (audit_)
        {
            audit_->record(fingerprint, action, fingerprint, outcome.ok ? "ok" : "failed",
                           {{"reason", outcome.reason}});
        }
    }

    Verification IdentityVerifier::verify(const std::string &fingerprint)
    {
        if (!is_valid_store_key(fingerprint))
        {
            return Verification::failure("invalid fingerprint");
        }

        uint64_t epoch = 0;
        uint64_t generation = 0;
        {
            std::shared_lock lock(mutex_);
            if (cache_.contains(fingerprint))
            {
                return Verification::success("cached");
            }
            epoch = epoch_;
            generation = generation_of(fingerprint);
        }

        auto record = store_->get(fingerprint);
        if (!record)
        {
            spdlog::warn("Cannot load registration for {}: {}", fingerprint, record.error().what());
            auto outcome = Verification::failure(record.error().what());
            audit(fingerprint, "identity.verify", outcome);
            return outcome;
        }
        if (!record->has_value())
        {
            auto outcome = Verification::failure("not registered");
            audit(fingerprint, "identity.verify", outcome);
            return outcome;
        }

        auto outcome = verify_entry(fingerprint, **record);
        if (outcome.ok)
        {
            // A record invalidated while it was being read is not cached
            std::unique_lock lock(mutex_);
            if (epoch_ == epoch && generation_of(fingerprint) == generation)
            {
                cache_.insert_or_assign(fingerprint, std::move(**record));
            }
        }
        else
        {
            spdlog::warn("Identity {} failed verification: {}", fingerprint, outcome.reason);
        }
        audit(fingerprint, "identity.verify", outcome);
        return outcome;
    }

    Verification IdentityVerifier::verify_entry(const std::string &fingerprint, const RegistrationEntry &entry) const
    {
        if (!entry.identity_fingerprint)
        {
            return Verification::failure("missing identity fingerprint");
        }
        if (*entry.identity_fingerprint != fingerprint)
        {
            return Verification::failure(fmt::format(
                "fingerprint mismatch: claimed {}, embedded {}", fingerprint, *entry.identity_fingerprint));
        }
        if (!entry.identity_signature || !entry.identity_public_key)
        {
            return Verification::failure("missing identity signature");
        }

        auto content = entry.identity_content_bytes();
        if (!content)
        {
            return Verification::failure(content.error().what());
        }

        return verifier_.verify(*content, *entry.identity_signature, *entry.identity_public_key, fingerprint);
    }

    Result<void> IdentityVerifier::register_member(const RegistrationEntry &entry)
    {
        if (!entry.identity_fingerprint)
        {
            return std::unexpected(AttestError::invalid_input("Registration has no identity_fingerprint"));
        }
        const auto &fingerprint = *entry.identity_fingerprint;
        if (!is_valid_store_key(fingerprint))
        {
            return std::unexpected(AttestError::invalid_input(
                fmt::format("Invalid fingerprint '{}'", fingerprint)));
        }

        auto outcome = verify_entry(fingerprint, entry);
        if (!outcome.ok)
        {
            audit(fingerprint, "identity.register", outcome);
            return std::unexpected(AttestError::invalid_input(
                fmt::format("Registration for {} rejected: {}", fingerprint, outcome.reason)));
        }

        if (auto stored = store_->put(entry); !stored)
        {
            return std::unexpected(stored.error());
        }

        invalidate(fingerprint);
        spdlog::info("Registered member {} ({})", fingerprint, entry.proof_name);
        audit(fingerprint, "identity.register", outcome);
        return {};
    }

    Result<std::vector<MemberInfo>> IdentityVerifier::list_members() const
    {
        auto fingerprints = store_->list();
        if (!fingerprints)
        {
            return std::unexpected(fingerprints.error());
        }

        std::vector<MemberInfo> members;
        members.reserve(fingerprints->size());
        for (const auto &fingerprint : *fingerprints)
        {
            MemberInfo info;
            info.fingerprint = fingerprint;

            auto record = store_->get(fingerprint);
            if (!record)
            {
                info.reason = record.error().what();
                members.push_back(std::move(info));
                continue;
            }
            if (!record->has_value())
            {
                continue;
            }

            const auto &entry = **record;
            info.proof_name = entry.proof_name;
            info.timestamp = entry.timestamp;

            auto outcome = verify_entry(fingerprint, entry);
            info.verified = outcome.ok;
            info.reason = outcome.reason;
            if (!outcome.ok)
            {
                spdlog::warn("Member {} has an invalid signature: {}", fingerprint, outcome.reason);
            }
            members.push_back(std::move(info));
        }
        return members;
    }

    void IdentityVerifier::invalidate(const std::string &fingerprint)
    {
        std::unique_lock lock(mutex_);
        cache_.erase(fingerprint);
        ++generations_[fingerprint];
    }

    void IdentityVerifier::clear()
    {
        std::unique_lock lock(mutex_);
        cache_.clear();
        generations_.clear();
        ++epoch_;
    }

    uint64_t IdentityVerifier::generation_of(const std::string &fingerprint) const
    {
        auto it = generations_.find(fingerprint);
        return it == generations_.end() ? 0 : it->second;
    }

    bool IdentityVerifier::cached(const std::string &fingerprint) const
    {
        std::shared_lock lock(mutex_);
        return cache_.contains(fingerprint);
    }

    std::size_t IdentityVerifier::cache_size() const
    {
        std::shared_lock lock(mutex_);
        return cache_.size();
    }

} // namespace attest
