#include "attest/ledger.hpp"
#include "attest/chain_link.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>

namespace attest
{

    namespace
    {
        int64_t unix_now()
        {
            return std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                .count();
        }

        const char *kind_name(ChainBreak::Kind kind)
        {
            switch (kind)
            {
            case ChainBreak::Kind::BrokenLink:
                return "broken link";
            case ChainBreak::Kind::HashMismatch:
                return "hash mismatch";
            }
            return "unknown";
        }
    } // namespace

    std::string ChainBreak::describe() const
    {
        return fmt::format("chain broken at index {} ({}): stored {}, computed {}",
                           index, kind_name(kind), stored, computed);
    }

    Ledger::Ledger(PrivateTag,
                   std::shared_ptr<LedgerStore> store,
                   SigningIdentity chain_identity,
                   std::shared_ptr<AuditLogger> audit,
                   std::string chain_public_key,
                   std::string tip,
                   std::size_t size)
        : store_(std::move(store)),
          chain_identity_(std::move(chain_identity)),
          audit_(std::move(audit)),
          chain_public_key_(std::move(chain_public_key)),
          tip_(std::move(tip)),
          size_(size)
    {
    }

    Result<std::unique_ptr<Ledger>> Ledger::open(
        std::shared_ptr<LedgerStore> store,
        SigningIdentity chain_identity,
        std::shared_ptr<AuditLogger> audit)
    {
        if (!store)
        {
            return std::unexpected(AttestError::invalid_input("Ledger requires a store"));
        }

        auto entries = store->load_all();
        if (!entries)
        {
            return std::unexpected(entries.error());
        }

        auto public_key = chain_identity.public_key();
        if (!public_key)
        {
            return std::unexpected(public_key.error());
        }

        std::string tip = ChainLink::genesis();
        if (!entries->empty())
        {
            if (!entries->back().chain_hash)
            {
                return std::unexpected(AttestError::chain_integrity(
                    fmt::format("Last ledger entry (index {}) has no chain_hash", entries->size() - 1)));
            }
            tip = *entries->back().chain_hash;
        }

        spdlog::debug("Ledger opened with {} entries, tip {}", entries->size(), tip);
        return std::make_unique<Ledger>(PrivateTag{},
                                        std::move(store),
                                        std::move(chain_identity),
                                        std::move(audit),
                                        std::move(*public_key),
                                        std::move(tip),
                                        entries->size());
    }

    void Ledger::audit(const std::string &actor,
                       const std::string &action,
                       const std::string &resource,
                       const std::string &result,
                       nlohmann::json details) const
    {
        if (audit_)
        {
            audit_->record(actor, action, resource, result, std::move(details));
        }
    }

    Result<RegistrationEntry> Ledger::append(const nlohmann::json &payload, const std::string &proof_name)
    {
        std::lock_guard lock(write_mutex_);

        RegistrationEntry entry;
        entry.proof_name = proof_name;
        entry.payload = payload;
        entry.timestamp = unix_now();
        entry.prev_chain_hash = tip_;
        entry.chain_public_key = chain_public_key_;

        auto content = entry.chain_content_bytes();
        if (!content)
        {
            return std::unexpected(content.error());
        }

        auto signature = chain_identity_.sign(*content);
        if (!signature)
        {
            spdlog::error("Chain signing failed for '{}': {}", proof_name, signature.error().what());
            audit(chain_identity_.key_ref(), "ledger.append", proof_name, "failed",
                  {{"error", signature.error().what()}});
            return std::unexpected(signature.error());
        }
        entry.chain_signature = *signature;
        entry.chain_hash = ChainLink::compute(entry.prev_chain_hash, *content);

        if (auto stored = store_->append(entry); !stored)
        {
            spdlog::error("Persisting ledger entry failed: {}", stored.error().what());
            audit(chain_identity_.key_ref(), "ledger.append", *entry.chain_hash, "failed",
                  {{"error", stored.error().what()}});
            return std::unexpected(stored.error());
        }

        tip_ = *entry.chain_hash;
        ++size_;

        spdlog::info("Appended '{}' at index {} ({})", proof_name, size_ - 1, tip_);
        audit(chain_identity_.key_ref(), "ledger.append", tip_, "ok",
              {{"proof_name", proof_name}, {"index", size_ - 1}});
        return entry;
    }

    Result<RegistrationEntry> Ledger::attach_identity_signature(
        const RegistrationEntry &entry,
        const SigningIdentity &external_identity)
    {
        if (!entry.chain_hash)
        {
            return std::unexpected(AttestError::invalid_input("Entry is not chained"));
        }

        std::lock_guard lock(write_mutex_);

        auto entries = store_->load_all();
        if (!entries)
        {
            return std::unexpected(entries.error());
        }

        auto it = std::find_if(entries->begin(), entries->end(), [&](const RegistrationEntry &stored)
                               { return stored.chain_hash == entry.chain_hash; });
        if (it == entries->end())
        {
            return std::unexpected(AttestError::not_found(
                fmt::format("No ledger entry with chain_hash {}", *entry.chain_hash)));
        }
        if (it->identity_fingerprint || it->identity_signature)
        {
            return std::unexpected(AttestError::already_exists(
                fmt::format("Entry {} already carries an identity signature", *entry.chain_hash)));
        }

        auto public_key = external_identity.public_key();
        if (!public_key)
        {
            return std::unexpected(public_key.error());
        }
        auto fingerprint = external_identity.fingerprint_of(*public_key);
        if (fingerprint.empty())
        {
            fingerprint = external_identity.key_ref();
        }

        // Sign what is stored, not the caller's copy
        RegistrationEntry signed_entry = *it;
        signed_entry.identity_fingerprint = fingerprint;

        auto content = signed_entry.identity_content_bytes();
        if (!content)
        {
            return std::unexpected(content.error());
        }

        auto signature = external_identity.sign(*content);
        if (!signature)
        {
            audit(fingerprint, "ledger.attach_identity", *entry.chain_hash, "failed",
                  {{"error", signature.error().what()}});
            return std::unexpected(signature.error());
        }
        signed_entry.identity_signature = *signature;
        signed_entry.identity_public_key = *public_key;

        if (auto replaced = store_->replace(signed_entry); !replaced)
        {
            return std::unexpected(replaced.error());
        }

        spdlog::info("Attached identity {} to entry {}", fingerprint, *entry.chain_hash);
        audit(fingerprint, "ledger.attach_identity", *entry.chain_hash, "ok",
              {{"proof_name", signed_entry.proof_name}});
        return signed_entry;
    }

    Result<ChainReport> Ledger::verify_chain() const
    {
        auto entries = store_->load_all();
        if (!entries)
        {
            return std::unexpected(entries.error());
        }

        ChainReport report;
        std::string expected_prev = ChainLink::genesis();

        for (std::size_t i = 0; i < entries->size(); ++i)
        {
            const auto &entry = (*entries)[i];

            if (entry.prev_chain_hash != expected_prev)
            {
                report.first_break = ChainBreak{i, ChainBreak::Kind::BrokenLink, entry.prev_chain_hash, expected_prev};
                break;
            }

            auto content = entry.chain_content_bytes();
            if (!content)
            {
                return std::unexpected(content.error());
            }

            auto computed = ChainLink::compute(entry.prev_chain_hash, *content);
            auto stored = entry.chain_hash.value_or("");
            if (computed != stored)
            {
                report.first_break = ChainBreak{i, ChainBreak::Kind::HashMismatch, stored, computed};
                break;
            }

            expected_prev = stored;
            report.entries_checked = i + 1;
        }

        if (report.first_break)
        {
            spdlog::warn("Ledger verification failed: {}", report.first_break->describe());
        }
        return report;
    }

    Result<void> Ledger::require_intact_chain() const
    {
        auto report = verify_chain();
        if (!report)
        {
            return std::unexpected(report.error());
        }
        if (!report->intact())
        {
            return std::unexpected(AttestError::chain_integrity(report->first_break->describe()));
        }
        return {};
    }

    Result<std::vector<RegistrationEntry>> Ledger::load() const
    {
        return store_->load_all();
    }

    Verification Ledger::verify_chain_signature(const RegistrationEntry &entry) const
    {
        if (!entry.chain_signature)
        {
            return Verification::failure("missing chain signature");
        }

        auto content = entry.chain_content_bytes();
        if (!content)
        {
            return Verification::failure(content.error().what());
        }
        return chain_identity_.verify(*content, *entry.chain_signature, entry.chain_public_key);
    }

    std::size_t Ledger::size() const
    {
        std::lock_guard lock(write_mutex_);
        return size_;
    }

    std::string Ledger::tip() const
    {
        std::lock_guard lock(write_mutex_);
        return tip_;
    }

} // namespace attest
