#pragma once

#include "types.hpp"
#include "audit.hpp"
#include "registration_entry.hpp"
#include "signing_identity.hpp"
#include "store.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace attest
{

    /**
     * First point where the stored chain stops verifying.
     */
    struct ChainBreak
    {
        enum class Kind
        {
            BrokenLink,  // prev_chain_hash differs from the predecessor's chain_hash
            HashMismatch // chain_hash does not recompute from the entry's own fields
        };

        std::size_t index{0};
        Kind kind{Kind::HashMismatch};
        std::string stored;   // Value found in the entry
        std::string computed; // Value the chain requires

        std::string describe() const;
    };

    struct ChainReport
    {
        std::size_t entries_checked{0};
        std::optional<ChainBreak> first_break;

        bool intact() const { return !first_break.has_value(); }
    };

    /**
     * Append-only, hash-chained and dual-signed registration ledger.
     *
     * Appends and identity attachments are serialized by a single writer
     * lock. Entries are never modified once chained, except for attaching
     * identity fields, which are outside the chain-hashed content.
     */
    class Ledger
    {
        struct PrivateTag
        {
            explicit PrivateTag() = default;
        };

    public:
        /**
         * Open a ledger over a store, positioning the tip at the last stored entry
         * @param chain_identity Identity used to chain-sign new entries
         * @param audit Optional security event log
         */
        static Result<std::unique_ptr<Ledger>> open(
            std::shared_ptr<LedgerStore> store,
            SigningIdentity chain_identity,
            std::shared_ptr<AuditLogger> audit = nullptr);

        /** Reachable only through open() */
        Ledger(PrivateTag,
               std::shared_ptr<LedgerStore> store,
               SigningIdentity chain_identity,
               std::shared_ptr<AuditLogger> audit,
               std::string chain_public_key,
               std::string tip,
               std::size_t size);

        /**
         * Build, chain-sign, chain and persist a new entry.
         * Nothing is persisted if signing fails; the tip only advances after
         * the store accepted the entry.
         */
        Result<RegistrationEntry> append(const nlohmann::json &payload, const std::string &proof_name);

        /**
         * Sign the stored entry with the same chain_hash using an external
         * identity and replace it in the store.
         * @return The identity-signed entry; AlreadyExists if it was signed before
         */
        Result<RegistrationEntry> attach_identity_signature(
            const RegistrationEntry &entry,
            const SigningIdentity &external_identity);

        /**
         * Recompute every chain hash and link in order. Never repairs.
         */
        Result<ChainReport> verify_chain() const;

        /**
         * verify_chain, with a break reported as ChainIntegrityError
         */
        Result<void> require_intact_chain() const;

        Result<std::vector<RegistrationEntry>> load() const;

        /**
         * Check an entry's ECDSA chain signature against its embedded chain_public_key
         */
        Verification verify_chain_signature(const RegistrationEntry &entry) const;

        std::size_t size() const;

        /** chain_hash of the last entry, or the genesis sentinel */
        std::string tip() const;

        const std::string &chain_public_key() const { return chain_public_key_; }

    private:

        void audit(const std::string &actor,
                   const std::string &action,
                   const std::string &resource,
                   const std::string &result,
                   nlohmann::json details) const;

        std::shared_ptr<LedgerStore> store_;
        SigningIdentity chain_identity_;
        std::shared_ptr<AuditLogger> audit_;
        std::string chain_public_key_;

        mutable std::mutex write_mutex_;
        std::string tip_;
        std::size_t size_;
    };

} // namespace attest
