#pragma once

#include "types.hpp"
#include "audit.hpp"
#include "registration_entry.hpp"
#include "signing_identity.hpp"
#include "store.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace attest
{

    struct MemberInfo
    {
        std::string fingerprint;
        std::string proof_name;
        int64_t timestamp{0};
        bool verified{false};
        std::string reason;

        nlohmann::json to_json() const;
    };

    /**
     * Verifies external identities against their registration records.
     *
     * Successful verifications are memoized per fingerprint; failures are
     * never cached. Cached entries stay valid until invalidated, cleared or
     * the member registers again.
     */
    class IdentityVerifier
    {
    public:
        IdentityVerifier(
            std::shared_ptr<RegistrationStore> store,
            SigningIdentity verifier,
            std::shared_ptr<AuditLogger> audit = nullptr);

        /**
         * Verify the registered identity for fingerprint.
         * Served from the cache when previously verified.
         */
        Verification verify(const std::string &fingerprint);

        /**
         * Check an entry's identity signature without consulting the store or cache
         */
        Verification verify_entry(const std::string &fingerprint, const RegistrationEntry &entry) const;

        /**
         * Persist a registration record whose identity signature verifies.
         * Drops any cached verification for the fingerprint.
         */
        Result<void> register_member(const RegistrationEntry &entry);

        /**
         * Every stored member with a fresh verification outcome
         */
        Result<std::vector<MemberInfo>> list_members() const;

        void invalidate(const std::string &fingerprint);
        void clear();
        bool cached(const std::string &fingerprint) const;
        std::size_t cache_size() const;

    private:
        void audit(const std::string &fingerprint, const std::string &action, const Verification &outcome) const;

        /** Invalidation count for fingerprint since the last clear; caller holds mutex_ */
        uint64_t generation_of(const std::string &fingerprint) const;

        std::shared_ptr<RegistrationStore> store_;
        SigningIdentity verifier_;
        std::shared_ptr<AuditLogger> audit_;

        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, RegistrationEntry> cache_;
        std::unordered_map<std::string, uint64_t> generations_;
        uint64_t epoch_{0};
    };

} // namespace attest
