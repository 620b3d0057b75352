#pragma once

#include "types.hpp"
#include "access_gate.hpp"
#include "audit.hpp"
#include "config.hpp"
#include "identity_verifier.hpp"
#include "ledger.hpp"
#include "proposal_board.hpp"
#include "signing_backend.hpp"
#include "signing_identity.hpp"
#include "store.hpp"
#include <memory>
#include <optional>
#include <string>

namespace attest
{

    /**
     * Process context owning every long-lived collaborator.
     *
     * Built once from configuration and passed explicitly to callers; the
     * verifier cache therefore lives as long as the context does.
     */
    class GovernanceContext
    {
        struct PrivateTag
        {
            explicit PrivateTag() = default;
        };

    public:
        /**
         * Build stores, backends and services from cfg.
         * A configured identity key is loaded into the identity backend.
         * @param audit Audit logger to use; opened from cfg.logging when null
         */
        static Result<std::unique_ptr<GovernanceContext>> open(
            const AttestConfig &cfg,
            std::shared_ptr<AuditLogger> audit = nullptr);

        /** Reachable only through open() */
        explicit GovernanceContext(PrivateTag) {}

        GovernanceContext(const GovernanceContext &) = delete;
        GovernanceContext &operator=(const GovernanceContext &) = delete;

        const AttestConfig &config() const { return config_; }

        Ledger &ledger() { return *ledger_; }
        IdentityVerifier &verifier() { return *verifier_; }
        AccessGate &gate() { return *gate_; }
        ProposalBoard &proposals() { return *board_; }

        Ed25519IdentityBackend &identity_backend() { return *identity_backend_; }
        const std::shared_ptr<AuditLogger> &audit() const { return audit_; }

        /**
         * Fingerprint of the identity key loaded from configuration, if any
         */
        const std::optional<std::string> &identity_fingerprint() const { return identity_fingerprint_; }

        /**
         * Signing identity for a fingerprint held by the identity backend
         */
        Result<SigningIdentity> external_identity(const std::string &fingerprint) const;

        /**
         * Signing identity for the configured identity key
         */
        Result<SigningIdentity> external_identity() const;

    private:
        AttestConfig config_;
        std::shared_ptr<AuditLogger> audit_;

        std::shared_ptr<FileLedgerStore> ledger_store_;
        std::shared_ptr<DirectoryRegistrationStore> registration_store_;
        std::shared_ptr<DirectoryProposalStore> proposal_store_;

        std::shared_ptr<EcdsaChainBackend> chain_backend_;
        std::shared_ptr<Ed25519IdentityBackend> identity_backend_;
        std::optional<std::string> identity_fingerprint_;

        // Declaration order is teardown order in reverse: board, gate, verifier
        std::unique_ptr<Ledger> ledger_;
        std::unique_ptr<IdentityVerifier> verifier_;
        std::unique_ptr<AccessGate> gate_;
        std::unique_ptr<ProposalBoard> board_;
    };

} // namespace attest
