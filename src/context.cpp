#include "attest/context.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace attest
{

    Result<std::unique_ptr<GovernanceContext>> GovernanceContext::open(
        const AttestConfig &cfg,
        std::shared_ptr<AuditLogger> audit)
    {
        auto ctx = std::make_unique<GovernanceContext>(PrivateTag{});
        ctx->config_ = cfg;

        if (!audit)
        {
            auto opened = AuditLogger::open(cfg.logging.audit_log);
            if (!opened)
            {
                return std::unexpected(opened.error());
            }
            audit = std::move(*opened);
        }
        ctx->audit_ = std::move(audit);

        ctx->ledger_store_ = std::make_shared<FileLedgerStore>(cfg.ledger.path);
        ctx->registration_store_ = std::make_shared<DirectoryRegistrationStore>(cfg.registry.dir);
        ctx->proposal_store_ = std::make_shared<DirectoryProposalStore>(cfg.governance.proposals_dir);

        auto chain_backend = EcdsaChainBackend::create();
        if (!chain_backend)
        {
            return std::unexpected(chain_backend.error());
        }
        ctx->chain_backend_ = std::move(*chain_backend);
        ctx->identity_backend_ = std::make_shared<Ed25519IdentityBackend>();

        if (!cfg.signing.identity_key.empty())
        {
            auto identity = crypto::IdentityKey::load(cfg.signing.identity_key);
            if (!identity)
            {
                return std::unexpected(identity.error());
            }
            ctx->identity_fingerprint_ = ctx->identity_backend_->add_identity(*identity);
            spdlog::info("Loaded identity {} from {}", *ctx->identity_fingerprint_, cfg.signing.identity_key);
        }

        auto ledger = Ledger::open(
            ctx->ledger_store_,
            SigningIdentity(ctx->chain_backend_, EcdsaChainBackend::kKeyRef, cfg.signing.backend_timeout),
            ctx->audit_);
        if (!ledger)
        {
            return std::unexpected(ledger.error());
        }
        ctx->ledger_ = std::move(*ledger);

        ctx->verifier_ = std::make_unique<IdentityVerifier>(
            ctx->registration_store_,
            SigningIdentity::verifier(ctx->identity_backend_, cfg.signing.backend_timeout),
            ctx->audit_);
        ctx->gate_ = std::make_unique<AccessGate>(*ctx->verifier_, ctx->audit_);
        ctx->board_ = std::make_unique<ProposalBoard>(
            *ctx->gate_,
            ctx->proposal_store_,
            cfg.governance.proposal_id_length,
            ctx->audit_);

        return ctx;
    }

    Result<SigningIdentity> GovernanceContext::external_identity(const std::string &fingerprint) const
    {
        if (!identity_backend_->has_identity(fingerprint))
        {
            return std::unexpected(AttestError::not_found(
                fmt::format("No identity key loaded for {}", fingerprint)));
        }
        return SigningIdentity(identity_backend_, fingerprint, config_.signing.backend_timeout);
    }

    Result<SigningIdentity> GovernanceContext::external_identity() const
    {
        if (!identity_fingerprint_)
        {
            return std::unexpected(AttestError::config(
                "No identity key configured (signing.identity_key / ATTEST_IDENTITY_KEY)"));
        }
        return external_identity(*identity_fingerprint_);
    }

} // namespace attest
