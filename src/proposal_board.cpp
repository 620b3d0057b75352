#include "attest/proposal_board.hpp"
#include "attest/json_canonicalization.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <chrono>

namespace attest
{

    ProposalBoard::ProposalBoard(
        AccessGate &gate,
        std::shared_ptr<ProposalStore> store,
        std::size_t id_length,
        std::shared_ptr<AuditLogger> audit)
        : gate_(gate), store_(std::move(store)), id_length_(id_length), audit_(std::move(audit))
    {
    }

    Result<std::string> ProposalBoard::proposal_id(const Proposal &proposal, std::size_t length)
    {
        if (length == 0 || length > 64)
        {
            return std::unexpected(AttestError::invalid_input(
                fmt::format("Proposal id length must be within 1..64, got {}", length)));
        }

        auto canonical = json::CanonicalCodec::encode(proposal.to_json());
        if (!canonical)
        {
            return std::unexpected(canonical.error());
        }
        return crypto::SHA256::to_hex(crypto::SHA256::hash(*canonical)).substr(0, length);
    }

    Result<ProposalRecord> ProposalBoard::submit(const Proposal &proposal)
    {
        auto record = gate_.run(proposal.submitter, [this, &proposal]()
                                { return store_proposal(proposal); });
        if (!record && audit_ && record.error().code != ErrorCode::PermissionDenied)
        {
            audit_->record(proposal.submitter, "proposal.submit", proposal.title, "failed",
                           {{"error", record.error().what()}});
        }
        return record;
    }

    Result<ProposalRecord> ProposalBoard::store_proposal(const Proposal &proposal)
    {
        auto id = proposal_id(proposal, id_length_);
        if (!id)
        {
            return std::unexpected(id.error());
        }

        ProposalRecord record;
        record.proposal_id = *id;
        record.submitted_by = proposal.submitter;
        record.timestamp = std::chrono::duration_cast<std::chrono::seconds>(
                               std::chrono::system_clock::now().time_since_epoch())
                               .count();
        record.proposal = proposal;

        if (auto stored = store_->put(record); !stored)
        {
            return std::unexpected(stored.error());
        }

        spdlog::info("Proposal {} submitted by {}", record.proposal_id, record.submitted_by);
        if (audit_)
        {
            audit_->record(record.submitted_by, "proposal.submit", record.proposal_id, "ok",
                           {{"title", proposal.title}});
        }
        return record;
    }

    Result<ProposalRecord> ProposalBoard::get(const std::string &proposal_id) const
    {
        auto record = store_->get(proposal_id);
        if (!record)
        {
            return std::unexpected(record.error());
        }
        if (!record->has_value())
        {
            return std::unexpected(AttestError::not_found(fmt::format("No proposal {}", proposal_id)));
        }
        return std::move(**record);
    }

    Result<std::vector<ProposalRecord>> ProposalBoard::list() const
    {
        return store_->list();
    }

} // namespace attest
