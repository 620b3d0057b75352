#pragma once

#include "types.hpp"
#include "access_gate.hpp"
#include "audit.hpp"
#include "proposal.hpp"
#include "store.hpp"
#include <memory>
#include <string>
#include <vector>

namespace attest
{

    /**
     * Governance proposals from verified members. Content addressed and
     * write-once; proposals are not part of the ledger chain.
     */
    class ProposalBoard
    {
    public:
        static constexpr std::size_t kDefaultIdLength = 16;

        ProposalBoard(
            AccessGate &gate,
            std::shared_ptr<ProposalStore> store,
            std::size_t id_length = kDefaultIdLength,
            std::shared_ptr<AuditLogger> audit = nullptr);

        /**
         * First length hex characters of SHA-256 over the canonical proposal
         */
        static Result<std::string> proposal_id(const Proposal &proposal, std::size_t length);

        /**
         * Store a proposal on behalf of proposal.submitter, who must verify.
         * @return PermissionDenied for unverified submitters, AlreadyExists for resubmissions
         */
        Result<ProposalRecord> submit(const Proposal &proposal);

        Result<ProposalRecord> get(const std::string &proposal_id) const;

        Result<std::vector<ProposalRecord>> list() const;

    private:
        Result<ProposalRecord> store_proposal(const Proposal &proposal);

        AccessGate &gate_;
        std::shared_ptr<ProposalStore> store_;
        std::size_t id_length_;
        std::shared_ptr<AuditLogger> audit_;
    };

} // namespace attest
