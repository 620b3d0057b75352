#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace attest
{

    /**
     * Governance proposal content.
     * Keys other than title, description and submitter are kept in extra.
     */
    struct Proposal
    {
        std::string title;
        std::string description;
        std::string submitter; // Fingerprint of the proposing member
        nlohmann::json extra = nlohmann::json::object();

        nlohmann::json to_json() const;
        static Result<Proposal> from_json(const nlohmann::json &j);
    };

    /**
     * Persisted, write-once form of a submitted proposal
     */
    struct ProposalRecord
    {
        std::string proposal_id;
        std::string submitted_by;
        int64_t timestamp{0};
        Proposal proposal;

        nlohmann::json to_json() const;
        static Result<ProposalRecord> from_json(const nlohmann::json &j);
    };

} // namespace attest
