#include "attest/proposal.hpp"
#include <fmt/format.h>

namespace attest
{

    using Json = nlohmann::json;

    Json Proposal::to_json() const
    {
        Json j = extra.is_object() ? extra : Json::object();
        j["title"] = title;
        j["description"] = description;
        j["submitter"] = submitter;
        return j;
    }

    Result<Proposal> Proposal::from_json(const Json &j)
    {
        if (!j.is_object())
        {
            return std::unexpected(AttestError::invalid_input("Proposal must be a JSON object"));
        }

        Proposal proposal;
        try
        {
            proposal.title = j.at("title").get<std::string>();
            proposal.description = j.value("description", std::string{});
            proposal.submitter = j.at("submitter").get<std::string>();
        }
        catch (const Json::exception &e)
        {
            return std::unexpected(AttestError::invalid_input(
                fmt::format("Failed to parse Proposal: {}", e.what())));
        }

        if (proposal.title.empty())
        {
            return std::unexpected(AttestError::invalid_input("Proposal title must not be empty"));
        }

        for (auto it = j.begin(); it != j.end(); ++it)
        {
            if (it.key() != "title" && it.key() != "description" && it.key() != "submitter")
            {
                proposal.extra[it.key()] = it.value();
            }
        }
        return proposal;
    }

    Json ProposalRecord::to_json() const
    {
        return Json{
            {"proposal_id", proposal_id},
            {"submitted_by", submitted_by},
            {"timestamp", timestamp},
            {"proposal", proposal.to_json()}};
    }

    Result<ProposalRecord> ProposalRecord::from_json(const Json &j)
    {
        ProposalRecord record;
        try
        {
            record.proposal_id = j.at("proposal_id").get<std::string>();
            record.submitted_by = j.at("submitted_by").get<std::string>();
            record.timestamp = j.at("timestamp").get<int64_t>();
        }
        catch (const Json::exception &e)
        {
            return std::unexpected(AttestError::invalid_input(
                fmt::format("Failed to parse ProposalRecord: {}", e.what())));
        }

        if (!j.contains("proposal"))
        {
            return std::unexpected(AttestError::invalid_input("ProposalRecord has no proposal"));
        }
        auto proposal = Proposal::from_json(j["proposal"]);
        if (!proposal)
        {
            return std::unexpected(proposal.error());
        }
        record.proposal = std::move(*proposal);
        return record;
    }

} // namespace attest
