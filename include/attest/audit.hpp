#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace spdlog
{
    class logger;
}

namespace attest
{
    struct AuditEvent
    {
        std::string ts;
        std::string actor;    // Fingerprint, key reference or "cli"
        std::string action;   // e.g. "ledger.append", "gate.deny"
        std::string resource; // chain_hash, fingerprint or proposal id
        std::string result;   // "ok", "denied", "failed"
        nlohmann::json details;

        nlohmann::json to_json() const;

        /** Build an event stamped with the current UTC time */
        static AuditEvent now(
            std::string actor,
            std::string action,
            std::string resource,
            std::string result,
            nlohmann::json details = nlohmann::json::object());
    };

    /**
     * AuditChain links events with hashes for tamper detection. Each link is
     * the ChainLink of the previous link and the canonical JSON of the event.
     * Only the head is kept; earlier hashes live in the emitted log lines.
     */
    class AuditChain
    {
    public:
        /** Append an event, returning its chain hash */
        Result<std::string> append(const AuditEvent &event);

        /** Last hash in the chain */
        std::optional<std::string> head() const;

        /** Number of events appended */
        std::size_t size() const { return length_; }

    private:
        std::optional<std::string> head_;
        std::size_t length_ = 0;
    };

    /**
     * Security event log: one JSON line per event on a dedicated "audit"
     * spdlog logger, each carrying its audit chain hash.
     */
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::shared_ptr<spdlog::logger> logger);

        /**
         * Console audit logger, also appending to file_path when non-empty
         */
        static Result<std::shared_ptr<AuditLogger>> open(const std::string &file_path);

        void log(const AuditEvent &event);

        void record(
            const std::string &actor,
            const std::string &action,
            const std::string &resource,
            const std::string &result,
            nlohmann::json details = nlohmann::json::object());

        std::optional<std::string> head() const;

    private:
        std::shared_ptr<spdlog::logger> logger_;
        mutable std::mutex mutex_;
        AuditChain chain_;
    };

    /**
     * Configure the default logger level ("trace" .. "off")
     */
    Result<void> init_logging(const std::string &level);

} // namespace attest
