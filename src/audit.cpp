#include "attest/audit.hpp"
#include "attest/chain_link.hpp"
#include "attest/json_canonicalization.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <chrono>
#include <ctime>
#include <vector>

namespace attest
{

    namespace
    {
        std::string now_ts()
        {
            auto now = std::chrono::system_clock::now();
            auto t = std::chrono::system_clock::to_time_t(now);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
            std::tm tm_buf;
            gmtime_r(&t, &tm_buf);
            return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                               tm_buf.tm_year + 1900,
                               tm_buf.tm_mon + 1,
                               tm_buf.tm_mday,
                               tm_buf.tm_hour,
                               tm_buf.tm_min,
                               tm_buf.tm_sec,
                               static_cast<int>(ms.count()));
        }
    }

    nlohmann::json AuditEvent::to_json() const
    {
        return nlohmann::json{{"ts", ts},
                              {"actor", actor},
                              {"action", action},
                              {"resource", resource},
                              {"result", result},
                              {"details", details}};
    }

    AuditEvent AuditEvent::now(
        std::string actor,
        std::string action,
        std::string resource,
        std::string result,
        nlohmann::json details)
    {
        return AuditEvent{now_ts(),
                          std::move(actor),
                          std::move(action),
                          std::move(resource),
                          std::move(result),
                          std::move(details)};
    }

    Result<std::string> AuditChain::append(const AuditEvent &event)
    {
        auto canonical = json::CanonicalCodec::encode(event.to_json());
        if (!canonical)
        {
            return std::unexpected(canonical.error());
        }
        auto hash = ChainLink::compute(head_.value_or(ChainLink::genesis()), *canonical);
        head_ = hash;
        ++length_;
        return hash;
    }

    std::optional<std::string> AuditChain::head() const
    {
        return head_;
    }

    AuditLogger::AuditLogger(std::shared_ptr<spdlog::logger> logger)
        : logger_(std::move(logger))
    {
    }

    Result<std::shared_ptr<AuditLogger>> AuditLogger::open(const std::string &file_path)
    {
        try
        {
            std::vector<spdlog::sink_ptr> sinks;
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
            if (!file_path.empty())
            {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path));
            }
            auto logger = std::make_shared<spdlog::logger>("audit", sinks.begin(), sinks.end());
            logger->set_pattern("[%Y-%m-%dT%H:%M:%S.%e] [audit] %v");
            logger->set_level(spdlog::level::info);
            logger->flush_on(spdlog::level::info);
            return std::make_shared<AuditLogger>(std::move(logger));
        }
        catch (const spdlog::spdlog_ex &e)
        {
            return std::unexpected(AttestError(ErrorCode::IOError,
                                               fmt::format("Failed to open audit log {}: {}", file_path, e.what())));
        }
    }

    void AuditLogger::log(const AuditEvent &event)
    {
        nlohmann::json j = event.to_json();

        std::lock_guard lock(mutex_);
        auto hash = chain_.append(event);
        if (hash)
        {
            j["chain_hash"] = *hash;
        }
        else
        {
            spdlog::warn("Audit event not chained: {}", hash.error().what());
        }
        logger_->info(j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }

    void AuditLogger::record(
        const std::string &actor,
        const std::string &action,
        const std::string &resource,
        const std::string &result,
        nlohmann::json details)
    {
        log(AuditEvent::now(actor, action, resource, result, std::move(details)));
    }

    std::optional<std::string> AuditLogger::head() const
    {
        std::lock_guard lock(mutex_);
        return chain_.head();
    }

    Result<void> init_logging(const std::string &level)
    {
        auto parsed = spdlog::level::from_str(level);
        if (parsed == spdlog::level::off && level != "off")
        {
            return std::unexpected(AttestError::config(fmt::format("Unknown log level '{}'", level)));
        }
        spdlog::set_level(parsed);
        return {};
    }

} // namespace attest
