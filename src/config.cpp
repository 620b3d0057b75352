#include "attest/config.hpp"
#include <fmt/format.h>
#include <toml++/toml.h>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace attest
{
    namespace
    {
        Result<int64_t> parse_integer(const char *name, const std::string &text)
        {
            int64_t value = 0;
            auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || end != text.data() + text.size())
            {
                return std::unexpected(AttestError::config(
                    fmt::format("{} must be an integer, got '{}'", name, text)));
            }
            return value;
        }

        Result<AttestConfig> parse_toml(const toml::table &tbl, AttestConfig cfg)
        {
            if (auto ledger = tbl["ledger"].as_table())
            {
                if (auto path = (*ledger)["path"].value<std::string>())
                    cfg.ledger.path = *path;
            }

            if (auto registry = tbl["registry"].as_table())
            {
                if (auto dir = (*registry)["dir"].value<std::string>())
                    cfg.registry.dir = *dir;
            }

            if (auto governance = tbl["governance"].as_table())
            {
                if (auto dir = (*governance)["proposals_dir"].value<std::string>())
                    cfg.governance.proposals_dir = *dir;
                if (auto len = (*governance)["proposal_id_length"].value<int64_t>())
                {
                    if (*len <= 0)
                        return std::unexpected(AttestError::config("governance.proposal_id_length must be positive"));
                    cfg.governance.proposal_id_length = static_cast<std::size_t>(*len);
                }
            }

            if (auto signing = tbl["signing"].as_table())
            {
                if (auto key = (*signing)["identity_key"].value<std::string>())
                    cfg.signing.identity_key = *key;
                if (auto timeout = (*signing)["backend_timeout_ms"].value<int64_t>())
                    cfg.signing.backend_timeout = std::chrono::milliseconds(*timeout);
            }

            if (auto logging = tbl["logging"].as_table())
            {
                if (auto level = (*logging)["level"].value<std::string>())
                    cfg.logging.level = *level;
                if (auto audit_log = (*logging)["audit_log"].value<std::string>())
                    cfg.logging.audit_log = *audit_log;
            }

            return cfg;
        }

    } // namespace

    Result<AttestConfig> ConfigLoader::defaults()
    {
        AttestConfig cfg{};
        if (auto env = apply_env_overrides(cfg); !env)
            return std::unexpected(env.error());
        if (auto valid = validate(cfg); !valid)
            return std::unexpected(valid.error());
        return cfg;
    }

    Result<AttestConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(AttestError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<AttestConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        AttestConfig cfg{};

        try
        {
            auto tbl = toml::parse(toml_content);
            auto parsed = parse_toml(tbl, cfg);
            if (!parsed)
                return parsed;
            cfg = *parsed;
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(AttestError::config(fmt::format("Failed to parse TOML: {}", e.description())));
        }

        if (auto env = apply_env_overrides(cfg); !env)
            return std::unexpected(env.error());
        if (auto valid = validate(cfg); !valid)
            return std::unexpected(valid.error());
        return cfg;
    }

    Result<void> ConfigLoader::apply_env_overrides(AttestConfig &cfg)
    {
        if (const char *path = std::getenv("ATTEST_LEDGER_PATH"))
            cfg.ledger.path = path;
        if (const char *dir = std::getenv("ATTEST_REGISTRY_DIR"))
            cfg.registry.dir = dir;
        if (const char *dir = std::getenv("ATTEST_PROPOSALS_DIR"))
            cfg.governance.proposals_dir = dir;
        if (const char *len = std::getenv("ATTEST_PROPOSAL_ID_LENGTH"))
        {
            auto value = parse_integer("ATTEST_PROPOSAL_ID_LENGTH", len);
            if (!value)
                return std::unexpected(value.error());
            if (*value <= 0)
                return std::unexpected(AttestError::config("ATTEST_PROPOSAL_ID_LENGTH must be positive"));
            cfg.governance.proposal_id_length = static_cast<std::size_t>(*value);
        }
        if (const char *key = std::getenv("ATTEST_IDENTITY_KEY"))
            cfg.signing.identity_key = key;
        if (const char *timeout = std::getenv("ATTEST_SIGNING_TIMEOUT_MS"))
        {
            auto value = parse_integer("ATTEST_SIGNING_TIMEOUT_MS", timeout);
            if (!value)
                return std::unexpected(value.error());
            cfg.signing.backend_timeout = std::chrono::milliseconds(*value);
        }
        if (const char *level = std::getenv("ATTEST_LOG_LEVEL"))
            cfg.logging.level = level;
        if (const char *audit_log = std::getenv("ATTEST_AUDIT_LOG"))
            cfg.logging.audit_log = audit_log;
        return {};
    }

    Result<void> ConfigLoader::validate(const AttestConfig &cfg)
    {
        if (cfg.ledger.path.empty())
            return std::unexpected(AttestError::config("ledger.path must not be empty"));
        if (cfg.registry.dir.empty())
            return std::unexpected(AttestError::config("registry.dir must not be empty"));
        if (cfg.governance.proposals_dir.empty())
            return std::unexpected(AttestError::config("governance.proposals_dir must not be empty"));
        if (cfg.governance.proposal_id_length == 0 || cfg.governance.proposal_id_length > 64)
            return std::unexpected(AttestError::config(fmt::format(
                "governance.proposal_id_length must be within 1..64, got {}", cfg.governance.proposal_id_length)));
        if (cfg.signing.backend_timeout.count() < 0)
            return std::unexpected(AttestError::config("signing.backend_timeout_ms must not be negative"));

        static const char *levels[] = {"trace", "debug", "info", "warn", "warning", "error", "err", "critical", "off"};
        bool known = false;
        for (const char *level : levels)
        {
            known = known || cfg.logging.level == level;
        }
        if (!known)
            return std::unexpected(AttestError::config(fmt::format("Unknown logging.level '{}'", cfg.logging.level)));

        return {};
    }

    nlohmann::json ConfigLoader::to_json(const AttestConfig &cfg)
    {
        nlohmann::json j;
        j["ledger"] = {{"path", cfg.ledger.path}};
        j["registry"] = {{"dir", cfg.registry.dir}};
        j["governance"] = {
            {"proposals_dir", cfg.governance.proposals_dir},
            {"proposal_id_length", cfg.governance.proposal_id_length}};
        j["signing"] = {
            {"identity_key", cfg.signing.identity_key},
            {"backend_timeout_ms", cfg.signing.backend_timeout.count()}};
        j["logging"] = {{"level", cfg.logging.level}, {"audit_log", cfg.logging.audit_log}};
        return j;
    }

} // namespace attest
