#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <string>

namespace attest
{

    struct LedgerConfig
    {
        std::string path{"./public_reg/training_proofs.json"};
    };

    struct RegistryConfig
    {
        std::string dir{"./registrations"};
    };

    struct GovernanceConfig
    {
        std::string proposals_dir{"./governance/proposals"};
        std::size_t proposal_id_length{16};
    };

    struct SigningConfig
    {
        std::string identity_key; // Identity key file, empty for none
        std::chrono::milliseconds backend_timeout{30000};
    };

    struct LoggingConfig
    {
        std::string level{"info"};
        std::string audit_log; // Empty logs audit events to the console only
    };

    struct AttestConfig
    {
        LedgerConfig ledger{};
        RegistryConfig registry{};
        GovernanceConfig governance{};
        SigningConfig signing{};
        LoggingConfig logging{};
    };

    /**
     * ConfigLoader loads TOML configs, then applies ATTEST_* environment
     * overrides. Out-of-range values are rejected as ConfigError.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<AttestConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<AttestConfig> from_string(const std::string &toml_content);

        /** Built-in defaults with environment overrides applied */
        static Result<AttestConfig> defaults();

        /** Serialize config to JSON for inspection */
        static nlohmann::json to_json(const AttestConfig &cfg);

    private:
        static Result<void> apply_env_overrides(AttestConfig &cfg);
        static Result<void> validate(const AttestConfig &cfg);
    };

} // namespace attest
