#include "attest/cli.hpp"
#include "attest/config.hpp"
#include "attest/context.hpp"
#include "attest/crypto.hpp"
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

namespace attest::cli
{

	namespace
	{
		constexpr int kOk = 0;
		constexpr int kFailure = 1;
		constexpr int kRejected = 2;

		int fail(const AttestError &error)
		{
			std::cerr << error_code_to_string(error.code) << ": " << error.what() << std::endl;
			switch (error.code)
			{
			case ErrorCode::PermissionDenied:
			case ErrorCode::ChainIntegrityError:
				return kRejected;
			default:
				return kFailure;
			}
		}

		Result<nlohmann::json> read_json(const std::string &path)
		{
			std::ifstream f(path);
			if (!f.is_open())
			{
				return std::unexpected(AttestError(ErrorCode::IOError, "Unable to open " + path));
			}
			try
			{
				nlohmann::json j;
				f >> j;
				return j;
			}
			catch (const nlohmann::json::exception &e)
			{
				return std::unexpected(AttestError(ErrorCode::ParsingError, path + ": " + e.what()));
			}
		}

		Result<AttestConfig> load_config(const std::string &path)
		{
			auto cfg = path.empty() ? ConfigLoader::defaults() : ConfigLoader::load(path);
			if (!cfg)
			{
				return cfg;
			}
			if (auto logging = init_logging(cfg->logging.level); !logging)
			{
				return std::unexpected(logging.error());
			}
			return cfg;
		}
	} // namespace

	int run(int argc, char *argv[])
	{
		CLI::App app{"attest - registration ledger"};
		app.require_subcommand(1);

		std::string config_path;
		app.add_option("--config", config_path, "Path to config TOML");

		auto cfg_cmd = app.add_subcommand("config-print", "Load and print config as JSON");

		std::string key_out;
		std::string key_purpose{"identity"};
		bool key_encrypt{false};
		auto keygen_cmd = app.add_subcommand("keygen", "Generate an Ed25519 identity key file");
		keygen_cmd->add_option("--out", key_out, "Key file to write")->required();
		keygen_cmd->add_option("--purpose", key_purpose, "Purpose recorded in the key file");
		keygen_cmd->add_flag("--encrypt", key_encrypt, "Encrypt with ATTEST_KEY_ENCRYPTION_KEY");

		std::string proof_name;
		std::string payload_text;
		std::string payload_path;
		auto append_cmd = app.add_subcommand("append", "Append a chain-signed entry to the ledger");
		append_cmd->add_option("--proof-name", proof_name, "Human label of the attestation")->required();
		auto payload_opt = append_cmd->add_option("--payload", payload_text, "Payload as inline JSON");
		auto payload_file_opt = append_cmd->add_option("--payload-file", payload_path, "Payload JSON file");
		payload_opt->excludes(payload_file_opt);

		std::string attach_hash;
		bool attach_register{false};
		auto attach_cmd = app.add_subcommand("attach-identity", "Identity-sign a ledger entry with the configured key");
		attach_cmd->add_option("--chain-hash", attach_hash, "chain_hash of the entry")->required();
		attach_cmd->add_flag("--register", attach_register, "Also register the signed entry as a member");

		bool check_signatures{false};
		auto verify_chain_cmd = app.add_subcommand("verify-chain", "Recompute every chain hash and link");
		verify_chain_cmd->add_flag("--signatures", check_signatures, "Also verify every chain signature");

		std::string verify_fp;
		auto verify_identity_cmd = app.add_subcommand("verify-identity", "Verify a registered identity");
		verify_identity_cmd->add_option("--fingerprint", verify_fp, "Identity fingerprint")->required();

		std::string member_path;
		auto register_cmd = app.add_subcommand("register-member", "Register an identity-signed entry");
		register_cmd->add_option("--file", member_path, "Registration entry JSON")->required();

		auto list_cmd = app.add_subcommand("list-members", "List registered members with verification status");

		std::string proposal_path;
		std::string proposal_fp;
		auto proposal_cmd = app.add_subcommand("submit-proposal", "Submit a governance proposal");
		proposal_cmd->add_option("--file", proposal_path, "Proposal JSON")->required();
		proposal_cmd->add_option("--fingerprint", proposal_fp, "Submitter fingerprint (overrides the file)");

		CLI11_PARSE(app, argc, argv);

		auto cfg = load_config(config_path);
		if (!cfg)
		{
			return fail(cfg.error());
		}

		if (*cfg_cmd)
		{
			std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
			return kOk;
		}

		if (*keygen_cmd)
		{
			auto identity = crypto::IdentityKey::generate();
			if (!identity)
			{
				return fail(identity.error());
			}

			Result<void> saved;
			if (key_encrypt)
			{
				auto key = crypto::KeyManager::get_encryption_key();
				if (!key)
				{
					return fail(key.error());
				}
				saved = identity->save_encrypted(key_out, *key, key_purpose);
			}
			else
			{
				saved = identity->save_to_file(key_out, key_purpose);
			}
			if (!saved)
			{
				return fail(saved.error());
			}
			std::cout << identity->fingerprint() << std::endl;
			return kOk;
		}

		auto ctx = GovernanceContext::open(*cfg);
		if (!ctx)
		{
			return fail(ctx.error());
		}
		auto &context = **ctx;

		if (*append_cmd)
		{
			nlohmann::json payload = nlohmann::json::object();
			if (!payload_path.empty())
			{
				auto loaded = read_json(payload_path);
				if (!loaded)
				{
					return fail(loaded.error());
				}
				payload = std::move(*loaded);
			}
			else if (!payload_text.empty())
			{
				try
				{
					payload = nlohmann::json::parse(payload_text);
				}
				catch (const nlohmann::json::exception &e)
				{
					return fail(AttestError(ErrorCode::ParsingError, std::string("--payload: ") + e.what()));
				}
			}

			auto entry = context.ledger().append(payload, proof_name);
			if (!entry)
			{
				return fail(entry.error());
			}
			std::cout << entry->to_json().dump(2) << std::endl;
			return kOk;
		}

		if (*attach_cmd)
		{
			auto identity = context.external_identity();
			if (!identity)
			{
				return fail(identity.error());
			}

			RegistrationEntry target;
			target.chain_hash = attach_hash;
			auto signed_entry = context.ledger().attach_identity_signature(target, *identity);
			if (!signed_entry)
			{
				return fail(signed_entry.error());
			}

			if (attach_register)
			{
				if (auto registered = context.verifier().register_member(*signed_entry); !registered)
				{
					return fail(registered.error());
				}
			}
			std::cout << signed_entry->to_json().dump(2) << std::endl;
			return kOk;
		}

		if (*verify_chain_cmd)
		{
			auto report = context.ledger().verify_chain();
			if (!report)
			{
				return fail(report.error());
			}
			if (!report->intact())
			{
				std::cerr << report->first_break->describe() << std::endl;
				return kRejected;
			}

			if (check_signatures)
			{
				auto entries = context.ledger().load();
				if (!entries)
				{
					return fail(entries.error());
				}
				for (std::size_t i = 0; i < entries->size(); ++i)
				{
					auto outcome = context.ledger().verify_chain_signature((*entries)[i]);
					if (!outcome)
					{
						std::cerr << "Chain signature invalid at index " << i << ": " << outcome.reason << std::endl;
						return kRejected;
					}
				}
			}

			std::cout << "Chain intact: " << report->entries_checked << " entries, tip "
					  << context.ledger().tip() << std::endl;
			return kOk;
		}

		if (*verify_identity_cmd)
		{
			auto outcome = context.verifier().verify(verify_fp);
			if (!outcome)
			{
				std::cerr << "Identity " << verify_fp << " not verified: " << outcome.reason << std::endl;
				return kRejected;
			}
			std::cout << "Identity " << verify_fp << " verified" << std::endl;
			return kOk;
		}

		if (*register_cmd)
		{
			auto j = read_json(member_path);
			if (!j)
			{
				return fail(j.error());
			}
			auto entry = RegistrationEntry::from_json(*j);
			if (!entry)
			{
				return fail(entry.error());
			}

			auto outcome = context.verifier().verify_entry(entry->identity_fingerprint.value_or(""), *entry);
			if (!outcome)
			{
				std::cerr << "Registration rejected: " << outcome.reason << std::endl;
				return kRejected;
			}
			if (auto registered = context.verifier().register_member(*entry); !registered)
			{
				return fail(registered.error());
			}
			std::cout << "Registered " << *entry->identity_fingerprint << std::endl;
			return kOk;
		}

		if (*list_cmd)
		{
			auto members = context.verifier().list_members();
			if (!members)
			{
				return fail(members.error());
			}
			nlohmann::json out = nlohmann::json::array();
			for (const auto &member : *members)
			{
				out.push_back(member.to_json());
			}
			std::cout << out.dump(2) << std::endl;
			return kOk;
		}

		if (*proposal_cmd)
		{
			auto j = read_json(proposal_path);
			if (!j)
			{
				return fail(j.error());
			}
			if (!proposal_fp.empty() && j->is_object())
			{
				(*j)["submitter"] = proposal_fp;
			}
			auto proposal = Proposal::from_json(*j);
			if (!proposal)
			{
				return fail(proposal.error());
			}

			auto record = context.proposals().submit(*proposal);
			if (!record)
			{
				return fail(record.error());
			}
			std::cout << record->to_json().dump(2) << std::endl;
			return kOk;
		}

		std::cout << app.help() << std::endl;
		return kOk;
	}

} // namespace attest::cli
