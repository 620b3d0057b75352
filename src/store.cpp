#include "attest/store.hpp"
#include "attest/chain_link.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>

namespace attest
{

    using Json = nlohmann::json;
    namespace fs = std::filesystem;

    namespace
    {
        Result<std::optional<Json>> read_json(const fs::path &path)
        {
            std::error_code ec;
            if (!fs::exists(path, ec))
            {
                if (ec)
                {
                    return std::unexpected(AttestError::storage(
                        fmt::format("Cannot stat {}: {}", path.string(), ec.message())));
                }
                return std::optional<Json>{};
            }

            std::ifstream file(path);
            if (!file)
            {
                return std::unexpected(AttestError::storage(
                    fmt::format("Failed to open {}", path.string())));
            }

            try
            {
                Json j;
                file >> j;
                return std::optional<Json>{std::move(j)};
            }
            catch (const Json::exception &e)
            {
                return std::unexpected(AttestError(ErrorCode::ParsingError,
                                                   fmt::format("Invalid JSON in {}: {}", path.string(), e.what())));
            }
        }

        fs::path temp_sibling(const fs::path &path)
        {
            auto suffix = crypto::Hex::encode(crypto::SecureRandom::generate_bytes(8));
            return path.parent_path() / fmt::format(".{}.{}.tmp", path.filename().string(), suffix);
        }

        Result<fs::path> write_temp(const fs::path &path, const Json &j)
        {
            std::error_code ec;
            if (path.has_parent_path())
            {
                fs::create_directories(path.parent_path(), ec);
                if (ec)
                {
                    return std::unexpected(AttestError::storage(
                        fmt::format("Failed to create {}: {}", path.parent_path().string(), ec.message())));
                }
            }

            auto tmp = temp_sibling(path);
            {
                std::ofstream file(tmp, std::ios::trunc);
                if (!file)
                {
                    return std::unexpected(AttestError::storage(
                        fmt::format("Failed to open {} for writing", tmp.string())));
                }
                file << j.dump(2) << '\n';
                file.flush();
                if (!file)
                {
                    file.close();
                    fs::remove(tmp, ec);
                    return std::unexpected(AttestError::storage(
                        fmt::format("Failed to write {}", tmp.string())));
                }
            }
            return tmp;
        }

        // Readers observe either the previous or the new file, never a partial one
        Result<void> write_json_atomic(const fs::path &path, const Json &j)
        {
            auto tmp = write_temp(path, j);
            if (!tmp)
            {
                return std::unexpected(tmp.error());
            }

            std::error_code ec;
            fs::rename(*tmp, path, ec);
            if (ec)
            {
                std::error_code ignored;
                fs::remove(*tmp, ignored);
                return std::unexpected(AttestError::storage(
                    fmt::format("Failed to replace {}: {}", path.string(), ec.message())));
            }
            return {};
        }

        // Fails with AlreadyExists instead of overwriting
        Result<void> write_json_exclusive(const fs::path &path, const Json &j)
        {
            auto tmp = write_temp(path, j);
            if (!tmp)
            {
                return std::unexpected(tmp.error());
            }

            std::error_code ec;
            fs::create_hard_link(*tmp, path, ec);
            std::error_code ignored;
            fs::remove(*tmp, ignored);
            if (ec == std::errc::file_exists)
            {
                return std::unexpected(AttestError::already_exists(
                    fmt::format("{} already exists", path.string())));
            }
            if (ec)
            {
                return std::unexpected(AttestError::storage(
                    fmt::format("Failed to create {}: {}", path.string(), ec.message())));
            }
            return {};
        }

        Result<void> check_key(const std::string &key, const char *what)
        {
            if (!is_valid_store_key(key))
            {
                return std::unexpected(AttestError::invalid_input(
                    fmt::format("Invalid {} '{}'", what, key)));
            }
            return {};
        }

        /**
         * Keys of files named <prefix><key>.json in dir, sorted
         */
        Result<std::vector<std::string>> list_keys(const fs::path &dir, const std::string &prefix)
        {
            std::vector<std::string> keys;
            std::error_code ec;
            if (!fs::is_directory(dir, ec))
            {
                return keys;
            }

            fs::directory_iterator it(dir, ec);
            if (ec)
            {
                return std::unexpected(AttestError::storage(
                    fmt::format("Failed to list {}: {}", dir.string(), ec.message())));
            }

            const std::string suffix = ".json";
            for (const auto &file : it)
            {
                auto name = file.path().filename().string();
                if (name.size() <= prefix.size() + suffix.size() ||
                    !name.starts_with(prefix) || !name.ends_with(suffix))
                {
                    continue;
                }
                auto key = name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
                if (is_valid_store_key(key))
                {
                    keys.push_back(std::move(key));
                }
            }
            std::sort(keys.begin(), keys.end());
            return keys;
        }
    } // namespace

    bool is_valid_store_key(const std::string &key)
    {
        if (key.empty() || key.size() > 128)
        {
            return false;
        }
        return std::all_of(key.begin(), key.end(), [](char c)
                           { return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                                    (c >= '0' && c <= '9') || c == '_' || c == '-'; });
    }

    // ========== FileLedgerStore ==========

    FileLedgerStore::FileLedgerStore(fs::path path)
        : path_(std::move(path))
    {
    }

    Result<std::vector<RegistrationEntry>> FileLedgerStore::read_locked() const
    {
        auto doc = read_json(path_);
        if (!doc)
        {
            return std::unexpected(doc.error());
        }

        std::vector<RegistrationEntry> entries;
        if (!doc->has_value())
        {
            return entries;
        }
        if (!(*doc)->is_array())
        {
            return std::unexpected(AttestError(ErrorCode::ParsingError,
                                               fmt::format("Ledger file {} is not a JSON array", path_.string())));
        }

        entries.reserve((*doc)->size());
        for (const auto &item : **doc)
        {
            auto entry = RegistrationEntry::from_json(item);
            if (!entry)
            {
                return std::unexpected(AttestError(ErrorCode::ParsingError,
                                                   fmt::format("Ledger entry {} is malformed: {}", entries.size(), entry.error().what())));
            }
            entries.push_back(std::move(*entry));
        }
        return entries;
    }

    Result<void> FileLedgerStore::write_locked(const std::vector<RegistrationEntry> &entries) const
    {
        Json doc = Json::array();
        for (const auto &entry : entries)
        {
            doc.push_back(entry.to_json());
        }
        return write_json_atomic(path_, doc);
    }

    Result<std::vector<RegistrationEntry>> FileLedgerStore::load_all()
    {
        std::lock_guard lock(mutex_);
        return read_locked();
    }

    Result<void> FileLedgerStore::append(const RegistrationEntry &entry)
    {
        if (!entry.chain_hash)
        {
            return std::unexpected(AttestError::invalid_input("Cannot store an entry without chain_hash"));
        }

        std::lock_guard lock(mutex_);
        auto entries = read_locked();
        if (!entries)
        {
            return std::unexpected(entries.error());
        }

        const std::string stored_tip = entries->empty()
                                           ? ChainLink::genesis()
                                           : entries->back().chain_hash.value_or("");
        if (entry.prev_chain_hash != stored_tip)
        {
            return std::unexpected(AttestError::chain_integrity(
                fmt::format("Stale tip: entry links to {} but stored tip is {}", entry.prev_chain_hash, stored_tip)));
        }

        entries->push_back(entry);
        return write_locked(*entries);
    }

    Result<void> FileLedgerStore::replace(const RegistrationEntry &entry)
    {
        if (!entry.chain_hash)
        {
            return std::unexpected(AttestError::invalid_input("Cannot replace an entry without chain_hash"));
        }

        std::lock_guard lock(mutex_);
        auto entries = read_locked();
        if (!entries)
        {
            return std::unexpected(entries.error());
        }

        auto it = std::find_if(entries->begin(), entries->end(), [&](const RegistrationEntry &stored)
                               { return stored.chain_hash == entry.chain_hash; });
        if (it == entries->end())
        {
            return std::unexpected(AttestError::not_found(
                fmt::format("No ledger entry with chain_hash {}", *entry.chain_hash)));
        }

        *it = entry;
        return write_locked(*entries);
    }

    // ========== DirectoryRegistrationStore ==========

    DirectoryRegistrationStore::DirectoryRegistrationStore(fs::path dir)
        : dir_(std::move(dir))
    {
    }

    Result<std::optional<RegistrationEntry>> DirectoryRegistrationStore::get(const std::string &fingerprint)
    {
        if (auto ok = check_key(fingerprint, "fingerprint"); !ok)
        {
            return std::unexpected(ok.error());
        }

        auto doc = read_json(dir_ / fmt::format("reg_{}.json", fingerprint));
        if (!doc)
        {
            return std::unexpected(doc.error());
        }
        if (!doc->has_value())
        {
            return std::optional<RegistrationEntry>{};
        }

        auto entry = RegistrationEntry::from_json(**doc);
        if (!entry)
        {
            return std::unexpected(entry.error());
        }
        return std::optional<RegistrationEntry>{std::move(*entry)};
    }

    Result<void> DirectoryRegistrationStore::put(const RegistrationEntry &entry)
    {
        if (!entry.identity_fingerprint)
        {
            return std::unexpected(AttestError::invalid_input("Registration record has no identity_fingerprint"));
        }
        if (auto ok = check_key(*entry.identity_fingerprint, "fingerprint"); !ok)
        {
            return std::unexpected(ok.error());
        }

        return write_json_atomic(dir_ / fmt::format("reg_{}.json", *entry.identity_fingerprint), entry.to_json());
    }

    Result<std::vector<std::string>> DirectoryRegistrationStore::list()
    {
        return list_keys(dir_, "reg_");
    }

    // ========== DirectoryProposalStore ==========

    DirectoryProposalStore::DirectoryProposalStore(fs::path dir)
        : dir_(std::move(dir))
    {
    }

    Result<std::optional<ProposalRecord>> DirectoryProposalStore::get(const std::string &proposal_id)
    {
        if (auto ok = check_key(proposal_id, "proposal id"); !ok)
        {
            return std::unexpected(ok.error());
        }

        auto doc = read_json(dir_ / fmt::format("proposal_{}.json", proposal_id));
        if (!doc)
        {
            return std::unexpected(doc.error());
        }
        if (!doc->has_value())
        {
            return std::optional<ProposalRecord>{};
        }

        auto record = ProposalRecord::from_json(**doc);
        if (!record)
        {
            return std::unexpected(record.error());
        }
        return std::optional<ProposalRecord>{std::move(*record)};
    }

    Result<void> DirectoryProposalStore::put(const ProposalRecord &record)
    {
        if (auto ok = check_key(record.proposal_id, "proposal id"); !ok)
        {
            return std::unexpected(ok.error());
        }

        std::lock_guard lock(mutex_);
        return write_json_exclusive(dir_ / fmt::format("proposal_{}.json", record.proposal_id), record.to_json());
    }

    Result<std::vector<ProposalRecord>> DirectoryProposalStore::list()
    {
        auto ids = list_keys(dir_, "proposal_");
        if (!ids)
        {
            return std::unexpected(ids.error());
        }

        std::vector<ProposalRecord> records;
        for (const auto &id : *ids)
        {
            auto record = get(id);
            if (!record)
            {
                spdlog::warn("Skipping unreadable proposal {}: {}", id, record.error().what());
                continue;
            }
            if (record->has_value())
            {
                records.push_back(std::move(**record));
            }
        }
        return records;
    }

} // namespace attest
