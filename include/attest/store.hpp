#pragma once

#include "types.hpp"
#include "registration_entry.hpp"
#include "proposal.hpp"
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace attest
{

    /**
     * True if key may be used as a file-backed store key: [A-Za-z0-9_-]{1,128}
     */
    bool is_valid_store_key(const std::string &key);

    /**
     * Ordered, append-only storage of ledger entries.
     */
    class LedgerStore
    {
    public:
        virtual ~LedgerStore() = default;

        /**
         * All entries in append order
         */
        virtual Result<std::vector<RegistrationEntry>> load_all() = 0;

        /**
         * Append a chained entry.
         * Compare-and-swap on the stored tip: entry.prev_chain_hash must equal
         * the last stored chain_hash (or the genesis sentinel when empty),
         * otherwise ChainIntegrityError and nothing is written.
         */
        virtual Result<void> append(const RegistrationEntry &entry) = 0;

        /**
         * Replace the stored entry carrying the same chain_hash
         */
        virtual Result<void> replace(const RegistrationEntry &entry) = 0;
    };

    /**
     * Registration records addressed by identity fingerprint.
     */
    class RegistrationStore
    {
    public:
        virtual ~RegistrationStore() = default;

        virtual Result<std::optional<RegistrationEntry>> get(const std::string &fingerprint) = 0;

        /**
         * Store (or overwrite) the record for entry.identity_fingerprint
         */
        virtual Result<void> put(const RegistrationEntry &entry) = 0;

        /**
         * Fingerprints of all stored records, sorted
         */
        virtual Result<std::vector<std::string>> list() = 0;
    };

    /**
     * Write-once proposal records addressed by proposal id.
     */
    class ProposalStore
    {
    public:
        virtual ~ProposalStore() = default;

        virtual Result<std::optional<ProposalRecord>> get(const std::string &proposal_id) = 0;

        /**
         * AlreadyExists if a record with the same id is stored
         */
        virtual Result<void> put(const ProposalRecord &record) = 0;

        virtual Result<std::vector<ProposalRecord>> list() = 0;
    };

    /**
     * Ledger as a single JSON array file, rewritten atomically on every change.
     */
    class FileLedgerStore : public LedgerStore
    {
    public:
        explicit FileLedgerStore(std::filesystem::path path);

        Result<std::vector<RegistrationEntry>> load_all() override;
        Result<void> append(const RegistrationEntry &entry) override;
        Result<void> replace(const RegistrationEntry &entry) override;

        const std::filesystem::path &path() const { return path_; }

    private:
        Result<std::vector<RegistrationEntry>> read_locked() const;
        Result<void> write_locked(const std::vector<RegistrationEntry> &entries) const;

        std::filesystem::path path_;
        mutable std::mutex mutex_;
    };

    /**
     * One reg_<fingerprint>.json file per member in a directory
     */
    class DirectoryRegistrationStore : public RegistrationStore
    {
    public:
        explicit DirectoryRegistrationStore(std::filesystem::path dir);

        Result<std::optional<RegistrationEntry>> get(const std::string &fingerprint) override;
        Result<void> put(const RegistrationEntry &entry) override;
        Result<std::vector<std::string>> list() override;

    private:
        std::filesystem::path dir_;
    };

    /**
     * One proposal_<id>.json file per proposal in a directory
     */
    class DirectoryProposalStore : public ProposalStore
    {
    public:
        explicit DirectoryProposalStore(std::filesystem::path dir);

        Result<std::optional<ProposalRecord>> get(const std::string &proposal_id) override;
        Result<void> put(const ProposalRecord &record) override;
        Result<std::vector<ProposalRecord>> list() override;

    private:
        std::filesystem::path dir_;
        std::mutex mutex_;
    };

} // namespace attest
