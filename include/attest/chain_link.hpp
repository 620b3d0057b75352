#pragma once

#include "crypto.hpp"
#include <string>

namespace attest
{

    /**
     * Hash link binding an entry to its predecessor.
     *
     * link = lowercase hex SHA-256(prev_hash bytes || canonical bytes)
     */
    class ChainLink
    {
    public:
        /// Stands in for the predecessor of the first entry. Never a digest output.
        static const std::string &genesis();

        static std::string compute(const std::string &prev_hash, const crypto::Bytes &canonical_bytes);

        /**
         * True for a 64 character lowercase hex string
         */
        static bool is_digest(const std::string &value);
    };

} // namespace attest
