#include "attest/chain_link.hpp"

namespace attest
{

    const std::string &ChainLink::genesis()
    {
        static const std::string sentinel = "genesis_public_" + std::string(64, '0');
        return sentinel;
    }

    std::string ChainLink::compute(const std::string &prev_hash, const crypto::Bytes &canonical_bytes)
    {
        crypto::Bytes material;
        material.reserve(prev_hash.size() + canonical_bytes.size());
        material.insert(material.end(), prev_hash.begin(), prev_hash.end());
        material.insert(material.end(), canonical_bytes.begin(), canonical_bytes.end());
        return crypto::SHA256::to_hex(crypto::SHA256::hash(material));
    }

    bool ChainLink::is_digest(const std::string &value)
    {
        if (value.size() != 64)
        {
            return false;
        }
        for (char c : value)
        {
            bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
            if (!hex)
            {
                return false;
            }
        }
        return true;
    }

} // namespace attest
