#pragma once

#include "types.hpp"
#include "crypto.hpp"
#include <nlohmann/json.hpp>
#include <set>
#include <string>

namespace attest::json
{

    /**
     * RFC 8785 style JSON Canonicalization
     *
     * Deterministic JSON serialization used as the exact byte input of every
     * hash and signature in the ledger. Any divergence between the bytes
     * produced at signing time and at verification time makes an untampered
     * record fail verification.
     *
     * Key requirements:
     * - Lexicographic key sorting (UTF-8 byte order), recursively
     * - No insignificant whitespace
     * - Minimal escaping (quote, backslash, control characters)
     * - Integers in plain decimal, other numbers in shortest round-trip form
     * - Rejection of NaN/Infinity, invalid UTF-8 and non-JSON values
     */
    class RFC8785Canonicalizer
    {
    public:
        /// Maximum nesting depth accepted before the value is rejected
        static constexpr std::size_t kMaxDepth = 256;

        /**
         * Canonicalize a JSON value
         * @param value JSON value to canonicalize
         * @return Canonical JSON string or CanonicalizationError
         */
        static Result<std::string> canonicalize(const nlohmann::json &value);

        /**
         * Parse JSON string and canonicalize
         */
        static Result<std::string> canonicalize_string(const std::string &json_str);

    private:
        static Result<void> serialize_value(const nlohmann::json &value, std::string &output, std::size_t depth);

        static Result<void> serialize_string(const std::string &str, std::string &output);

        static Result<void> serialize_number(const nlohmann::json &num, std::string &output);

        static Result<void> serialize_object(const nlohmann::json &obj, std::string &output, std::size_t depth);

        static Result<void> serialize_array(const nlohmann::json &arr, std::string &output, std::size_t depth);

        static bool is_valid_utf8(const std::string &str);
    };

    /**
     * Canonical bytes of a record with a set of top-level fields removed.
     */
    class CanonicalCodec
    {
    public:
        using FieldSet = std::set<std::string>;

        /**
         * Encode a record to canonical bytes.
         * A non-empty exclusion set requires the record to be an object.
         */
        static Result<crypto::Bytes> encode(const nlohmann::json &record, const FieldSet &exclude = {});

        /**
         * Same as encode, returned as a string
         */
        static Result<std::string> encode_string(const nlohmann::json &record, const FieldSet &exclude = {});
    };

} // namespace attest::json
