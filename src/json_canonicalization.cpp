#include "attest/json_canonicalization.hpp"
#include <fmt/format.h>
#include <cmath>
#include <map>

namespace attest::json
{

    Result<std::string> RFC8785Canonicalizer::canonicalize(const nlohmann::json &value)
    {
        std::string output;
        if (auto res = serialize_value(value, output, 0); !res)
        {
            return std::unexpected(res.error());
        }
        return output;
    }

    Result<std::string> RFC8785Canonicalizer::canonicalize_string(const std::string &json_str)
    {
        try
        {
            auto parsed = nlohmann::json::parse(json_str);
            return canonicalize(parsed);
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(AttestError::invalid_input(
                fmt::format("JSON parse error: {}", e.what())));
        }
    }

    Result<void> RFC8785Canonicalizer::serialize_value(const nlohmann::json &value, std::string &output, std::size_t depth)
    {
        if (depth > kMaxDepth)
        {
            return std::unexpected(AttestError::canonicalization(
                fmt::format("Nesting deeper than {} levels", kMaxDepth)));
        }

        switch (value.type())
        {
        case nlohmann::json::value_t::null:
            output += "null";
            return {};

        case nlohmann::json::value_t::boolean:
            output += value.get<bool>() ? "true" : "false";
            return {};

        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float:
            return serialize_number(value, output);

        case nlohmann::json::value_t::string:
            return serialize_string(value.get_ref<const std::string &>(), output);

        case nlohmann::json::value_t::array:
            return serialize_array(value, output, depth);

        case nlohmann::json::value_t::object:
            return serialize_object(value, output, depth);

        case nlohmann::json::value_t::binary:
        case nlohmann::json::value_t::discarded:
            break;
        }

        return std::unexpected(AttestError::canonicalization(
            fmt::format("Value of type '{}' has no canonical JSON form", value.type_name())));
    }

    Result<void> RFC8785Canonicalizer::serialize_string(const std::string &str, std::string &output)
    {
        if (!is_valid_utf8(str))
        {
            return std::unexpected(AttestError::canonicalization("String is not valid UTF-8"));
        }

        output += '"';
        for (unsigned char ch : str)
        {
            // Must escape: " (0x22), \ (0x5C), and control characters (0x00-0x1F)
            switch (ch)
            {
            case '"':
                output += "\\\"";
                break;
            case '\\':
                output += "\\\\";
                break;
            case '\b':
                output += "\\b";
                break;
            case '\f':
                output += "\\f";
                break;
            case '\n':
                output += "\\n";
                break;
            case '\r':
                output += "\\r";
                break;
            case '\t':
                output += "\\t";
                break;
            default:
                if (ch < 0x20)
                {
                    output += fmt::format("\\u{:04x}", static_cast<int>(ch));
                }
                else
                {
                    output += static_cast<char>(ch);
                }
                break;
            }
        }
        output += '"';
        return {};
    }

    Result<void> RFC8785Canonicalizer::serialize_number(const nlohmann::json &num, std::string &output)
    {
        if (num.is_number_unsigned())
        {
            output += std::to_string(num.get<uint64_t>());
            return {};
        }
        if (num.is_number_integer())
        {
            output += std::to_string(num.get<int64_t>());
            return {};
        }

        double value = num.get<double>();
        if (std::isnan(value) || std::isinf(value))
        {
            return std::unexpected(AttestError::canonicalization("NaN and Infinity cannot be canonicalized"));
        }

        if (value == 0.0)
        {
            // -0 and 0 serialize identically
            output += "0";
        }
        else if (value == std::floor(value) && std::abs(value) < 9007199254740992.0)
        {
            output += fmt::format("{:.0f}", value);
        }
        else
        {
            // Shortest representation that round-trips; independent of locale
            output += fmt::format("{}", value);
        }
        return {};
    }

    Result<void> RFC8785Canonicalizer::serialize_object(const nlohmann::json &obj, std::string &output, std::size_t depth)
    {
        output += '{';

        // Sort keys lexicographically (UTF-8 byte order)
        std::map<std::string, const nlohmann::json *> sorted_items;
        for (auto it = obj.begin(); it != obj.end(); ++it)
        {
            sorted_items.emplace(it.key(), &it.value());
        }

        bool first = true;
        for (const auto &[key, value] : sorted_items)
        {
            if (!first)
            {
                output += ',';
            }
            first = false;

            if (auto res = serialize_string(key, output); !res)
                return res;
            output += ':';
            if (auto res = serialize_value(*value, output, depth + 1); !res)
                return res;
        }

        output += '}';
        return {};
    }

    Result<void> RFC8785Canonicalizer::serialize_array(const nlohmann::json &arr, std::string &output, std::size_t depth)
    {
        output += '[';

        bool first = true;
        for (const auto &item : arr)
        {
            if (!first)
            {
                output += ',';
            }
            first = false;
            if (auto res = serialize_value(item, output, depth + 1); !res)
                return res;
        }

        output += ']';
        return {};
    }

    bool RFC8785Canonicalizer::is_valid_utf8(const std::string &str)
    {
        std::size_t i = 0;
        const std::size_t n = str.size();
        while (i < n)
        {
            auto c = static_cast<unsigned char>(str[i]);
            std::size_t len = 0;
            uint32_t cp = 0;
            if (c < 0x80)
            {
                ++i;
                continue;
            }
            else if ((c & 0xE0) == 0xC0)
            {
                len = 2;
                cp = c & 0x1F;
            }
            else if ((c & 0xF0) == 0xE0)
            {
                len = 3;
                cp = c & 0x0F;
            }
            else if ((c & 0xF8) == 0xF0)
            {
                len = 4;
                cp = c & 0x07;
            }
            else
            {
                return false;
            }

            if (i + len > n)
                return false;
            for (std::size_t k = 1; k < len; ++k)
            {
                auto cc = static_cast<unsigned char>(str[i + k]);
                if ((cc & 0xC0) != 0x80)
                    return false;
                cp = (cp << 6) | (cc & 0x3F);
            }

            // Overlong forms, surrogates and out-of-range code points
            if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
                return false;
            if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
                return false;

            i += len;
        }
        return true;
    }

    // ========== CanonicalCodec ==========

    Result<std::string> CanonicalCodec::encode_string(const nlohmann::json &record, const FieldSet &exclude)
    {
        if (exclude.empty())
        {
            return RFC8785Canonicalizer::canonicalize(record);
        }

        if (!record.is_object())
        {
            return std::unexpected(AttestError::canonicalization(
                fmt::format("Field exclusion requires an object, got '{}'", record.type_name())));
        }

        nlohmann::json filtered = nlohmann::json::object();
        for (auto it = record.begin(); it != record.end(); ++it)
        {
            if (!exclude.contains(it.key()))
            {
                filtered[it.key()] = it.value();
            }
        }
        return RFC8785Canonicalizer::canonicalize(filtered);
    }

    Result<crypto::Bytes> CanonicalCodec::encode(const nlohmann::json &record, const FieldSet &exclude)
    {
        auto canonical = encode_string(record, exclude);
        if (!canonical)
        {
            return std::unexpected(canonical.error());
        }
        return crypto::Bytes(canonical->begin(), canonical->end());
    }

} // namespace attest::json
