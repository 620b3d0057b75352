#pragma once

#include <expected>
#include <string>
#include <stdexcept>

namespace attest
{

    /**
     * Error categories for ledger operations
     */
    enum class ErrorCode
    {
        CanonicalizationError,
        SigningBackendError,
        ChainIntegrityError,
        PermissionDenied,
        CryptoError,
        StorageError,
        ConfigError,
        NotFound,
        AlreadyExists,
        InvalidInput,
        IOError,
        ParsingError
    };

    /**
     * Convert ErrorCode to its stable name (used in logs and audit events)
     */
    inline std::string error_code_to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::CanonicalizationError:
            return "CanonicalizationError";
        case ErrorCode::SigningBackendError:
            return "SigningBackendError";
        case ErrorCode::ChainIntegrityError:
            return "ChainIntegrityError";
        case ErrorCode::PermissionDenied:
            return "PermissionDenied";
        case ErrorCode::CryptoError:
            return "CryptoError";
        case ErrorCode::StorageError:
            return "StorageError";
        case ErrorCode::ConfigError:
            return "ConfigError";
        case ErrorCode::NotFound:
            return "NotFound";
        case ErrorCode::AlreadyExists:
            return "AlreadyExists";
        case ErrorCode::InvalidInput:
            return "InvalidInput";
        case ErrorCode::IOError:
            return "IOError";
        case ErrorCode::ParsingError:
            return "ParsingError";
        }
        return "Unknown";
    }

    /**
     * Attest error with code and message
     */
    class AttestError : public std::runtime_error
    {
    public:
        ErrorCode code;

        AttestError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static AttestError canonicalization(const std::string &msg)
        {
            return AttestError(ErrorCode::CanonicalizationError, msg);
        }

        static AttestError signing_backend(const std::string &msg)
        {
            return AttestError(ErrorCode::SigningBackendError, msg);
        }

        static AttestError chain_integrity(const std::string &msg)
        {
            return AttestError(ErrorCode::ChainIntegrityError, msg);
        }

        static AttestError permission_denied(const std::string &msg)
        {
            return AttestError(ErrorCode::PermissionDenied, msg);
        }

        static AttestError crypto(const std::string &msg)
        {
            return AttestError(ErrorCode::CryptoError, msg);
        }

        static AttestError storage(const std::string &msg)
        {
            return AttestError(ErrorCode::StorageError, msg);
        }

        static AttestError config(const std::string &msg)
        {
            return AttestError(ErrorCode::ConfigError, msg);
        }

        static AttestError not_found(const std::string &msg)
        {
            return AttestError(ErrorCode::NotFound, msg);
        }

        static AttestError already_exists(const std::string &msg)
        {
            return AttestError(ErrorCode::AlreadyExists, msg);
        }

        static AttestError invalid_input(const std::string &msg)
        {
            return AttestError(ErrorCode::InvalidInput, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, AttestError>;

    /**
     * Outcome of a signature or identity check.
     * Verification failure is an expected result, never an error value.
     */
    struct Verification
    {
        bool ok{false};
        std::string reason;

        static Verification success(std::string reason = "verified")
        {
            return Verification{true, std::move(reason)};
        }

        static Verification failure(std::string reason)
        {
            return Verification{false, std::move(reason)};
        }

        explicit operator bool() const { return ok; }
    };

} // namespace attest
