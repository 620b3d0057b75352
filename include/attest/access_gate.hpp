#pragma once

#include "types.hpp"
#include "audit.hpp"
#include "identity_verifier.hpp"
#include <fmt/format.h>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace attest
{

    namespace detail
    {
        template <typename T>
        struct is_result : std::false_type
        {
        };

        template <typename T>
        struct is_result<std::expected<T, AttestError>> : std::true_type
        {
        };

        /// Result<T> stays Result<T>; any other T becomes Result<T>
        template <typename R>
        using gated_t = std::conditional_t<is_result<R>::value, R, Result<R>>;
    } // namespace detail

    /**
     * Conditions execution of an operation on a verified identity.
     *
     * On denial the operation is never invoked and PermissionDenied is
     * returned; on success it runs exactly once and its value is returned.
     */
    class AccessGate
    {
    public:
        explicit AccessGate(IdentityVerifier &verifier, std::shared_ptr<AuditLogger> audit = nullptr)
            : verifier_(verifier), audit_(std::move(audit))
        {
        }

        /**
         * Verify fingerprint, PermissionDenied on failure
         */
        Result<void> check(const std::string &fingerprint) const
        {
            auto outcome = verifier_.verify(fingerprint);
            if (!outcome.ok)
            {
                if (audit_)
                {
                    audit_->record(fingerprint, "gate.deny", fingerprint, "denied", {{"reason", outcome.reason}});
                }
                return std::unexpected(AttestError::permission_denied(
                    fmt::format("Identity {} not verified - operation denied ({})", fingerprint, outcome.reason)));
            }
            return {};
        }

        /**
         * Verify, then invoke operation(args...)
         */
        template <typename Fn, typename... Args>
        auto run(const std::string &fingerprint, Fn &&operation, Args &&...args) const
            -> detail::gated_t<std::invoke_result_t<Fn, Args...>>
        {
            using R = std::invoke_result_t<Fn, Args...>;

            if (auto allowed = check(fingerprint); !allowed)
            {
                return std::unexpected(allowed.error());
            }

            if constexpr (std::is_void_v<R>)
            {
                std::invoke(std::forward<Fn>(operation), std::forward<Args>(args)...);
                return {};
            }
            else if constexpr (detail::is_result<R>::value)
            {
                return std::invoke(std::forward<Fn>(operation), std::forward<Args>(args)...);
            }
            else
            {
                return Result<R>(std::invoke(std::forward<Fn>(operation), std::forward<Args>(args)...));
            }
        }

        /**
         * Wrap operation so that every call goes through run(fingerprint, ...).
         * The gate must outlive the returned callable.
         */
        template <typename Fn>
        auto guard(std::string fingerprint, Fn operation) const
        {
            return [this, fingerprint = std::move(fingerprint), operation = std::move(operation)](auto &&...args) mutable
            {
                return run(fingerprint, operation, std::forward<decltype(args)>(args)...);
            };
        }

    private:
        IdentityVerifier &verifier_;
        std::shared_ptr<AuditLogger> audit_;
    };

} // namespace attest
