#include "attest/signing_identity.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <functional>
#include <future>
#include <system_error>
#include <thread>

namespace attest
{

    namespace
    {
        /**
         * Run a backend call, giving up after timeout.
         * The worker is detached on timeout; it only holds copies of its inputs
         * and the pending counter, which it releases when the call returns.
         */
        template <typename R>
        R bounded_call(std::function<R()> call,
                       std::chrono::milliseconds timeout,
                       const std::shared_ptr<std::atomic<std::size_t>> &pending,
                       const char *what)
        {
            try
            {
                if (timeout.count() <= 0)
                {
                    return call();
                }

                if (pending->fetch_add(1) >= SigningIdentity::kMaxPendingCalls)
                {
                    pending->fetch_sub(1);
                    return std::unexpected(AttestError::signing_backend(fmt::format(
                        "Signing backend {} refused: {} calls still in flight",
                        what, SigningIdentity::kMaxPendingCalls)));
                }

                std::packaged_task<R()> task(std::move(call));
                auto result = task.get_future();
                try
                {
                    std::thread([task = std::move(task), pending]() mutable
                                {
                                    task();
                                    pending->fetch_sub(1);
                                })
                        .detach();
                }
                catch (const std::system_error &)
                {
                    pending->fetch_sub(1);
                    throw;
                }

                if (result.wait_for(timeout) == std::future_status::timeout)
                {
                    spdlog::warn("Signing backend {} timed out after {} ms", what, timeout.count());
                    return std::unexpected(AttestError::signing_backend(
                        fmt::format("Signing backend {} timed out after {} ms", what, timeout.count())));
                }
                return result.get();
            }
            catch (const std::exception &e)
            {
                return std::unexpected(AttestError::signing_backend(
                    fmt::format("Signing backend {} failed: {}", what, e.what())));
            }
            catch (...)
            {
                return std::unexpected(AttestError::signing_backend(
                    fmt::format("Signing backend {} failed: unknown exception", what)));
            }
        }
    } // namespace

    SigningIdentity::SigningIdentity(
        std::shared_ptr<SigningBackend> backend,
        std::string key_ref,
        std::chrono::milliseconds timeout)
        : backend_(std::move(backend)),
          key_ref_(std::move(key_ref)),
          timeout_(timeout),
          pending_(std::make_shared<std::atomic<std::size_t>>(0))
    {
    }

    SigningIdentity SigningIdentity::verifier(
        std::shared_ptr<SigningBackend> backend,
        std::chrono::milliseconds timeout)
    {
        return SigningIdentity(std::move(backend), "", timeout);
    }

    Result<std::string> SigningIdentity::sign(const crypto::Bytes &payload) const
    {
        if (key_ref_.empty())
        {
            return std::unexpected(AttestError::signing_backend("Verification-only identity cannot sign"));
        }

        auto result = bounded_call<Result<std::string>>(
            [backend = backend_, payload, key_ref = key_ref_]()
            { return backend->sign(payload, key_ref); },
            timeout_, pending_, "sign");

        if (!result && result.error().code != ErrorCode::SigningBackendError)
        {
            return std::unexpected(AttestError::signing_backend(result.error().what()));
        }
        return result;
    }

    Result<std::string> SigningIdentity::public_key() const
    {
        auto result = bounded_call<Result<std::string>>(
            [backend = backend_, key_ref = key_ref_]()
            { return backend->export_public_key(key_ref); },
            timeout_, pending_, "export");

        if (!result && result.error().code != ErrorCode::SigningBackendError)
        {
            return std::unexpected(AttestError::signing_backend(result.error().what()));
        }
        return result;
    }

    Verification SigningIdentity::verify(
        const crypto::Bytes &payload,
        const std::string &signature,
        const std::string &public_key,
        const std::string &fingerprint) const
    {
        if (signature.empty())
        {
            return Verification::failure("missing signature");
        }
        if (public_key.empty())
        {
            return Verification::failure("missing public key");
        }

        auto result = bounded_call<Result<bool>>(
            [backend = backend_, payload, signature, public_key, fingerprint]()
            { return backend->verify(payload, signature, public_key, fingerprint); },
            timeout_, pending_, "verify");

        if (!result)
        {
            return Verification::failure(result.error().what());
        }
        if (!*result)
        {
            return Verification::failure(fingerprint.empty()
                                             ? "signature does not verify"
                                             : "signature or fingerprint does not verify");
        }
        return Verification::success();
    }

    std::string SigningIdentity::fingerprint_of(const std::string &public_key) const
    {
        return backend_->fingerprint_of(public_key);
    }

} // namespace attest
