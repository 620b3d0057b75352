#pragma once

#include "types.hpp"
#include "signing_backend.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace attest
{

    /**
     * A key reference bound to a SigningBackend.
     *
     * Every backend call is bounded by the configured timeout. A timed out or
     * throwing sign/export call becomes SigningBackendError; verify never
     * fails, it reports a Verification outcome. A call abandoned on timeout
     * keeps its slot until the backend returns, so a hung backend is refused
     * once kMaxPendingCalls slots are taken.
     */
    class SigningIdentity
    {
    public:
        static constexpr std::chrono::milliseconds kDefaultTimeout{30000};

        /// Backend calls allowed to run at once per identity (and its copies)
        static constexpr std::size_t kMaxPendingCalls = 32;

        /**
         * @param timeout Zero runs backend calls on the calling thread
         */
        SigningIdentity(
            std::shared_ptr<SigningBackend> backend,
            std::string key_ref,
            std::chrono::milliseconds timeout = kDefaultTimeout);

        /**
         * Identity without a key, usable only for verification
         */
        static SigningIdentity verifier(
            std::shared_ptr<SigningBackend> backend,
            std::chrono::milliseconds timeout = kDefaultTimeout);

        Result<std::string> sign(const crypto::Bytes &payload) const;

        Result<std::string> public_key() const;

        Verification verify(
            const crypto::Bytes &payload,
            const std::string &signature,
            const std::string &public_key,
            const std::string &fingerprint = {}) const;

        std::string fingerprint_of(const std::string &public_key) const;

        const std::string &key_ref() const { return key_ref_; }
        std::string scheme() const { return backend_->scheme(); }
        std::chrono::milliseconds timeout() const { return timeout_; }

    private:
        std::shared_ptr<SigningBackend> backend_;
        std::string key_ref_;
        std::chrono::milliseconds timeout_;
        std::shared_ptr<std::atomic<std::size_t>> pending_;
    };

} // namespace attest
