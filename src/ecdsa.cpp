#include "attest/ecdsa.hpp"

#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/params.h>

#include <array>
#include <cstring>

namespace attest::crypto
{

    namespace
    {
        using evp_pkey_ctx_ptr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
        using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
        using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

        constexpr const char *kCurveName = "secp256k1";

        evp_pkey_ptr public_key_from_point(const Bytes &point)
        {
            auto key_ctx = evp_pkey_ctx_ptr{
                EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
            if (!key_ctx || EVP_PKEY_fromdata_init(key_ctx.get()) != 1)
            {
                return evp_pkey_ptr{nullptr, EVP_PKEY_free};
            }

            auto *group_name = const_cast<char *>(kCurveName);
            auto params = std::array{
                OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME, group_name, 0),
                OSSL_PARAM_construct_octet_string(
                    OSSL_PKEY_PARAM_PUB_KEY,
                    const_cast<unsigned char *>(point.data()),
                    point.size()),
                OSSL_PARAM_construct_end()};

            EVP_PKEY *raw_pkey = nullptr;
            if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_PUBLIC_KEY, params.data()) != 1)
            {
                return evp_pkey_ptr{nullptr, EVP_PKEY_free};
            }
            return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
        }
    } // namespace

    Result<Secp256k1KeyPair> Secp256k1KeyPair::generate()
    {
        EVP_PKEY *raw = EVP_EC_gen(kCurveName);
        if (raw == nullptr)
        {
            return std::unexpected(AttestError::crypto("Failed to generate secp256k1 keypair"));
        }

        Secp256k1KeyPair keypair;
        keypair.pkey_ = std::shared_ptr<evp_pkey_st>(raw, EVP_PKEY_free);

        std::array<unsigned char, 133> point{};
        size_t point_len = 0;
        if (EVP_PKEY_get_octet_string_param(
                raw, OSSL_PKEY_PARAM_PUB_KEY, point.data(), point.size(), &point_len) != 1)
        {
            return std::unexpected(AttestError::crypto("Failed to export secp256k1 public key"));
        }
        keypair.public_key_.assign(point.begin(), point.begin() + point_len);

        return keypair;
    }

    Result<Bytes> Secp256k1KeyPair::sign(const Bytes &message) const
    {
        if (!pkey_)
        {
            return std::unexpected(AttestError::crypto("secp256k1 keypair is empty"));
        }

        auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
        if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, pkey_.get()) != 1)
        {
            return std::unexpected(AttestError::crypto("ECDSA sign init failed"));
        }

        size_t sig_len = 0;
        if (EVP_DigestSign(ctx.get(), nullptr, &sig_len, message.data(), message.size()) != 1)
        {
            return std::unexpected(AttestError::crypto("ECDSA signature sizing failed"));
        }

        Bytes signature(sig_len);
        if (EVP_DigestSign(ctx.get(), signature.data(), &sig_len, message.data(), message.size()) != 1)
        {
            return std::unexpected(AttestError::crypto("ECDSA signing failed"));
        }
        signature.resize(sig_len);
        return signature;
    }

    bool Secp256k1KeyPair::verify(
        const Bytes &message,
        const Bytes &der_signature,
        const Bytes &public_key)
    {
        if (der_signature.empty() || public_key.empty())
        {
            return false;
        }

        auto pkey = public_key_from_point(public_key);
        if (!pkey)
        {
            return false;
        }

        auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
        if (!ctx)
        {
            return false;
        }

        auto ok = false;
        if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, pkey.get()) == 1)
        {
            ok = EVP_DigestVerify(ctx.get(), der_signature.data(), der_signature.size(),
                                  message.data(), message.size()) == 1;
        }
        return ok;
    }

} // namespace attest::crypto
