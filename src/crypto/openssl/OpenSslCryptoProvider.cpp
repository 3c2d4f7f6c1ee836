#include "otpdeck/crypto/providers/OpenSslProviderFactory.hpp"
#include "otpdeck/security/SecureBuffer.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <openssl/rand.h>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

namespace otpdeck::crypto::providers
{
namespace
{

// Aegis writes N=2^15, r=8, p=1. Anything far above that is treated as hostile input.
constexpr std::uint64_t g_kScryptMaxN{ 1ULL << 20U };
constexpr std::uint32_t g_kScryptMaxR{ 32U };
constexpr std::uint32_t g_kScryptMaxP{ 16U };
constexpr std::uint64_t g_kScryptMaxMemBytes{ 1ULL << 30U };
constexpr std::size_t g_kMaxDerivedBytes{ 64U };

void requireExactSize(std::span<const std::uint8_t> s, std::size_t expected, const char* what)
{
    if (s.size() != expected)
    {
        throw std::invalid_argument(what);
    }
}

void requireIntSized(std::size_t size, const char* what)
{
    if (size > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
        throw std::invalid_argument(what);
    }
}

void requireScryptParamsSafe(const otpdeck::crypto::ScryptParams& params)
{
    const bool powerOfTwo{ params.n >= 2U && (params.n & (params.n - 1U)) == 0U };
    if (!powerOfTwo || params.r == 0U || params.p == 0U)
    {
        throw std::invalid_argument("deriveScryptKey: invalid scrypt parameters");
    }
    if (params.n > g_kScryptMaxN || params.r > g_kScryptMaxR || params.p > g_kScryptMaxP)
    {
        throw std::invalid_argument("deriveScryptKey: unsafe scrypt parameters");
    }
    constexpr std::uint64_t kBlockFactor{ 128U };
    if (kBlockFactor * params.r * params.n > g_kScryptMaxMemBytes)
    {
        throw std::invalid_argument("deriveScryptKey: unsafe scrypt parameters");
    }
}

[[nodiscard]] const char* digestName(otpdeck::crypto::HashAlgorithm algorithm) noexcept
{
    switch (algorithm)
    {
    case otpdeck::crypto::HashAlgorithm::Sha1:
        return "SHA1";
    case otpdeck::crypto::HashAlgorithm::Sha256:
        return "SHA256";
    case otpdeck::crypto::HashAlgorithm::Sha512:
        return "SHA512";
    case otpdeck::crypto::HashAlgorithm::Md5:
        return "MD5";
    }
    return "SHA1";
}

using EvpKdfPtr = std::unique_ptr<EVP_KDF, decltype(&EVP_KDF_free)>;
using EvpKdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)>;
using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;
using EvpMacPtr = std::unique_ptr<EVP_MAC, decltype(&EVP_MAC_free)>;
using EvpMacCtxPtr = std::unique_ptr<EVP_MAC_CTX, decltype(&EVP_MAC_CTX_free)>;
using EvpMdPtr = std::unique_ptr<EVP_MD, decltype(&EVP_MD_free)>;

EvpKdfPtr fetchScryptKdf()
{
    return EvpKdfPtr{ EVP_KDF_fetch(nullptr, "SCRYPT", nullptr), &EVP_KDF_free };
}

EvpMacPtr fetchHmac()
{
    return EvpMacPtr{ EVP_MAC_fetch(nullptr, "HMAC", nullptr), &EVP_MAC_free };
}

class OpenSslCryptoProvider final : public otpdeck::crypto::ICryptoProvider
{
public:
    OpenSslCryptoProvider() : m_scryptKdf{ fetchScryptKdf() }, m_hmac{ fetchHmac() }
    {
    }

    [[nodiscard]] otpdeck::security::SecureBuffer deriveScryptKey(std::span<const std::byte> password,
                                                                  std::span<const std::uint8_t> salt,
                                                                  const otpdeck::crypto::ScryptParams& params,
                                                                  std::size_t outBytes) const override
    {
        if (password.empty())
        {
            throw std::invalid_argument("deriveScryptKey: empty password");
        }
        if (salt.empty())
        {
            throw std::invalid_argument("deriveScryptKey: empty salt");
        }
        if (outBytes == 0U || outBytes > g_kMaxDerivedBytes)
        {
            throw std::invalid_argument("deriveScryptKey: invalid outBytes");
        }
        requireScryptParamsSafe(params);

        if (!m_scryptKdf)
        {
            throw std::runtime_error("deriveScryptKey: OpenSSL SCRYPT KDF not available");
        }

        EvpKdfCtxPtr ctx{ EVP_KDF_CTX_new(m_scryptKdf.get()), &EVP_KDF_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("deriveScryptKey: EVP_KDF_CTX_new failed");
        }

        std::uint64_t n{ params.n };
        std::uint32_t r{ params.r };
        std::uint32_t p{ params.p };
        std::uint64_t maxMem{ g_kScryptMaxMemBytes };

        // OSSL_PARAM takes non-const pointers; hand it private copies instead of casting away const.
        otpdeck::security::SecureBuffer passwordCopy{};
        passwordCopy.resize(password.size());
        std::memcpy(passwordCopy.data(), password.data(), password.size());
        std::vector<std::uint8_t> saltCopy{ salt.begin(), salt.end() };

        OSSL_PARAM ossl[]{
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_PASSWORD, passwordCopy.data(), passwordCopy.size()),
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, saltCopy.data(), saltCopy.size()),
            OSSL_PARAM_construct_uint64(OSSL_KDF_PARAM_SCRYPT_N, &n),
            OSSL_PARAM_construct_uint32(OSSL_KDF_PARAM_SCRYPT_R, &r),
            OSSL_PARAM_construct_uint32(OSSL_KDF_PARAM_SCRYPT_P, &p),
            OSSL_PARAM_construct_uint64(OSSL_KDF_PARAM_SCRYPT_MAXMEM, &maxMem),
            OSSL_PARAM_construct_end(),
        };

        otpdeck::security::SecureBuffer out{};
        out.resize(outBytes);
        if (EVP_KDF_derive(ctx.get(), out.data(), out.size(), ossl) <= 0)
        {
            throw std::runtime_error("deriveScryptKey: EVP_KDF_derive failed");
        }
        return out;
    }

    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        if (out.empty())
        {
            return true;
        }
        if (out.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
        {
            return false;
        }
        return RAND_bytes(out.data(), static_cast<int>(out.size())) == 1;
    }

    [[nodiscard]] otpdeck::crypto::AeadBox aeadEncrypt(std::span<const std::uint8_t> key,
                                                       std::span<const std::byte> plainText) override
    {
        requireExactSize(key, otpdeck::crypto::g_aeadKeyBytes, "aeadEncrypt: key");
        requireIntSized(plainText.size(), "aeadEncrypt: plainText too large");

        otpdeck::crypto::AeadBox box{};
        if (!randomBytes(std::span<std::uint8_t>{ box.nonce }))
        {
            throw std::runtime_error("aeadEncrypt: CSPRNG failure");
        }

        EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("aeadEncrypt: EVP_CIPHER_CTX_new failed");
        }
        if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1)
        {
            throw std::runtime_error("aeadEncrypt: EVP_EncryptInit_ex failed");
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(box.nonce.size()), nullptr) != 1)
        {
            throw std::runtime_error("aeadEncrypt: set ivlen failed");
        }
        if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), box.nonce.data()) != 1)
        {
            throw std::runtime_error("aeadEncrypt: set key/nonce failed");
        }

        box.cipherText.resize(plainText.size());
        int outLen{ 0 };
        const auto* ptPtr{ reinterpret_cast<const unsigned char*>(plainText.data()) };
        if (!plainText.empty() &&
            EVP_EncryptUpdate(ctx.get(), box.cipherText.data(), &outLen, ptPtr, static_cast<int>(plainText.size())) !=
                1)
        {
            throw std::runtime_error("aeadEncrypt: encrypt update failed");
        }

        // GCM is a stream mode; final emits nothing but must still be called to compute the tag.
        std::array<unsigned char, 16> finalScratch{};
        int finalLen{ 0 };
        if (EVP_EncryptFinal_ex(ctx.get(), finalScratch.data(), &finalLen) != 1 || finalLen != 0)
        {
            throw std::runtime_error("aeadEncrypt: encrypt final failed");
        }
        box.cipherText.resize(static_cast<std::size_t>(outLen));

        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(box.tag.size()), box.tag.data()) !=
            1)
        {
            throw std::runtime_error("aeadEncrypt: get tag failed");
        }
        return box;
    }

    [[nodiscard]] std::optional<otpdeck::security::SecureBuffer> aeadDecrypt(std::span<const std::uint8_t> key,
                                                                             const otpdeck::crypto::AeadBox& box) override
    {
        requireExactSize(key, otpdeck::crypto::g_aeadKeyBytes, "aeadDecrypt: key");
        requireIntSized(box.cipherText.size(), "aeadDecrypt: cipherText too large");

        EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("aeadDecrypt: EVP_CIPHER_CTX_new failed");
        }
        if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1)
        {
            throw std::runtime_error("aeadDecrypt: EVP_DecryptInit_ex failed");
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(box.nonce.size()), nullptr) != 1)
        {
            throw std::runtime_error("aeadDecrypt: set ivlen failed");
        }
        if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), box.nonce.data()) != 1)
        {
            throw std::runtime_error("aeadDecrypt: set key/nonce failed");
        }

        otpdeck::security::SecureBuffer plainText{};
        plainText.resize(box.cipherText.size());

        int outLen{ 0 };
        if (!box.cipherText.empty() &&
            EVP_DecryptUpdate(ctx.get(), plainText.data(), &outLen, box.cipherText.data(),
                              static_cast<int>(box.cipherText.size())) != 1)
        {
            otpdeck::security::secureRelease(plainText);
            return std::nullopt;
        }

        std::array<std::uint8_t, otpdeck::crypto::g_aeadTagBytes> tagCopy{ box.tag };
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tagCopy.size()), tagCopy.data()) !=
            1)
        {
            throw std::runtime_error("aeadDecrypt: set tag failed");
        }

        std::array<unsigned char, 16> finalScratch{};
        int finalLen{ 0 };
        if (EVP_DecryptFinal_ex(ctx.get(), finalScratch.data(), &finalLen) != 1 || finalLen != 0)
        {
            otpdeck::security::secureRelease(plainText);
            return std::nullopt;
        }
        if (outLen < 0 || static_cast<std::size_t>(outLen) > plainText.size())
        {
            otpdeck::security::secureRelease(plainText);
            return std::nullopt;
        }
        plainText.resize(static_cast<std::size_t>(outLen));
        return plainText;
    }

    [[nodiscard]] otpdeck::security::SecureBuffer hmac(otpdeck::crypto::HashAlgorithm algorithm,
                                                       std::span<const std::uint8_t> key,
                                                       std::span<const std::byte> message) const override
    {
        if (key.empty())
        {
            throw std::invalid_argument("hmac: empty key");
        }
        if (!m_hmac)
        {
            throw std::runtime_error("hmac: OpenSSL HMAC not available");
        }

        EvpMacCtxPtr ctx{ EVP_MAC_CTX_new(m_hmac.get()), &EVP_MAC_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("hmac: EVP_MAC_CTX_new failed");
        }

        char* name{ const_cast<char*>(digestName(algorithm)) };
        OSSL_PARAM params[]{
            OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, name, 0),
            OSSL_PARAM_construct_end(),
        };
        if (EVP_MAC_init(ctx.get(), key.data(), key.size(), params) != 1)
        {
            throw std::runtime_error("hmac: EVP_MAC_init failed");
        }

        const auto* msg{ reinterpret_cast<const unsigned char*>(message.data()) };
        if (EVP_MAC_update(ctx.get(), msg, message.size()) != 1)
        {
            throw std::runtime_error("hmac: EVP_MAC_update failed");
        }

        otpdeck::security::SecureBuffer out{};
        out.resize(EVP_MAC_CTX_get_mac_size(ctx.get()));
        std::size_t written{ 0 };
        if (out.empty() || EVP_MAC_final(ctx.get(), out.data(), &written, out.size()) != 1)
        {
            throw std::runtime_error("hmac: EVP_MAC_final failed");
        }
        out.resize(written);
        return out;
    }

    [[nodiscard]] std::vector<std::uint8_t> digest(otpdeck::crypto::HashAlgorithm algorithm,
                                                   std::span<const std::byte> data) const override
    {
        EvpMdPtr md{ EVP_MD_fetch(nullptr, digestName(algorithm), nullptr), &EVP_MD_free };
        if (!md)
        {
            throw std::runtime_error("digest: EVP_MD_fetch failed");
        }

        std::vector<std::uint8_t> out(static_cast<std::size_t>(EVP_MAX_MD_SIZE));
        unsigned int written{ 0 };
        if (EVP_Digest(data.data(), data.size(), out.data(), &written, md.get(), nullptr) != 1)
        {
            throw std::runtime_error("digest: EVP_Digest failed");
        }
        out.resize(written);
        return out;
    }

private:
    EvpKdfPtr m_scryptKdf{ nullptr, &EVP_KDF_free };
    EvpMacPtr m_hmac{ nullptr, &EVP_MAC_free };
};

} // namespace

[[nodiscard]] std::unique_ptr<otpdeck::crypto::ICryptoProvider> makeOpenSslCryptoProvider()
{
    return std::make_unique<OpenSslCryptoProvider>();
}

} // namespace otpdeck::crypto::providers
