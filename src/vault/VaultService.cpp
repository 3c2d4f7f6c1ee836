#include "otpdeck/vault/VaultService.hpp"
#include "Encoding.hpp"
#include "otpdeck/otp/OtpGenerator.hpp"
#include "otpdeck/security/ScopeWipe.hpp"

#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>
#include <vector>

namespace otpdeck::vault
{
namespace
{

using Json = nlohmann::json;

constexpr int g_kPasswordSlotType{ 1 };

[[nodiscard]] std::string stringOr(const Json& obj, const char* key, std::string fallback = {})
{
    const auto it{ obj.find(key) };
    if (it == obj.end() || !it->is_string())
    {
        return fallback;
    }
    return it->get<std::string>();
}

template <class T> [[nodiscard]] T unsignedOr(const Json& obj, const char* key, T fallback)
{
    const auto it{ obj.find(key) };
    if (it == obj.end() || it->is_null())
    {
        return fallback;
    }
    if (!it->is_number_unsigned())
    {
        throw std::invalid_argument(std::string{ "expected unsigned number for " } + key);
    }
    return it->get<T>();
}

[[nodiscard]] VaultResult<otpdeck::security::SecureString> readFileOrError(const std::filesystem::path& file) noexcept
{
    try
    {
        std::error_code ec{};
        if (!std::filesystem::is_regular_file(file, ec) || ec)
        {
            return VaultError::NotFound;
        }

        std::ifstream in{ file, std::ios::binary };
        if (!in)
        {
            return VaultError::IoError;
        }
        const auto size{ std::filesystem::file_size(file, ec) };
        if (ec)
        {
            return VaultError::IoError;
        }

        otpdeck::security::SecureString text{};
        text.resize(static_cast<std::size_t>(size));
        if (!text.empty() && !in.read(text.data(), static_cast<std::streamsize>(text.size())))
        {
            otpdeck::security::secureRelease(text);
            return VaultError::IoError;
        }
        return text;
    }
    catch (const std::exception&)
    {
        return VaultError::IoError;
    }
}

[[nodiscard]] std::optional<otpdeck::crypto::AeadBox> boxFromParams(const Json& params,
                                                                    std::span<const std::uint8_t> cipherText)
{
    const auto nonce{ detail::decodeHex(stringOr(params, "nonce")) };
    const auto tag{ detail::decodeHex(stringOr(params, "tag")) };
    if (!nonce || !tag || nonce->size() != otpdeck::crypto::g_aeadNonceBytes ||
        tag->size() != otpdeck::crypto::g_aeadTagBytes)
    {
        return std::nullopt;
    }

    otpdeck::crypto::AeadBox box{};
    std::copy(nonce->begin(), nonce->end(), box.nonce.begin());
    std::copy(tag->begin(), tag->end(), box.tag.begin());
    box.cipherText.assign(cipherText.begin(), cipherText.end());
    return box;
}

[[nodiscard]] VaultResult<otpdeck::security::SecureBuffer>
unwrapMasterKeyOrError(otpdeck::crypto::ICryptoProvider& crypto, const Json& header,
                       const otpdeck::security::SecureString& password) noexcept
{
    if (password.empty())
    {
        return VaultError::WrongPassword;
    }
    try
    {
        const auto slots{ header.find("slots") };
        if (slots == header.end() || !slots->is_array())
        {
            return VaultError::MalformedVault;
        }

        bool sawPasswordSlot{ false };
        for (const auto& slot : *slots)
        {
            if (!slot.is_object() || unsignedOr<int>(slot, "type", 0) != g_kPasswordSlotType)
            {
                continue;
            }
            sawPasswordSlot = true;

            const otpdeck::crypto::ScryptParams params{ unsignedOr<std::uint64_t>(slot, "n", 0U),
                                                        unsignedOr<std::uint32_t>(slot, "r", 0U),
                                                        unsignedOr<std::uint32_t>(slot, "p", 0U) };
            const auto salt{ detail::decodeHex(stringOr(slot, "salt")) };
            const auto sealedKey{ detail::decodeHex(stringOr(slot, "key")) };
            const auto keyParams{ slot.find("key_params") };
            if (!salt || !sealedKey || keyParams == slot.end() || !keyParams->is_object())
            {
                return VaultError::MalformedVault;
            }
            const auto box{ boxFromParams(*keyParams, otpdeck::security::asSpan(*sealedKey)) };
            if (!box)
            {
                return VaultError::MalformedVault;
            }

            otpdeck::security::SecureBuffer slotKey{};
            try
            {
                slotKey = crypto.deriveScryptKey(otpdeck::security::asBytes(password),
                                                 otpdeck::security::asSpan(*salt), params,
                                                 otpdeck::crypto::g_aeadKeyBytes);
            }
            catch (const std::invalid_argument&)
            {
                return VaultError::UnsupportedKdfParams;
            }
            auto wipeSlotKey{ otpdeck::security::scopeWipe(slotKey) };

            auto masterKey{ crypto.aeadDecrypt(otpdeck::security::asSpan(slotKey), *box) };
            if (masterKey && masterKey->size() == otpdeck::crypto::g_aeadKeyBytes)
            {
                return std::move(*masterKey);
            }
            if (masterKey)
            {
                otpdeck::security::secureRelease(*masterKey);
            }
        }
        return sawPasswordSlot ? VaultError::WrongPassword : VaultError::NoPasswordSlot;
    }
    catch (const nlohmann::json::exception&)
    {
        return VaultError::MalformedVault;
    }
    catch (const std::invalid_argument&)
    {
        return VaultError::MalformedVault;
    }
    catch (const std::exception&)
    {
        return VaultError::CryptoError;
    }
}

[[nodiscard]] std::optional<otpdeck::otp::OtpParams> parseOtpParams(const Json& entry, std::string& reason)
{
    const auto type{ otpdeck::otp::parseOtpType(stringOr(entry, "type")) };
    if (!type)
    {
        reason = "unsupported type '" + stringOr(entry, "type") + "'";
        return std::nullopt;
    }
    const auto info{ entry.find("info") };
    if (info == entry.end() || !info->is_object())
    {
        reason = "missing info";
        return std::nullopt;
    }

    const auto algorithm{ otpdeck::otp::parseHashAlgorithm(stringOr(*info, "algo", "SHA1")) };
    if (!algorithm)
    {
        reason = "unsupported algorithm '" + stringOr(*info, "algo") + "'";
        return std::nullopt;
    }

    otpdeck::otp::OtpParams params{};
    params.type = *type;
    params.algorithm = *algorithm;
    params.digits = unsignedOr<std::uint32_t>(*info, "digits", 6U);
    params.period = unsignedOr<std::uint32_t>(*info, "period", otpdeck::otp::g_kDefaultPeriod);
    params.counter = unsignedOr<std::uint64_t>(*info, "counter", 0U);
    params.pin = otpdeck::security::secureStringFrom(stringOr(*info, "pin"));

    std::string encoded{ stringOr(*info, "secret") };
    auto wipeEncoded{ otpdeck::security::scopeWipe(encoded) };
    auto secret{ *type == otpdeck::otp::OtpType::Motp ? detail::decodeHex(encoded) : detail::decodeBase32(encoded) };
    if (!secret)
    {
        reason = "undecodable secret";
        return std::nullopt;
    }
    params.secret = std::move(*secret);

    if (!otpdeck::otp::OtpGenerator::supports(params))
    {
        reason = "unsupported parameters";
        return std::nullopt;
    }
    return params;
}

[[nodiscard]] VaultResult<VaultContents> parseDatabaseOrError(const Json& db) noexcept
{
    try
    {
        if (!db.is_object())
        {
            return VaultError::MalformedVault;
        }
        const auto entries{ db.find("entries") };
        if (entries == db.end() || !entries->is_array())
        {
            return VaultError::MalformedVault;
        }

        std::vector<otpdeck::core::Group> groups{};
        if (const auto g{ db.find("groups") }; g != db.end() && g->is_array())
        {
            for (const auto& group : *g)
            {
                const std::string uuid{ stringOr(group, "uuid") };
                if (!uuid.empty())
                {
                    groups.push_back(otpdeck::core::Group{ uuid, stringOr(group, "name") });
                }
            }
        }

        VaultContents contents{};
        std::vector<otpdeck::core::Entry> list{};
        std::set<std::string, std::less<>> seen{};
        for (const auto& item : *entries)
        {
            if (!item.is_object())
            {
                ++contents.skippedEntries;
                spdlog::warn("vault: skipping non-object entry");
                continue;
            }
            const std::string uuid{ stringOr(item, "uuid") };
            if (uuid.empty() || !seen.insert(uuid).second)
            {
                ++contents.skippedEntries;
                spdlog::warn("vault: skipping entry with missing or duplicate uuid '{}'", uuid);
                continue;
            }

            std::string reason{};
            std::optional<otpdeck::otp::OtpParams> params{};
            try
            {
                params = parseOtpParams(item, reason);
            }
            catch (const std::exception& e)
            {
                reason = e.what();
            }
            if (!params)
            {
                ++contents.skippedEntries;
                spdlog::warn("vault: skipping entry {}: {}", uuid, reason);
                continue;
            }

            otpdeck::core::Entry entry{};
            entry.uuid = uuid;
            entry.issuer = stringOr(item, "issuer");
            entry.name = stringOr(item, "name");
            entry.note = stringOr(item, "note");
            if (const auto ids{ item.find("groups") }; ids != item.end() && ids->is_array())
            {
                for (const auto& id : *ids)
                {
                    if (id.is_string())
                    {
                        entry.groupIds.push_back(id.get<std::string>());
                    }
                }
            }
            list.push_back(std::move(entry));
            contents.otpParams.emplace(uuid, std::move(*params));
        }

        contents.index = otpdeck::core::EntryIndex{ std::move(list), std::move(groups) };
        spdlog::info("vault: loaded {} entries, {} groups, {} skipped", contents.index.size(),
                     contents.index.groups().size(), contents.skippedEntries);
        return contents;
    }
    catch (const std::exception&)
    {
        return VaultError::MalformedVault;
    }
}

// std::nullopt when the text is not an Aegis document.
[[nodiscard]] std::optional<Json> parseDocument(std::string_view text) noexcept
{
    try
    {
        Json doc = Json::parse(text.begin(), text.end(), nullptr, false);
        if (doc.is_discarded() || !doc.is_object() || !doc.contains("db") || !doc.contains("header"))
        {
            return std::nullopt;
        }
        return doc;
    }
    catch (const std::exception&)
    {
        return std::nullopt;
    }
}

} // namespace

std::string_view describe(VaultError error) noexcept
{
    switch (error)
    {
    case VaultError::NotFound:
        return "vault file not found";
    case VaultError::IoError:
        return "cannot read vault file";
    case VaultError::MalformedVault:
        return "vault file is malformed";
    case VaultError::NoPasswordSlot:
        return "vault has no password slot";
    case VaultError::UnsupportedKdfParams:
        return "vault uses unsupported scrypt parameters";
    case VaultError::WrongPassword:
        return "wrong password";
    case VaultError::CryptoError:
        return "cryptographic backend failure";
    }
    return "unknown vault error";
}

VaultResult<bool> VaultService::requiresPassword(const std::filesystem::path& vaultFile) const noexcept
{
    auto text{ readFileOrError(vaultFile) };
    if (auto* err{ std::get_if<VaultError>(&text) })
    {
        return *err;
    }
    auto& raw{ std::get<otpdeck::security::SecureString>(text) };
    auto wipeRaw{ otpdeck::security::scopeWipe(raw) };

    const auto doc{ parseDocument(otpdeck::security::asStringView(raw)) };
    if (!doc)
    {
        return VaultError::MalformedVault;
    }
    return (*doc)["db"].is_string();
}

VaultResult<VaultContents> VaultService::openVault(const std::filesystem::path& vaultFile,
                                                   const otpdeck::security::SecureString& password) noexcept
{
    auto text{ readFileOrError(vaultFile) };
    if (auto* err{ std::get_if<VaultError>(&text) })
    {
        return *err;
    }
    auto& raw{ std::get<otpdeck::security::SecureString>(text) };
    auto wipeRaw{ otpdeck::security::scopeWipe(raw) };
    return openVaultText(otpdeck::security::asStringView(raw), password);
}

VaultResult<VaultContents> VaultService::openVaultText(std::string_view json,
                                                       const otpdeck::security::SecureString& password) noexcept
{
    const auto docOpt{ parseDocument(json) };
    if (!docOpt)
    {
        return VaultError::MalformedVault;
    }
    const Json& doc{ *docOpt };
    const Json& db{ doc["db"] };

    if (db.is_object())
    {
        spdlog::info("vault: plain export, no decryption needed");
        return parseDatabaseOrError(db);
    }
    if (!db.is_string() || !doc["header"].is_object())
    {
        return VaultError::MalformedVault;
    }

    try
    {
        const Json& header{ doc["header"] };
        auto masterRes{ unwrapMasterKeyOrError(*m_crypto, header, password) };
        if (auto* err{ std::get_if<VaultError>(&masterRes) })
        {
            return *err;
        }
        auto& masterKey{ std::get<otpdeck::security::SecureBuffer>(masterRes) };
        auto wipeMaster{ otpdeck::security::scopeWipe(masterKey) };

        const auto cipherText{ detail::decodeBase64(db.get_ref<const std::string&>()) };
        const auto params{ header.find("params") };
        if (!cipherText || params == header.end() || !params->is_object())
        {
            return VaultError::MalformedVault;
        }
        const auto box{ boxFromParams(*params, otpdeck::security::asSpan(*cipherText)) };
        if (!box)
        {
            return VaultError::MalformedVault;
        }

        auto plain{ m_crypto->aeadDecrypt(otpdeck::security::asSpan(masterKey), *box) };
        if (!plain)
        {
            // The slot authenticated the key, so a failing body means a damaged file.
            return VaultError::MalformedVault;
        }
        auto wipePlain{ otpdeck::security::scopeWipe(*plain) };

        const std::string_view plainText{ otpdeck::security::asStringView(*plain) };
        const Json inner = Json::parse(plainText.begin(), plainText.end(), nullptr, false);
        if (inner.is_discarded())
        {
            return VaultError::MalformedVault;
        }
        return parseDatabaseOrError(inner);
    }
    catch (const nlohmann::json::exception&)
    {
        return VaultError::MalformedVault;
    }
    catch (const std::invalid_argument&)
    {
        return VaultError::MalformedVault;
    }
    catch (const std::exception&)
    {
        return VaultError::CryptoError;
    }
}

} // namespace otpdeck::vault
