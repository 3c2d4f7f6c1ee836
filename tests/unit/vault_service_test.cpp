#include "TestUtils.hpp"
#include "VaultFixtures.hpp"
#include "otpdeck/crypto/providers/OpenSslProviderFactory.hpp"
#include "otpdeck/vault/VaultService.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using otpdeck::security::secureStringFrom;
using otpdeck::test_utils::Json;
using otpdeck::vault::VaultContents;
using otpdeck::vault::VaultError;

namespace
{

constexpr std::string_view g_kPassword{ "correct horse battery staple" };

// Provider whose key derivation always fails inside the backend.
class BrokenKdfCrypto final : public otpdeck::crypto::ICryptoProvider
{
public:
    [[nodiscard]] otpdeck::security::SecureBuffer
    deriveScryptKey([[maybe_unused]] std::span<const std::byte> password,
                    [[maybe_unused]] std::span<const std::uint8_t> salt,
                    [[maybe_unused]] const otpdeck::crypto::ScryptParams& params,
                    [[maybe_unused]] std::size_t outBytes) const override
    {
        throw std::runtime_error("kdf backend failure");
    }

    [[nodiscard]] bool randomBytes([[maybe_unused]] std::span<std::uint8_t> out) noexcept override
    {
        return false;
    }

    [[nodiscard]] otpdeck::crypto::AeadBox aeadEncrypt([[maybe_unused]] std::span<const std::uint8_t> key,
                                                       [[maybe_unused]] std::span<const std::byte> plainText) override
    {
        return {};
    }

    [[nodiscard]] std::optional<otpdeck::security::SecureBuffer>
    aeadDecrypt([[maybe_unused]] std::span<const std::uint8_t> key,
                [[maybe_unused]] const otpdeck::crypto::AeadBox& box) override
    {
        return std::nullopt;
    }

    [[nodiscard]] otpdeck::security::SecureBuffer hmac([[maybe_unused]] otpdeck::crypto::HashAlgorithm algorithm,
                                                       [[maybe_unused]] std::span<const std::uint8_t> key,
                                                       [[maybe_unused]] std::span<const std::byte> message) const override
    {
        return {};
    }

    [[nodiscard]] std::vector<std::uint8_t> digest([[maybe_unused]] otpdeck::crypto::HashAlgorithm algorithm,
                                                   [[maybe_unused]] std::span<const std::byte> data) const override
    {
        return {};
    }
};

class VaultServiceTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        dir = otpdeck::test_utils::makeSecureTempDir("vault_");
        ASSERT_FALSE(dir.empty());
    }

    void TearDown() override
    {
        std::error_code ec{};
        std::filesystem::remove_all(dir, ec);
    }

    [[nodiscard]] std::filesystem::path writeVault(std::string_view name, std::string_view text) const
    {
        const auto file{ dir / std::filesystem::path{ name } };
        EXPECT_TRUE(otpdeck::test_utils::writeTextFile(file, text));
        return file;
    }

    [[nodiscard]] otpdeck::vault::VaultResult<VaultContents> openText(std::string_view json,
                                                                      std::string_view password)
    {
        return service.openVaultText(json, secureStringFrom(password));
    }

    std::unique_ptr<otpdeck::crypto::ICryptoProvider> crypto{ otpdeck::crypto::providers::makeOpenSslCryptoProvider() };
    otpdeck::vault::VaultService service{ *crypto };
    std::filesystem::path dir;
};

[[nodiscard]] Json dbWithEntries(std::initializer_list<Json> entries)
{
    Json db = otpdeck::test_utils::sampleDatabase();
    db["entries"] = Json::array();
    for (const auto& e : entries)
    {
        db["entries"].push_back(e);
    }
    return db;
}

} // namespace

TEST_F(VaultServiceTest, OpensEncryptedBackupWithCorrectPassword)
{
    const auto text{ otpdeck::test_utils::makeEncryptedVault(*crypto, g_kPassword,
                                                             otpdeck::test_utils::sampleDatabase()) };
    const auto file{ writeVault("aegis-backup-20240101-120000.json", text) };

    auto required{ service.requiresPassword(file) };
    ASSERT_TRUE(std::holds_alternative<bool>(required));
    EXPECT_TRUE(std::get<bool>(required));

    auto res{ service.openVault(file, secureStringFrom(g_kPassword)) };
    ASSERT_TRUE(std::holds_alternative<VaultContents>(res));
    const auto& contents{ std::get<VaultContents>(res) };

    ASSERT_EQ(contents.index.size(), 4U);
    EXPECT_EQ(contents.skippedEntries, 0U);
    EXPECT_EQ(contents.index.entries()[0].issuer, "GitHub");
    EXPECT_EQ(contents.index.entries()[3].note, "prod account");
    EXPECT_EQ(contents.index.entries()[2].groupLabel, "Personal");
    EXPECT_EQ(contents.index.groups().size(), 2U);

    const auto params{ contents.otpParams.find(otpdeck::test_utils::g_kGoogleUuid) };
    ASSERT_NE(params, contents.otpParams.end());
    EXPECT_EQ(otpdeck::security::asStringView(params->second.secret), "12345678901234567890");
    EXPECT_EQ(params->second.period, 30U);
}

TEST_F(VaultServiceTest, WrongPasswordIsReported)
{
    const auto text{ otpdeck::test_utils::makeEncryptedVault(*crypto, g_kPassword,
                                                             otpdeck::test_utils::sampleDatabase()) };

    auto res{ openText(text, "correct horse battery stapler") };

    ASSERT_TRUE(std::holds_alternative<VaultError>(res));
    EXPECT_EQ(std::get<VaultError>(res), VaultError::WrongPassword);
}

TEST_F(VaultServiceTest, EmptyPasswordCountsAsWrong)
{
    const auto text{ otpdeck::test_utils::makeEncryptedVault(*crypto, g_kPassword,
                                                             otpdeck::test_utils::sampleDatabase()) };

    auto res{ openText(text, "") };

    ASSERT_TRUE(std::holds_alternative<VaultError>(res));
    EXPECT_EQ(std::get<VaultError>(res), VaultError::WrongPassword);
}

TEST_F(VaultServiceTest, PlainExportNeedsNoPassword)
{
    const auto file{ writeVault("aegis-export-20240101.json",
                                otpdeck::test_utils::makePlainVault(otpdeck::test_utils::sampleDatabase())) };

    auto required{ service.requiresPassword(file) };
    ASSERT_TRUE(std::holds_alternative<bool>(required));
    EXPECT_FALSE(std::get<bool>(required));

    auto res{ service.openVault(file, otpdeck::security::SecureString{}) };
    ASSERT_TRUE(std::holds_alternative<VaultContents>(res));
    EXPECT_EQ(std::get<VaultContents>(res).index.size(), 4U);
}

TEST_F(VaultServiceTest, MissingFileIsNotFound)
{
    auto res{ service.openVault(dir / "absent.json", secureStringFrom(g_kPassword)) };

    ASSERT_TRUE(std::holds_alternative<VaultError>(res));
    EXPECT_EQ(std::get<VaultError>(res), VaultError::NotFound);

    auto required{ service.requiresPassword(dir / "absent.json") };
    ASSERT_TRUE(std::holds_alternative<VaultError>(required));
    EXPECT_EQ(std::get<VaultError>(required), VaultError::NotFound);
}

TEST_F(VaultServiceTest, NonAegisDocumentsAreMalformed)
{
    for (const std::string_view text : { std::string_view{ "not json" }, std::string_view{ "[1,2,3]" },
                                         std::string_view{ "{\"db\":{}}" }, std::string_view{ "" } })
    {
        auto res{ openText(text, g_kPassword) };
        ASSERT_TRUE(std::holds_alternative<VaultError>(res)) << text;
        EXPECT_EQ(std::get<VaultError>(res), VaultError::MalformedVault) << text;
    }
}

TEST_F(VaultServiceTest, DamagedBodyAfterValidSlotIsMalformed)
{
    otpdeck::test_utils::EncryptOptions options{};
    options.corruptBody = true;
    const auto text{ otpdeck::test_utils::makeEncryptedVault(*crypto, g_kPassword,
                                                             otpdeck::test_utils::sampleDatabase(), options) };

    auto res{ openText(text, g_kPassword) };

    ASSERT_TRUE(std::holds_alternative<VaultError>(res));
    EXPECT_EQ(std::get<VaultError>(res), VaultError::MalformedVault);
}

TEST_F(VaultServiceTest, VaultWithoutPasswordSlotIsRejected)
{
    Json doc = Json::parse(otpdeck::test_utils::makeEncryptedVault(*crypto, g_kPassword,
                                                                  otpdeck::test_utils::sampleDatabase()));
    doc["header"]["slots"][0]["type"] = 2;

    auto res{ openText(doc.dump(), g_kPassword) };

    ASSERT_TRUE(std::holds_alternative<VaultError>(res));
    EXPECT_EQ(std::get<VaultError>(res), VaultError::NoPasswordSlot);
}

TEST_F(VaultServiceTest, HostileScryptParametersAreRefused)
{
    Json doc = Json::parse(otpdeck::test_utils::makeEncryptedVault(*crypto, g_kPassword,
                                                                  otpdeck::test_utils::sampleDatabase()));
    doc["header"]["slots"][0]["n"] = 1ULL << 30U;

    auto res{ openText(doc.dump(), g_kPassword) };

    ASSERT_TRUE(std::holds_alternative<VaultError>(res));
    EXPECT_EQ(std::get<VaultError>(res), VaultError::UnsupportedKdfParams);
}

TEST_F(VaultServiceTest, BackendFailureIsCryptoError)
{
    BrokenKdfCrypto broken{};
    otpdeck::vault::VaultService brokenService{ broken };
    const auto text{ otpdeck::test_utils::makeEncryptedVault(*crypto, g_kPassword,
                                                             otpdeck::test_utils::sampleDatabase()) };

    auto res{ brokenService.openVaultText(text, secureStringFrom(g_kPassword)) };

    ASSERT_TRUE(std::holds_alternative<VaultError>(res));
    EXPECT_EQ(std::get<VaultError>(res), VaultError::CryptoError);
}

TEST_F(VaultServiceTest, BadEntriesAreSkippedAndTheRestKeepOrder)
{
    using otpdeck::test_utils::totpEntry;
    Json unknownType = totpEntry("u-y", "Yandex", "y");
    unknownType["type"] = "yandex";
    Json badSecret = totpEntry("u-bad", "Bad", "b");
    badSecret["info"]["secret"] = "not base32!";
    Json md5Totp = totpEntry("u-md5", "Md5", "m");
    md5Totp["info"]["algo"] = "MD5";
    Json noUuid = totpEntry("", "NoId", "n");
    Json badDigits = totpEntry("u-digits", "Digits", "d");
    badDigits["info"]["digits"] = "six";

    const Json db = dbWithEntries({ totpEntry("u-a", "First", "a"), unknownType, badSecret,
                                    totpEntry("u-a", "Dup", "a2"), md5Totp, noUuid, badDigits,
                                    totpEntry("u-z", "Last", "z") });

    auto res{ openText(otpdeck::test_utils::makePlainVault(db), "") };

    ASSERT_TRUE(std::holds_alternative<VaultContents>(res));
    const auto& contents{ std::get<VaultContents>(res) };
    EXPECT_EQ(contents.skippedEntries, 6U);
    ASSERT_EQ(contents.index.size(), 2U);
    EXPECT_EQ(contents.index.entries()[0].issuer, "First");
    EXPECT_EQ(contents.index.entries()[1].issuer, "Last");
    EXPECT_EQ(contents.index.entries()[1].originalIndex, 1U);
}

TEST_F(VaultServiceTest, ReadsHotpCounterAndMotpPin)
{
    Json hotp = otpdeck::test_utils::totpEntry("u-h", "Hotp", "h");
    hotp["type"] = "hotp";
    hotp["info"]["counter"] = 42;
    Json motp = otpdeck::test_utils::totpEntry("u-m", "Motp", "m");
    motp["type"] = "motp";
    motp["info"]["secret"] = "1234567890abcdef";
    motp["info"]["algo"] = "MD5";
    motp["info"]["period"] = 10;
    motp["info"]["pin"] = "1234";

    auto res{ openText(otpdeck::test_utils::makePlainVault(dbWithEntries({ hotp, motp })), "") };

    ASSERT_TRUE(std::holds_alternative<VaultContents>(res));
    const auto& params{ std::get<VaultContents>(res).otpParams };
    ASSERT_EQ(params.size(), 2U);
    EXPECT_EQ(params.at("u-h").type, otpdeck::otp::OtpType::Hotp);
    EXPECT_EQ(params.at("u-h").counter, 42U);
    EXPECT_EQ(params.at("u-m").type, otpdeck::otp::OtpType::Motp);
    EXPECT_EQ(params.at("u-m").secret.size(), 8U);
    EXPECT_EQ(otpdeck::security::asStringView(params.at("u-m").pin), "1234");
}

TEST_F(VaultServiceTest, DanglingGroupReferenceIsUnlabelled)
{
    const Json db = dbWithEntries({ otpdeck::test_utils::totpEntry("u-a", "A", "a", { "g-missing" }) });

    auto res{ openText(otpdeck::test_utils::makePlainVault(db), "") };

    ASSERT_TRUE(std::holds_alternative<VaultContents>(res));
    EXPECT_TRUE(std::get<VaultContents>(res).index.entries()[0].groupLabel.empty());
}

TEST(VaultErrors, EveryErrorHasADescription)
{
    for (const auto e : { VaultError::NotFound, VaultError::IoError, VaultError::MalformedVault,
                          VaultError::NoPasswordSlot, VaultError::UnsupportedKdfParams, VaultError::WrongPassword,
                          VaultError::CryptoError })
    {
        EXPECT_FALSE(otpdeck::vault::describe(e).empty());
    }
    EXPECT_EQ(otpdeck::vault::describe(VaultError::WrongPassword), "wrong password");
}
