/**
 * @file DomainTest.cpp
 * @brief Тесты доменных типов и утилит
 */

#include <gtest/gtest.h>

#include "domain/Container.hpp"
#include "domain/ContainerError.hpp"
#include "domain/RegistrationChallenge.hpp"
#include "domain/enums/BulkAction.hpp"
#include "domain/enums/ContainerType.hpp"
#include "domain/enums/TokenType.hpp"
#include "utils/CryptoUtils.hpp"
#include "utils/SerialGenerator.hpp"
#include "utils/StringUtils.hpp"

#include <regex>
#include <set>

using namespace containers;

// ============================================================================
// Enums
// ============================================================================

TEST(EnumsTest, ContainerType_RoundTripAndUnknown)
{
    EXPECT_EQ(domain::containerTypeFromString("smartphone"), domain::ContainerType::SMARTPHONE);
    EXPECT_EQ(domain::toString(domain::ContainerType::SMARTCARD), "smartcard");
    EXPECT_FALSE(domain::containerTypeFromString("Smartphone").has_value());
    EXPECT_FALSE(domain::containerTypeFromString("").has_value());
}

TEST(EnumsTest, TokenType_UnknownIsEmpty)
{
    EXPECT_EQ(domain::tokenTypeFromString("push"), domain::TokenType::PUSH);
    EXPECT_FALSE(domain::tokenTypeFromString("motp").has_value());
}

TEST(EnumsTest, SupportedTokenTypes_PerContainerType)
{
    EXPECT_TRUE(domain::supportsTokenType(domain::ContainerType::SMARTPHONE, domain::TokenType::PUSH));
    EXPECT_FALSE(domain::supportsTokenType(domain::ContainerType::SMARTPHONE, domain::TokenType::YUBIKEY));
    EXPECT_TRUE(domain::supportsTokenType(domain::ContainerType::SMARTCARD, domain::TokenType::CERTIFICATE));
    EXPECT_FALSE(domain::supportsTokenType(domain::ContainerType::SMARTCARD, domain::TokenType::PUSH));
    for (auto type : domain::allTokenTypes()) {
        EXPECT_TRUE(domain::supportsTokenType(domain::ContainerType::GENERIC, type));
    }
}

TEST(EnumsTest, OnlySmartphoneSupportsRegistration)
{
    EXPECT_TRUE(domain::supportsRegistration(domain::ContainerType::SMARTPHONE));
    EXPECT_FALSE(domain::supportsRegistration(domain::ContainerType::GENERIC));
    EXPECT_FALSE(domain::supportsRegistration(domain::ContainerType::SMARTCARD));
}

TEST(EnumsTest, BulkAction_Parse)
{
    EXPECT_EQ(domain::bulkActionFromString("deactivate"), domain::BulkAction::DEACTIVATE);
    EXPECT_FALSE(domain::bulkActionFromString("reset").has_value());
}

TEST(ContainerErrorTest, NotFound_CarriesCodeAndMessage)
{
    auto error = domain::ContainerError::notFound("Container X");
    EXPECT_EQ(error.code(), domain::ErrorCode::NOT_FOUND);
    EXPECT_STREQ(error.what(), "Container X not found");
    EXPECT_EQ(domain::toString(domain::ErrorCode::TEMPLATE_IN_USE), "TEMPLATE_IN_USE");
}

// ============================================================================
// Container
// ============================================================================

TEST(ContainerTest, StateNames_OperationalFirstThenMarkers)
{
    domain::Container container("CONT00000001", domain::ContainerType::GENERIC);
    container.operationalState = domain::OperationalState::DISABLED;
    container.markers.insert(domain::ConditionMarker::DAMAGED);
    container.markers.insert(domain::ConditionMarker::LOST);

    EXPECT_EQ(container.stateNames(), (std::vector<std::string>{"disabled", "lost", "damaged"}));
}

TEST(ContainerTest, AddRealm_KeepsOrderWithoutDuplicates)
{
    domain::Container container("CONT00000001", domain::ContainerType::GENERIC);
    container.addRealm("b");
    container.addRealm("a");
    container.addRealm("b");
    container.addRealm("");

    EXPECT_EQ(container.realms, (std::vector<std::string>{"b", "a"}));
    EXPECT_TRUE(container.hasRealm("a"));
}

// ============================================================================
// Состояние регистрации
// ============================================================================

TEST(RegistrationStateTest, EffectiveState_PendingExpiresLazily)
{
    auto issued = domain::Timestamp::fromEpochMicros(1700000000LL * 1000000);
    domain::RegistrationChallenge challenge;
    challenge.issuedAt = issued;
    challenge.expiresAt = issued.plus(std::chrono::seconds(600));

    auto stateAt = [&](int seconds, int grace) {
        return domain::effectiveRegistrationState(domain::RegistrationState::PENDING, challenge,
            issued.plus(std::chrono::seconds(seconds)), std::chrono::seconds(grace));
    };

    EXPECT_EQ(stateAt(600, 0), domain::RegistrationState::PENDING);
    EXPECT_EQ(stateAt(601, 0), domain::RegistrationState::EXPIRED);
    EXPECT_EQ(stateAt(601, 5), domain::RegistrationState::PENDING);
    EXPECT_EQ(domain::effectiveRegistrationState(domain::RegistrationState::PENDING, std::nullopt,
        issued, std::chrono::seconds(0)), domain::RegistrationState::EXPIRED);
    EXPECT_EQ(domain::effectiveRegistrationState(domain::RegistrationState::REGISTERED, std::nullopt,
        issued, std::chrono::seconds(0)), domain::RegistrationState::REGISTERED);
}

TEST(TimestampTest, ToString_Iso8601Utc)
{
    EXPECT_EQ(domain::Timestamp::fromEpochMicros(1700000000LL * 1000000).toString(), "2023-11-14T22:13:20Z");
}

// ============================================================================
// StringUtils
// ============================================================================

TEST(StringUtilsTest, SplitList_TrimsAndDropsEmpty)
{
    EXPECT_EQ(utils::splitList(" a, b,,c ,"), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(utils::splitList("").empty());
}

TEST(StringUtilsTest, PathSegments_IgnoresQueryAndSlashes)
{
    EXPECT_EQ(utils::pathSegments("/container/SMPH1/add?x=1"),
              (std::vector<std::string>{"container", "SMPH1", "add"}));
    EXPECT_EQ(utils::pathSegments("//container/"), std::vector<std::string>{"container"});
    EXPECT_TRUE(utils::pathSegments("/").empty());
}

TEST(StringUtilsTest, WildcardMatch)
{
    EXPECT_TRUE(utils::wildcardMatch("SMPH*", "SMPH0001"));
    EXPECT_TRUE(utils::wildcardMatch("*01", "SMPH0001"));
    EXPECT_TRUE(utils::wildcardMatch("S*0*1", "SMPH0001"));
    EXPECT_TRUE(utils::wildcardMatch("*", ""));
    EXPECT_FALSE(utils::wildcardMatch("SMPH*", "CONT0001"));
    EXPECT_FALSE(utils::wildcardMatch("SMPH", "SMPH0001"));
}

TEST(StringUtilsTest, UrlEncode_KeepsUnreserved)
{
    EXPECT_EQ(utils::urlEncode("a-b_c.d~e"), "a-b_c.d~e");
    EXPECT_EQ(utils::urlEncode("Your PIN?"), "Your%20PIN%3F");
    EXPECT_EQ(utils::urlEncode("12:00"), "12%3A00");
    EXPECT_EQ(utils::urlEncode("team/tokens"), "team/tokens");
    EXPECT_EQ(utils::urlEncode("a&b=c/d"), "a%26b%3Dc/d");
}

TEST(StringUtilsTest, ParseFlag)
{
    EXPECT_TRUE(utils::parseFlag("1"));
    EXPECT_TRUE(utils::parseFlag("True"));
    EXPECT_FALSE(utils::parseFlag("0"));
    EXPECT_FALSE(utils::parseFlag(""));
}

// ============================================================================
// CryptoUtils / SerialGenerator
// ============================================================================

TEST(CryptoUtilsTest, Sha256Hex_KnownVector)
{
    EXPECT_EQ(utils::CryptoUtils::sha256Hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(CryptoUtilsTest, RandomHex_LengthAndUniqueness)
{
    auto a = utils::CryptoUtils::randomHex(32);
    auto b = utils::CryptoUtils::randomHex(32);
    EXPECT_EQ(a.size(), 64u);
    EXPECT_NE(a, b);
    EXPECT_TRUE(std::regex_match(a, std::regex("[0-9a-f]+")));
}

TEST(CryptoUtilsTest, ConstantTimeEquals)
{
    EXPECT_TRUE(utils::CryptoUtils::constantTimeEquals("nonce", "nonce"));
    EXPECT_FALSE(utils::CryptoUtils::constantTimeEquals("nonce", "nonce2"));
    EXPECT_FALSE(utils::CryptoUtils::constantTimeEquals("nonce", "Nonce"));
}

TEST(SerialGeneratorTest, PrefixAndEightHexDigits)
{
    std::set<std::string> serials;
    for (int i = 0; i < 100; ++i) {
        auto serial = utils::SerialGenerator::generate("SMPH");
        EXPECT_TRUE(std::regex_match(serial, std::regex("SMPH[0-9A-F]{8}"))) << serial;
        serials.insert(serial);
    }
    EXPECT_GT(serials.size(), 95u);
}
