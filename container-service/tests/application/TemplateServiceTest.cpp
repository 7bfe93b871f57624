/**
 * @file TemplateServiceTest.cpp
 * @brief Unit-тесты для TemplateService
 */

#include <gtest/gtest.h>

#include <functional>
#include <limits>

#include "../mocks/TestEnvironment.hpp"

using namespace containers;
using namespace containers::tests;

class TemplateServiceTest : public ::testing::Test
{
protected:
    TestEnvironment env;

    static domain::TokenSpec spec(domain::TokenType type, int count = 1)
    {
        domain::TokenSpec s;
        s.type = type;
        s.count = count;
        return s;
    }

    static domain::ContainerTemplate makeTemplate(
        const std::string& name,
        domain::ContainerType type,
        std::vector<domain::TokenSpec> tokens,
        bool isDefault = false)
    {
        domain::ContainerTemplate tmpl;
        tmpl.name = name;
        tmpl.containerType = type;
        tmpl.tokens = std::move(tokens);
        tmpl.isDefault = isDefault;
        return tmpl;
    }

    domain::ErrorCode errorOf(const std::function<void()>& action)
    {
        try {
            action();
        } catch (const domain::ContainerError& e) {
            return e.code();
        }
        ADD_FAILURE() << "Expected ContainerError";
        return domain::ErrorCode::INVALID_PARAMETER;
    }
};

// ============================================================================
// Сценарий T1: смартфон из шаблона totp + push
// ============================================================================

TEST_F(TemplateServiceTest, T1_SmartphoneFromTemplate_MatchesTemplateExactly)
{
    env.templates->createTemplate(makeTemplate("T1", domain::ContainerType::SMARTPHONE,
        {spec(domain::TokenType::TOTP), spec(domain::TokenType::PUSH)}));

    ports::input::CreateContainerRequest request;
    request.type = "smartphone";
    request.templateName = "T1";
    auto created = env.containers->createContainer(request);

    EXPECT_TRUE(created.tokens.allSucceeded());
    auto tokens = env.tokens->findByContainer(created.serial);
    ASSERT_EQ(tokens.size(), 2u);
    int totp = 0, push = 0;
    for (const auto& token : tokens) {
        totp += token.type == domain::TokenType::TOTP;
        push += token.type == domain::TokenType::PUSH;
    }
    EXPECT_EQ(totp, 1);
    EXPECT_EQ(push, 1);

    auto diff = env.templates->diff("T1", created.serial);
    EXPECT_TRUE(diff.added.empty());
    EXPECT_TRUE(diff.removed.empty());
    EXPECT_EQ(diff.matching, (std::vector<std::string>{"totp", "push"}));
    EXPECT_TRUE(diff.isEmpty());
}

// ============================================================================
// create / update / delete
// ============================================================================

TEST_F(TemplateServiceTest, Create_DuplicateName_DuplicateName)
{
    env.templates->createTemplate(makeTemplate("base", domain::ContainerType::GENERIC, {}));

    EXPECT_EQ(errorOf([&] {
        env.templates->createTemplate(makeTemplate("base", domain::ContainerType::SMARTCARD, {}));
    }), domain::ErrorCode::DUPLICATE_NAME);
}

TEST_F(TemplateServiceTest, Create_InvalidSpecs_InvalidParameter)
{
    EXPECT_EQ(errorOf([&] {
        env.templates->createTemplate(makeTemplate("", domain::ContainerType::GENERIC, {}));
    }), domain::ErrorCode::INVALID_PARAMETER);

    EXPECT_EQ(errorOf([&] {
        env.templates->createTemplate(makeTemplate("zero", domain::ContainerType::GENERIC,
            {spec(domain::TokenType::HOTP, 0)}));
    }), domain::ErrorCode::INVALID_PARAMETER);

    EXPECT_EQ(errorOf([&] {
        env.templates->createTemplate(makeTemplate("card", domain::ContainerType::SMARTPHONE,
            {spec(domain::TokenType::YUBIKEY)}));
    }), domain::ErrorCode::INVALID_PARAMETER);

    EXPECT_EQ(errorOf([&] {
        env.templates->createTemplate(makeTemplate("export", domain::ContainerType::GENERIC, {}));
    }), domain::ErrorCode::INVALID_PARAMETER);

    EXPECT_EQ(errorOf([&] {
        env.templates->createTemplate(makeTemplate("a/b", domain::ContainerType::GENERIC, {}));
    }), domain::ErrorCode::INVALID_PARAMETER);

    EXPECT_TRUE(env.templates->listTemplates(std::nullopt).empty());
}

TEST_F(TemplateServiceTest, Create_CountAboveLimit_InvalidParameter)
{
    EXPECT_EQ(errorOf([&] {
        env.templates->createTemplate(makeTemplate("huge", domain::ContainerType::GENERIC,
            {spec(domain::TokenType::HOTP, std::numeric_limits<int>::max()),
             spec(domain::TokenType::HOTP, std::numeric_limits<int>::max())}));
    }), domain::ErrorCode::INVALID_PARAMETER);

    EXPECT_EQ(errorOf([&] {
        env.templates->createTemplate(makeTemplate("over", domain::ContainerType::GENERIC,
            {spec(domain::TokenType::HOTP, domain::TokenSpec::MAX_COUNT + 1)}));
    }), domain::ErrorCode::INVALID_PARAMETER);

    EXPECT_FALSE(env.templates->getTemplate("huge").has_value());
}

TEST_F(TemplateServiceTest, Diff_CountsAtLimit_SumPerType)
{
    env.templates->createTemplate(makeTemplate("many", domain::ContainerType::GENERIC,
        {spec(domain::TokenType::HOTP, domain::TokenSpec::MAX_COUNT),
         spec(domain::TokenType::HOTP, domain::TokenSpec::MAX_COUNT)}));
    auto serial = env.createContainer("generic");
    env.provisionInto(serial, "hotp");

    auto diff = env.templates->diff("many", serial);

    EXPECT_EQ(diff.matching.size(), 1u);
    EXPECT_EQ(diff.added.size(), static_cast<size_t>(2 * domain::TokenSpec::MAX_COUNT - 1));
    EXPECT_TRUE(diff.removed.empty());
}

TEST_F(TemplateServiceTest, Create_Default_IsUniquePerContainerType)
{
    env.templates->createTemplate(makeTemplate("first", domain::ContainerType::SMARTPHONE, {}, true));
    env.templates->createTemplate(makeTemplate("other", domain::ContainerType::GENERIC, {}, true));
    env.templates->createTemplate(makeTemplate("second", domain::ContainerType::SMARTPHONE, {}, true));

    EXPECT_FALSE(env.templates->getTemplate("first")->isDefault);
    EXPECT_TRUE(env.templates->getTemplate("second")->isDefault);
    EXPECT_TRUE(env.templates->getTemplate("other")->isDefault);
}

TEST_F(TemplateServiceTest, Update_TypeChangeWhileReferenced_TemplateInUse)
{
    env.templates->createTemplate(makeTemplate("phones", domain::ContainerType::SMARTPHONE,
        {spec(domain::TokenType::TOTP)}));
    env.createContainer("smartphone", std::nullopt, std::string("phones"));

    EXPECT_EQ(errorOf([&] {
        env.templates->updateTemplate(makeTemplate("phones", domain::ContainerType::GENERIC, {}));
    }), domain::ErrorCode::TEMPLATE_IN_USE);

    // Смена состава токенов без смены типа разрешена
    auto updated = env.templates->updateTemplate(makeTemplate("phones", domain::ContainerType::SMARTPHONE,
        {spec(domain::TokenType::HOTP, 2)}));
    EXPECT_EQ(updated.tokens.size(), 1u);
    EXPECT_EQ(env.templates->getTemplate("phones")->tokens[0].count, 2);
}

TEST_F(TemplateServiceTest, Update_Unknown_NotFound)
{
    EXPECT_EQ(errorOf([&] {
        env.templates->updateTemplate(makeTemplate("ghost", domain::ContainerType::GENERIC, {}));
    }), domain::ErrorCode::NOT_FOUND);
}

TEST_F(TemplateServiceTest, Delete_ClearsContainerReferences)
{
    env.templates->createTemplate(makeTemplate("tmp", domain::ContainerType::GENERIC, {}));
    auto serial = env.createContainer("generic", std::nullopt, std::string("tmp"));

    EXPECT_TRUE(env.templates->deleteTemplate("tmp"));
    EXPECT_FALSE(env.templates->deleteTemplate("tmp"));
    EXPECT_FALSE(env.containers->getContainer(serial).templateName.has_value());
}

TEST_F(TemplateServiceTest, List_FiltersByContainerTypeSortedByName)
{
    env.templates->createTemplate(makeTemplate("zeta", domain::ContainerType::SMARTCARD, {}));
    env.templates->createTemplate(makeTemplate("alpha", domain::ContainerType::SMARTCARD, {}));
    env.templates->createTemplate(makeTemplate("mid", domain::ContainerType::GENERIC, {}));

    auto cards = env.templates->listTemplates(domain::ContainerType::SMARTCARD);
    ASSERT_EQ(cards.size(), 2u);
    EXPECT_EQ(cards[0].name, "alpha");
    EXPECT_EQ(cards[1].name, "zeta");
    EXPECT_EQ(env.templates->listTemplates(std::nullopt).size(), 3u);
}

// ============================================================================
// instantiate / diff / compareAll
// ============================================================================

TEST_F(TemplateServiceTest, Instantiate_ExpandsCountAndSkipsUnselected)
{
    auto optional = spec(domain::TokenType::SMS);
    optional.selected = false;
    env.templates->createTemplate(makeTemplate("plan", domain::ContainerType::SMARTPHONE,
        {spec(domain::TokenType::HOTP, 2), optional, spec(domain::TokenType::PUSH)}));
    auto serial = env.createContainer("smartphone");

    auto plan = env.templates->instantiate("plan", serial);

    ASSERT_EQ(plan.size(), 3u);
    EXPECT_EQ(plan[0].type, domain::TokenType::HOTP);
    EXPECT_EQ(plan[1].type, domain::TokenType::HOTP);
    EXPECT_EQ(plan[2].type, domain::TokenType::PUSH);
    EXPECT_TRUE(env.tokens->list().empty());
}

TEST_F(TemplateServiceTest, Instantiate_ContainerOfOtherType_TypeMismatch)
{
    env.templates->createTemplate(makeTemplate("plan", domain::ContainerType::SMARTPHONE, {}));
    auto serial = env.createContainer("smartcard");

    EXPECT_EQ(errorOf([&] { env.templates->instantiate("plan", serial); }), domain::ErrorCode::TYPE_MISMATCH);
}

TEST_F(TemplateServiceTest, Diff_ReflectsCurrentTemplateVersion)
{
    env.templates->createTemplate(makeTemplate("T", domain::ContainerType::GENERIC,
        {spec(domain::TokenType::HOTP), spec(domain::TokenType::TOTP)}));
    auto serial = env.createContainer("generic", std::nullopt, std::string("T"));
    env.provisionInto(serial, "spass");

    env.templates->updateTemplate(makeTemplate("T", domain::ContainerType::GENERIC,
        {spec(domain::TokenType::HOTP, 2), spec(domain::TokenType::TOTP)}));

    auto diff = env.templates->diff("T", serial);
    EXPECT_EQ(diff.added, std::vector<std::string>{"hotp"});
    EXPECT_EQ(diff.removed, std::vector<std::string>{"spass"});
    EXPECT_EQ(diff.matching, (std::vector<std::string>{"hotp", "totp"}));
    EXPECT_FALSE(diff.isEmpty());
}

TEST_F(TemplateServiceTest, Diff_IgnoresSpecsNotMarkedForDiff)
{
    auto ignored = spec(domain::TokenType::TOTP);
    ignored.diffMarked = false;
    env.templates->createTemplate(makeTemplate("T", domain::ContainerType::GENERIC,
        {spec(domain::TokenType::HOTP), ignored}));
    auto serial = env.createContainer("generic");
    env.provisionInto(serial, "hotp");

    EXPECT_TRUE(env.templates->diff("T", serial).isEmpty());
}

TEST_F(TemplateServiceTest, CompareAll_CoversEveryReferencingContainer)
{
    env.templates->createTemplate(makeTemplate("T", domain::ContainerType::GENERIC,
        {spec(domain::TokenType::HOTP)}));
    auto a = env.createContainer("generic", std::nullopt, std::string("T"));
    auto b = env.createContainer("generic", std::nullopt, std::string("T"));
    env.createContainer("generic");
    env.bulk->bulkAction(b, "remove");

    auto result = env.templates->compareAll("T");

    ASSERT_EQ(result.size(), 2u);
    EXPECT_TRUE(result.at(a).isEmpty());
    EXPECT_EQ(result.at(b).added, std::vector<std::string>{"hotp"});
}

// ============================================================================
// export / import
// ============================================================================

TEST_F(TemplateServiceTest, Import_DuplicateWithoutOverwrite_FailsThatItemOnly)
{
    env.templates->createTemplate(makeTemplate("existing", domain::ContainerType::GENERIC, {}));

    auto result = env.templates->importTemplates({
        makeTemplate("existing", domain::ContainerType::GENERIC, {spec(domain::TokenType::HOTP)}),
        makeTemplate("fresh", domain::ContainerType::SMARTCARD, {spec(domain::TokenType::YUBIKEY)})
    }, false);

    ASSERT_EQ(result.items.size(), 2u);
    EXPECT_FALSE(result.items[0].success);
    EXPECT_TRUE(result.items[1].success);
    EXPECT_TRUE(env.templates->getTemplate("existing")->tokens.empty());
    EXPECT_TRUE(env.templates->getTemplate("fresh").has_value());
}

TEST_F(TemplateServiceTest, ExportImport_Overwrite_ReplacesTemplates)
{
    env.templates->createTemplate(makeTemplate("a", domain::ContainerType::GENERIC, {spec(domain::TokenType::HOTP)}));
    auto exported = env.templates->exportTemplates();
    env.templates->updateTemplate(makeTemplate("a", domain::ContainerType::GENERIC, {}));

    auto result = env.templates->importTemplates(exported, true);

    EXPECT_TRUE(result.allSucceeded());
    EXPECT_EQ(env.templates->getTemplate("a")->tokens.size(), 1u);
}
