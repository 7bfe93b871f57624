/**
 * @file TemplateConcurrencyTest.cpp
 * @brief Шаблоны и контейнеры под параллельной записью
 */

#include <gtest/gtest.h>

#include "../mocks/TestEnvironment.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <thread>

using namespace containers;
using namespace containers::tests;
using namespace std::chrono_literals;

namespace
{

    /**
     * @brief Репозиторий контейнеров, который один раз выполняет hook при чтении заданного serial
     *
     * Позволяет вклинить другую операцию между чтением и записью сервиса.
     */
    class InterleavingContainerRepository : public ports::output::IContainerRepository
    {
    public:
        void interleaveOnRead(const std::string &serial, std::function<void()> hook)
        {
            target_ = serial;
            hook_ = std::move(hook);
            armed_ = true;
        }

        void save(const domain::Container &container) override { inner_.save(container); }

        std::optional<domain::Container> findBySerial(const std::string &serial) override
        {
            auto found = inner_.findBySerial(serial);
            if (serial == target_ && armed_.exchange(false))
            {
                hook_();
            }
            return found;
        }

        std::vector<domain::Container> findAll() override { return inner_.findAll(); }
        std::vector<domain::Container> findByTemplate(const std::string &name) override { return inner_.findByTemplate(name); }
        bool exists(const std::string &serial) override { return inner_.exists(serial); }
        bool remove(const std::string &serial) override { return inner_.remove(serial); }

    private:
        adapters::secondary::InMemoryContainerRepository inner_;
        std::string target_;
        std::function<void()> hook_;
        std::atomic<bool> armed_{false};
    };

    domain::ContainerTemplate emptyTemplate(const std::string &name, domain::ContainerType type)
    {
        domain::ContainerTemplate tmpl;
        tmpl.name = name;
        tmpl.containerType = type;
        return tmpl;
    }

} // namespace

class TemplateConcurrencyTest : public ::testing::Test
{
protected:
    std::shared_ptr<FakeClock> clock = std::make_shared<FakeClock>();
    std::shared_ptr<application::EntityLockManager> locks = std::make_shared<application::EntityLockManager>();
    std::shared_ptr<application::MetricsService> metrics =
        std::make_shared<application::MetricsService>(std::make_shared<settings::MetricsSettings>());
    std::shared_ptr<InterleavingContainerRepository> containerRepo = std::make_shared<InterleavingContainerRepository>();

    std::shared_ptr<application::TokenRegistry> tokens = std::make_shared<application::TokenRegistry>(
        std::make_shared<adapters::secondary::InMemoryTokenRepository>(), locks, clock, metrics);
    std::shared_ptr<application::TemplateService> templates = std::make_shared<application::TemplateService>(
        std::make_shared<adapters::secondary::InMemoryTemplateRepository>(), containerRepo, tokens, locks, clock);
    std::shared_ptr<application::ContainerService> containers = std::make_shared<application::ContainerService>(
        containerRepo, tokens, templates,
        std::make_shared<adapters::secondary::InMemoryChallengeRepository>(),
        locks, clock, metrics,
        std::make_shared<settings::RegistrationSettings>("https://pi.example.com/", 10, 0));

    std::string createFromTemplate(const std::string &type, const std::string &templateName)
    {
        ports::input::CreateContainerRequest request;
        request.type = type;
        request.templateName = templateName;
        return containers->createContainer(request).serial;
    }
};

TEST_F(TemplateConcurrencyTest, DeleteTemplate_DuringContainerWrite_ReferenceStaysCleared)
{
    templates->createTemplate(emptyTemplate("T1", domain::ContainerType::GENERIC));
    auto serial = createFromTemplate("generic", "T1");

    // Удаление шаблона стартует, когда setDescription уже прочитал контейнер
    std::future<bool> deleting;
    containerRepo->interleaveOnRead(serial, [&]() {
        deleting = std::async(std::launch::async, [&]() { return templates->deleteTemplate("T1"); });
        deleting.wait_for(200ms);
    });

    containers->setDescription(serial, "renamed");
    EXPECT_TRUE(deleting.get());

    auto container = containers->getContainer(serial);
    EXPECT_FALSE(templates->getTemplate("T1").has_value());
    EXPECT_FALSE(container.templateName.has_value());
    EXPECT_EQ(container.description, "renamed");
}

TEST_F(TemplateConcurrencyTest, CreateContainer_WaitsForTemplateLock)
{
    templates->createTemplate(emptyTemplate("T1", domain::ContainerType::GENERIC));

    auto held = locks->lockTemplate("T1");
    auto creating = std::async(std::launch::async, [&]() { return createFromTemplate("generic", "T1"); });
    EXPECT_EQ(creating.wait_for(100ms), std::future_status::timeout);

    held = application::EntityLockManager::Guard();
    auto serial = creating.get();
    EXPECT_EQ(containers->getContainer(serial).templateName, std::optional<std::string>("T1"));
}

TEST_F(TemplateConcurrencyTest, TypeChangeRacingCreate_NeverLeavesMismatchedReference)
{
    templates->createTemplate(emptyTemplate("T1", domain::ContainerType::GENERIC));

    std::atomic<bool> stop{false};
    std::thread creator([&]() {
        while (!stop) {
            try {
                createFromTemplate("generic", "T1");
            } catch (const domain::ContainerError &e) {
                EXPECT_EQ(e.code(), domain::ErrorCode::TYPE_MISMATCH);
            }
        }
    });

    int changed = 0;
    for (int i = 0; i < 200 && changed == 0; ++i) {
        try {
            templates->updateTemplate(emptyTemplate("T1", domain::ContainerType::SMARTPHONE));
            ++changed;
        } catch (const domain::ContainerError &e) {
            EXPECT_EQ(e.code(), domain::ErrorCode::TEMPLATE_IN_USE);
        }
    }
    stop = true;
    creator.join();

    auto current = templates->getTemplate("T1");
    ASSERT_TRUE(current.has_value());
    for (const auto &container : containerRepo->findByTemplate("T1")) {
        EXPECT_EQ(container.type, current->containerType) << container.serial;
    }
}
