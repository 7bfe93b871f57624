#pragma once

#include "ports/output/IContainerRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>

namespace containers::adapters::secondary {

/**
 * @brief In-memory реализация репозитория контейнеров
 */
class InMemoryContainerRepository : public ports::output::IContainerRepository {
public:
    void save(const domain::Container& container) override {
        auto stored = std::make_shared<domain::Container>(container);
        stored->tokenSerials.clear();
        containers_.insert(container.serial, stored);
    }

    std::optional<domain::Container> findBySerial(const std::string& serial) override {
        auto container = containers_.find(serial);
        return container ? std::optional(*container) : std::nullopt;
    }

    std::vector<domain::Container> findAll() override {
        std::vector<domain::Container> result;
        for (const auto& container : containers_.getAll()) {
            result.push_back(*container);
        }
        std::sort(result.begin(), result.end(),
            [](const auto& a, const auto& b) { return a.serial < b.serial; });
        return result;
    }

    std::vector<domain::Container> findByTemplate(const std::string& templateName) override {
        auto all = findAll();
        std::vector<domain::Container> result;
        std::copy_if(all.begin(), all.end(), std::back_inserter(result),
            [&templateName](const domain::Container& c) { return c.templateName == templateName; });
        return result;
    }

    bool exists(const std::string& serial) override {
        return containers_.contains(serial);
    }

    bool remove(const std::string& serial) override {
        return containers_.remove(serial);
    }

private:
    ThreadSafeMap<std::string, domain::Container> containers_;
};

} // namespace containers::adapters::secondary
