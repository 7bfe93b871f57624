#pragma once

#include "ports/output/ITemplateRepository.hpp"
#include <ThreadSafeMap.hpp>

namespace containers::adapters::secondary {

/**
 * @brief In-memory реализация репозитория шаблонов
 */
class InMemoryTemplateRepository : public ports::output::ITemplateRepository {
public:
    void save(const domain::ContainerTemplate& tmpl) override {
        templates_.insert(tmpl.name, std::make_shared<domain::ContainerTemplate>(tmpl));
    }

    std::optional<domain::ContainerTemplate> findByName(const std::string& name) override {
        auto tmpl = templates_.find(name);
        return tmpl ? std::optional(*tmpl) : std::nullopt;
    }

    std::vector<domain::ContainerTemplate> findAll() override {
        std::vector<domain::ContainerTemplate> result;
        for (const auto& tmpl : templates_.getAll()) {
            result.push_back(*tmpl);
        }
        return result;
    }

    bool exists(const std::string& name) override {
        return templates_.contains(name);
    }

    bool remove(const std::string& name) override {
        return templates_.remove(name);
    }

private:
    ThreadSafeMap<std::string, domain::ContainerTemplate> templates_;
};

} // namespace containers::adapters::secondary
