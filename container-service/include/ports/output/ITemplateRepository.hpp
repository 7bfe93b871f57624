#pragma once

#include "domain/ContainerTemplate.hpp"
#include <string>
#include <optional>
#include <vector>

namespace containers::ports::output {

/**
 * @brief Интерфейс репозитория шаблонов контейнеров
 */
class ITemplateRepository {
public:
    virtual ~ITemplateRepository() = default;

    virtual void save(const domain::ContainerTemplate& tmpl) = 0;
    virtual std::optional<domain::ContainerTemplate> findByName(const std::string& name) = 0;
    virtual std::vector<domain::ContainerTemplate> findAll() = 0;
    virtual bool exists(const std::string& name) = 0;
    virtual bool remove(const std::string& name) = 0;
};

} // namespace containers::ports::output
