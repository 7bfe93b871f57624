#pragma once

#include "domain/Container.hpp"
#include <string>
#include <optional>
#include <vector>

namespace containers::ports::output {

/**
 * @brief Интерфейс репозитория контейнеров
 *
 * Список токенов контейнера здесь не хранится:
 * привязка живёт в репозитории токенов.
 */
class IContainerRepository {
public:
    virtual ~IContainerRepository() = default;

    /// Вставка или полная перезапись (realms и info тоже)
    virtual void save(const domain::Container& container) = 0;
    virtual std::optional<domain::Container> findBySerial(const std::string& serial) = 0;
    virtual std::vector<domain::Container> findAll() = 0;
    virtual std::vector<domain::Container> findByTemplate(const std::string& templateName) = 0;
    virtual bool exists(const std::string& serial) = 0;
    virtual bool remove(const std::string& serial) = 0;
};

} // namespace containers::ports::output
