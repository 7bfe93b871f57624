#pragma once

#include "Container.hpp"
#include <string>
#include <vector>
#include <optional>

namespace containers::domain {

/**
 * @brief Фильтр и пагинация списка контейнеров
 *
 * serial, type, user, realm и description допускают '*' как wildcard.
 * type сравнивается с именем типа ("smartphone").
 */
struct ContainerQuery {
    std::optional<std::string> serial;
    std::optional<std::string> type;
    std::optional<std::string> user;
    std::optional<std::string> realm;
    std::optional<std::string> description;
    std::optional<std::string> tokenSerial;
    std::optional<std::string> templateName;
    std::string sortBy = "serial";    ///< serial | type | description
    bool sortDescending = false;
    int page = 1;                     ///< С единицы
    int pageSize = 15;
};

/**
 * @brief Страница контейнеров
 */
struct ContainerPage {
    std::vector<Container> containers;
    size_t count = 0;                 ///< Всего под фильтром
    int current = 1;
    std::optional<int> prev;
    std::optional<int> next;
};

} // namespace containers::domain
