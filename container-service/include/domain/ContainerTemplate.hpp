#pragma once

#include "enums/ContainerType.hpp"
#include "enums/TokenType.hpp"
#include "Timestamp.hpp"
#include <string>
#include <vector>
#include <map>

namespace containers::domain {

/**
 * @brief Описание токенов одного типа в шаблоне
 */
struct TokenSpec {
    /// Верхняя граница count: шаблон выпускает токены синхронно под блокировкой контейнера
    static constexpr int MAX_COUNT = 100;

    TokenType type = TokenType::HOTP;
    int count = 1;
    std::map<std::string, std::string> settings;
    bool selected = true;    ///< "default": создаётся при инстанцировании
    bool diffMarked = true;  ///< "diff": участвует в сравнении с контейнером
};

/**
 * @brief Шаблон контейнера
 *
 * Контейнер хранит имя шаблона, сравнение всегда идёт
 * с текущей версией шаблона.
 */
struct ContainerTemplate {
    std::string name;
    ContainerType containerType = ContainerType::GENERIC;
    std::vector<TokenSpec> tokens;
    bool isDefault = false;
    Timestamp createdAt;
};

/**
 * @brief Результат сравнения шаблона с контейнером (типы токенов)
 */
struct TemplateDiff {
    std::vector<std::string> added;     ///< Есть в шаблоне, нет в контейнере
    std::vector<std::string> removed;   ///< Есть в контейнере, нет в шаблоне
    std::vector<std::string> matching;

    bool isEmpty() const { return added.empty() && removed.empty(); }
};

} // namespace containers::domain
