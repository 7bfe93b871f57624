#pragma once

#include "domain/Token.hpp"
#include <string>
#include <optional>
#include <vector>

namespace containers::ports::output {

/**
 * @brief Интерфейс репозитория токенов
 */
class ITokenRepository {
public:
    virtual ~ITokenRepository() = default;

    virtual void save(const domain::Token& token) = 0;
    virtual std::optional<domain::Token> findBySerial(const std::string& serial) = 0;

    /// Токены контейнера в порядке привязки (boundAt, затем serial)
    virtual std::vector<domain::Token> findByContainer(const std::string& containerSerial) = 0;
    virtual std::vector<domain::Token> findAll() = 0;
    virtual bool exists(const std::string& serial) = 0;
    virtual bool remove(const std::string& serial) = 0;

    /**
     * @brief Отвязать (и при deleteTokens удалить) токены контейнера одной транзакцией
     *
     * Если хотя бы один serial не привязан к containerSerial,
     * ничего не меняется и возвращается false.
     */
    virtual bool detachAll(
        const std::string& containerSerial,
        const std::vector<std::string>& serials,
        bool deleteTokens) = 0;
};

} // namespace containers::ports::output
