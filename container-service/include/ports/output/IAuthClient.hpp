#pragma once

#include <string>
#include <optional>

namespace containers::ports::output {

/**
 * @brief Результат валидации токена
 */
struct TokenValidationResult {
    bool valid = false;
    std::string message;
    std::string userId;
};

/**
 * @brief Интерфейс клиента к Auth Service
 *
 * Используется для проверки bearer токена администратора.
 */
class IAuthClient {
public:
    virtual ~IAuthClient() = default;

    /**
     * @brief Валидировать access token
     * @param token Access token
     * @return Результат валидации с user_id
     */
    virtual TokenValidationResult validateAccessToken(const std::string& token) = 0;

    /**
     * @brief Извлечь user_id из токена
     * @return user_id или nullopt если токен невалидный
     */
    virtual std::optional<std::string> getUserIdFromToken(const std::string& token) = 0;
};

} // namespace containers::ports::output
