#pragma once

#include "domain/Token.hpp"
#include "domain/Owner.hpp"
#include <string>
#include <map>
#include <optional>
#include <vector>

namespace containers::ports::input {

/**
 * @brief Результат выпуска токена
 *
 * Ошибки provisioning не бросаются: пакетные операции
 * собирают их поштучно.
 */
struct ProvisionResult {
    bool success = false;
    std::string serial;
    std::string message;
};

/**
 * @brief Реестр токенов
 *
 * Хранит токены и их привязку к контейнеру.
 * OTP криптография вне его ответственности.
 */
class ITokenRegistry {
public:
    virtual ~ITokenRegistry() = default;

    /**
     * @brief Выпустить новый токен
     * @param type Тип токена строкой ("totp", "push", ...)
     * @param settings Настройки (otplen, hashlib, timeStep, ...)
     * @param owner Владелец, если есть
     */
    virtual ProvisionResult provision(
        const std::string& type,
        const std::map<std::string, std::string>& settings,
        const std::optional<domain::Owner>& owner
    ) = 0;

    /**
     * @brief Привязать токен к контейнеру (перезаписывает прежнюю привязку)
     * @throws ContainerError NOT_FOUND если токена нет
     */
    virtual void bindToContainer(const std::string& tokenSerial, const std::string& containerSerial) = 0;

    /**
     * @brief Отвязать токен
     * @return true если токен был привязан
     */
    virtual bool unbind(const std::string& tokenSerial) = 0;

    /**
     * @brief Изменить активность токена
     * @return true если состояние изменилось
     * @throws ContainerError NOT_FOUND если токена нет
     */
    virtual bool setActive(const std::string& tokenSerial, bool active) = 0;

    /**
     * @brief Удалить токен
     */
    virtual bool remove(const std::string& tokenSerial) = 0;

    /**
     * @brief Атомарно отвязать (и удалить) набор токенов контейнера
     * @return false если хоть один serial не привязан к контейнеру (ничего не изменено)
     */
    virtual bool detachAll(
        const std::string& containerSerial,
        const std::vector<std::string>& serials,
        bool deleteTokens
    ) = 0;

    virtual std::optional<domain::Token> find(const std::string& serial) = 0;
    virtual std::vector<domain::Token> findByContainer(const std::string& containerSerial) = 0;
    virtual std::vector<domain::Token> list() = 0;
};

} // namespace containers::ports::input
