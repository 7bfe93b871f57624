#pragma once

#include "domain/Container.hpp"
#include "domain/ContainerQuery.hpp"
#include "domain/BatchResult.hpp"
#include "domain/Owner.hpp"
#include <string>
#include <optional>
#include <vector>
#include <map>

namespace containers::ports::input {

/**
 * @brief Запрос на создание контейнера
 */
struct CreateContainerRequest {
    std::string type;
    std::optional<domain::Owner> owner;
    std::string description;
    std::optional<std::string> templateName;
};

/**
 * @brief Результат создания: serial и поштучный итог выпуска токенов по шаблону
 */
struct CreateContainerResult {
    std::string serial;
    domain::BatchResult tokens;
};

/**
 * @brief Реестр контейнеров
 *
 * Все методы, кроме createContainer и listContainers, бросают
 * ContainerError NOT_FOUND для неизвестного serial.
 */
class IContainerService {
public:
    virtual ~IContainerService() = default;

    /**
     * @brief Создать контейнер, при наличии шаблона выпустить и привязать его токены
     *
     * Ошибки выпуска отдельных токенов не откатывают контейнер.
     */
    virtual CreateContainerResult createContainer(const CreateContainerRequest& request) = 0;

    virtual domain::Container getContainer(const std::string& serial) = 0;

    virtual domain::ContainerPage listContainers(const domain::ContainerQuery& query) = 0;

    /**
     * @brief Заменить набор realm; realm владельца сохраняется всегда
     * @return Итоговый набор realm
     */
    virtual std::vector<std::string> setRealms(
        const std::string& serial,
        const std::vector<std::string>& realms
    ) = 0;

    /**
     * @brief Добавить realm к текущему набору
     * @return realm -> назначен ли он этим вызовом (false для уже назначенного или пустого)
     */
    virtual std::map<std::string, bool> addRealms(
        const std::string& serial,
        const std::vector<std::string>& realms
    ) = 0;

    virtual void setDescription(const std::string& serial, const std::string& description) = 0;

    virtual void setInfo(const std::string& serial, const std::string& key, const std::string& value) = 0;

    /**
     * @brief Удалить ключ info (идемпотентно)
     * @return true если ключ был
     */
    virtual bool deleteInfo(const std::string& serial, const std::string& key) = 0;

    /**
     * @brief Назначить владельца
     * @throws ContainerError OWNERSHIP_CONFLICT без force при другом владельце
     *         контейнера или привязанного токена
     */
    virtual void assignUser(const std::string& serial, const domain::Owner& owner, bool force) = 0;

    /**
     * @return true если указанный владелец был снят
     */
    virtual bool unassignUser(const std::string& serial, const domain::Owner& owner) = 0;

    /**
     * @brief Установить состояния ("active"/"disabled" + отметки lost/damaged)
     * @return Для каждого переданного состояния: принято ли оно
     */
    virtual std::map<std::string, bool> setStates(
        const std::string& serial,
        const std::vector<std::string>& states
    ) = 0;

    /**
     * @brief Добавить состояния; прежние снимаются, только если новое их исключает
     *
     * active и disabled исключают друг друга, отметки lost/damaged копятся.
     */
    virtual std::map<std::string, bool> addStates(
        const std::string& serial,
        const std::vector<std::string>& states
    ) = 0;

    virtual void recordAuthentication(const std::string& serial) = 0;

    virtual void recordSynchronization(const std::string& serial) = 0;

    /**
     * @brief Привязать токен, отвязав его от прежнего контейнера
     * @return false если токен уже в этом контейнере
     */
    virtual bool addToken(const std::string& serial, const std::string& tokenSerial, bool force) = 0;

    /**
     * @return false если токен не привязан к этому контейнеру
     */
    virtual bool removeToken(const std::string& serial, const std::string& tokenSerial) = 0;

    /**
     * @brief Удалить контейнер
     * @param cascade Отвязать токены вместо ошибки HAS_BOUND_TOKENS
     * @param deleteTokens При cascade ещё и удалить токены
     */
    virtual void deleteContainer(const std::string& serial, bool cascade, bool deleteTokens) = 0;
};

} // namespace containers::ports::input
