#pragma once

#include "domain/ContainerTemplate.hpp"
#include "domain/BatchResult.hpp"
#include <string>
#include <optional>
#include <vector>
#include <map>

namespace containers::ports::input {

/**
 * @brief Шаблоны контейнеров
 */
class ITemplateService {
public:
    virtual ~ITemplateService() = default;

    /**
     * @throws ContainerError DUPLICATE_NAME, INVALID_PARAMETER
     */
    virtual domain::ContainerTemplate createTemplate(const domain::ContainerTemplate& tmpl) = 0;

    /**
     * @throws ContainerError NOT_FOUND; TEMPLATE_IN_USE при смене типа
     *         контейнера, если на шаблон ссылаются контейнеры
     */
    virtual domain::ContainerTemplate updateTemplate(const domain::ContainerTemplate& tmpl) = 0;

    virtual std::optional<domain::ContainerTemplate> getTemplate(const std::string& name) = 0;

    virtual std::vector<domain::ContainerTemplate> listTemplates(
        const std::optional<domain::ContainerType>& containerType
    ) = 0;

    /**
     * @brief Удалить шаблон и ссылки на него у контейнеров
     * @return false если шаблона нет
     */
    virtual bool deleteTemplate(const std::string& name) = 0;

    /**
     * @brief План выпуска: выбранные спецификации, развёрнутые по count
     *
     * Токены не создаёт.
     */
    virtual std::vector<domain::TokenSpec> instantiate(
        const std::string& templateName,
        const std::string& containerSerial
    ) = 0;

    /**
     * @brief Сравнить текущую версию шаблона с токенами контейнера
     */
    virtual domain::TemplateDiff diff(const std::string& templateName, const std::string& containerSerial) = 0;

    /**
     * @brief diff для всех контейнеров, созданных из шаблона (serial -> diff)
     */
    virtual std::map<std::string, domain::TemplateDiff> compareAll(const std::string& templateName) = 0;

    virtual std::vector<domain::ContainerTemplate> exportTemplates() = 0;

    /**
     * @brief Импорт пачки шаблонов; поштучный результат по имени шаблона
     */
    virtual domain::BatchResult importTemplates(
        const std::vector<domain::ContainerTemplate>& templates,
        bool overwrite
    ) = 0;
};

} // namespace containers::ports::input
