#pragma once

#include "ports/input/ITemplateService.hpp"
#include "ports/input/ITokenRegistry.hpp"
#include "ports/output/ITemplateRepository.hpp"
#include "ports/output/IContainerRepository.hpp"
#include "ports/output/IClock.hpp"
#include "application/EntityLockManager.hpp"
#include "domain/ContainerError.hpp"

#include <memory>
#include <iostream>
#include <algorithm>

namespace containers::application {

/**
 * @brief Сервис шаблонов контейнеров
 *
 * Контейнеры хранят только имя шаблона, поэтому diff всегда
 * считается по текущей версии шаблона.
 */
class TemplateService : public ports::input::ITemplateService {
public:
    TemplateService(
        std::shared_ptr<ports::output::ITemplateRepository> templateRepo,
        std::shared_ptr<ports::output::IContainerRepository> containerRepo,
        std::shared_ptr<ports::input::ITokenRegistry> tokenRegistry,
        std::shared_ptr<EntityLockManager> locks,
        std::shared_ptr<ports::output::IClock> clock
    ) : templateRepo_(std::move(templateRepo))
      , containerRepo_(std::move(containerRepo))
      , tokenRegistry_(std::move(tokenRegistry))
      , locks_(std::move(locks))
      , clock_(std::move(clock))
    {
        std::cout << "[TemplateService] Created" << std::endl;
    }

    domain::ContainerTemplate createTemplate(const domain::ContainerTemplate& tmpl) override {
        validate(tmpl);

        auto guard = locks_->lock(defaultGroupLocks(tmpl));
        if (templateRepo_->exists(tmpl.name)) {
            throw domain::ContainerError(domain::ErrorCode::DUPLICATE_NAME,
                "Template " + tmpl.name + " already exists");
        }

        domain::ContainerTemplate created = tmpl;
        created.createdAt = clock_->now();
        if (created.isDefault) {
            clearOtherDefaults(created);
        }
        templateRepo_->save(created);

        std::cout << "[TemplateService] Created template " << created.name
                  << " for " << domain::toString(created.containerType) << std::endl;
        return created;
    }

    domain::ContainerTemplate updateTemplate(const domain::ContainerTemplate& tmpl) override {
        validate(tmpl);

        auto guard = locks_->lock(defaultGroupLocks(tmpl));
        auto existing = templateRepo_->findByName(tmpl.name);
        if (!existing) {
            throw domain::ContainerError::notFound("Template " + tmpl.name);
        }

        if (existing->containerType != tmpl.containerType
            && !containerRepo_->findByTemplate(tmpl.name).empty()) {
            throw domain::ContainerError(domain::ErrorCode::TEMPLATE_IN_USE,
                "Template " + tmpl.name + " is used by containers, its container type cannot change");
        }

        domain::ContainerTemplate updated = tmpl;
        updated.createdAt = existing->createdAt;
        if (updated.isDefault) {
            clearOtherDefaults(updated);
        }
        templateRepo_->save(updated);

        std::cout << "[TemplateService] Updated template " << updated.name << std::endl;
        return updated;
    }

    std::optional<domain::ContainerTemplate> getTemplate(const std::string& name) override {
        return templateRepo_->findByName(name);
    }

    std::vector<domain::ContainerTemplate> listTemplates(
        const std::optional<domain::ContainerType>& containerType
    ) override {
        std::vector<domain::ContainerTemplate> result;
        for (auto& tmpl : templateRepo_->findAll()) {
            if (!containerType || tmpl.containerType == *containerType) {
                result.push_back(std::move(tmpl));
            }
        }
        std::sort(result.begin(), result.end(),
            [](const auto& a, const auto& b) { return a.name < b.name; });
        return result;
    }

    /**
     * @brief Удалить шаблон и обнулить ссылки контейнеров на него
     *
     * Пока захвачен шаблон, новые ссылки на него не появляются (createContainer
     * тоже захватывает шаблон). Ссылки снимаются под блокировкой каждого контейнера
     * по свежей копии, чтобы не затереть параллельную запись.
     */
    bool deleteTemplate(const std::string& name) override {
        auto templateGuard = locks_->lockTemplate(name);
        if (!templateRepo_->exists(name)) {
            return false;
        }

        LockSet referencing;
        for (const auto& container : containerRepo_->findByTemplate(name)) {
            referencing.containers.insert(container.serial);
        }
        auto containerGuard = locks_->lock(referencing);

        templateRepo_->remove(name);
        size_t cleared = 0;
        for (const auto& serial : referencing.containers) {
            auto container = containerRepo_->findBySerial(serial);
            if (!container || container->templateName != name) {
                continue;
            }
            container->templateName.reset();
            containerRepo_->save(*container);
            ++cleared;
        }

        std::cout << "[TemplateService] Deleted template " << name
                  << ", cleared " << cleared << " container references" << std::endl;
        return true;
    }

    std::vector<domain::TokenSpec> instantiate(
        const std::string& templateName,
        const std::string& containerSerial
    ) override {
        auto tmpl = requireTemplate(templateName);
        auto container = containerRepo_->findBySerial(containerSerial);
        if (!container) {
            throw domain::ContainerError::notFound("Container " + containerSerial);
        }
        if (container->type != tmpl.containerType) {
            throw domain::ContainerError(domain::ErrorCode::TYPE_MISMATCH,
                "Template " + templateName + " is for " + domain::toString(tmpl.containerType)
                + " containers, not " + domain::toString(container->type));
        }

        std::vector<domain::TokenSpec> plan;
        for (const auto& spec : tmpl.tokens) {
            if (!spec.selected) {
                continue;
            }
            for (int i = 0; i < spec.count; ++i) {
                domain::TokenSpec single = spec;
                single.count = 1;
                plan.push_back(single);
            }
        }
        return plan;
    }

    domain::TemplateDiff diff(const std::string& templateName, const std::string& containerSerial) override {
        auto tmpl = requireTemplate(templateName);
        if (!containerRepo_->exists(containerSerial)) {
            throw domain::ContainerError::notFound("Container " + containerSerial);
        }
        return computeDiff(tmpl, containerSerial);
    }

    std::map<std::string, domain::TemplateDiff> compareAll(const std::string& templateName) override {
        auto tmpl = requireTemplate(templateName);

        std::map<std::string, domain::TemplateDiff> result;
        for (const auto& container : containerRepo_->findByTemplate(templateName)) {
            result[container.serial] = computeDiff(tmpl, container.serial);
        }
        return result;
    }

    std::vector<domain::ContainerTemplate> exportTemplates() override {
        return listTemplates(std::nullopt);
    }

    domain::BatchResult importTemplates(
        const std::vector<domain::ContainerTemplate>& templates,
        bool overwrite
    ) override {
        domain::BatchResult result;
        for (const auto& tmpl : templates) {
            try {
                if (templateRepo_->exists(tmpl.name)) {
                    if (!overwrite) {
                        result.fail(tmpl.name, "Template already exists");
                        continue;
                    }
                    updateTemplate(tmpl);
                    result.succeed(tmpl.name, "updated");
                } else {
                    createTemplate(tmpl);
                    result.succeed(tmpl.name, "created");
                }
            } catch (const domain::ContainerError& e) {
                result.fail(tmpl.name, e.what());
            }
        }

        std::cout << "[TemplateService] Imported " << result.items.size() - result.failures()
                  << "/" << result.items.size() << " templates" << std::endl;
        return result;
    }

private:
    std::shared_ptr<ports::output::ITemplateRepository> templateRepo_;
    std::shared_ptr<ports::output::IContainerRepository> containerRepo_;
    std::shared_ptr<ports::input::ITokenRegistry> tokenRegistry_;
    std::shared_ptr<EntityLockManager> locks_;
    std::shared_ptr<ports::output::IClock> clock_;

    domain::ContainerTemplate requireTemplate(const std::string& name) {
        auto tmpl = templateRepo_->findByName(name);
        if (!tmpl) {
            throw domain::ContainerError::notFound("Template " + name);
        }
        return *tmpl;
    }

    static void validate(const domain::ContainerTemplate& tmpl) {
        if (tmpl.name.empty()) {
            throw domain::ContainerError(domain::ErrorCode::INVALID_PARAMETER, "Template name is required");
        }
        // заняты маршрутами /container/templates/export|import
        if (tmpl.name == "export" || tmpl.name == "import" || tmpl.name.find('/') != std::string::npos) {
            throw domain::ContainerError(domain::ErrorCode::INVALID_PARAMETER,
                "Template name '" + tmpl.name + "' is reserved or contains '/'");
        }
        for (const auto& spec : tmpl.tokens) {
            if (spec.count < 1 || spec.count > domain::TokenSpec::MAX_COUNT) {
                throw domain::ContainerError(domain::ErrorCode::INVALID_PARAMETER,
                    "Token count must be between 1 and " + std::to_string(domain::TokenSpec::MAX_COUNT));
            }
            if (!domain::supportsTokenType(tmpl.containerType, spec.type)) {
                throw domain::ContainerError(domain::ErrorCode::INVALID_PARAMETER,
                    "Token type " + domain::toString(spec.type) + " is not supported by "
                    + domain::toString(tmpl.containerType) + " containers");
            }
        }
    }

    /**
     * @brief Шаблон и все шаблоны того же типа (default единственный на тип)
     */
    LockSet defaultGroupLocks(const domain::ContainerTemplate& tmpl) {
        LockSet set;
        set.templates.insert(tmpl.name);
        if (tmpl.isDefault) {
            for (const auto& other : templateRepo_->findAll()) {
                if (other.containerType == tmpl.containerType) {
                    set.templates.insert(other.name);
                }
            }
        }
        return set;
    }

    void clearOtherDefaults(const domain::ContainerTemplate& tmpl) {
        for (auto& other : templateRepo_->findAll()) {
            if (other.name != tmpl.name && other.isDefault && other.containerType == tmpl.containerType) {
                other.isDefault = false;
                templateRepo_->save(other);
            }
        }
    }

    /**
     * @brief Сравнение мультимножеств типов токенов
     *
     * added и matching идут в порядке шаблона, removed в порядке привязки.
     */
    domain::TemplateDiff computeDiff(const domain::ContainerTemplate& tmpl, const std::string& containerSerial) {
        std::vector<domain::TokenType> templateOrder;
        std::map<domain::TokenType, size_t> expected;
        for (const auto& spec : tmpl.tokens) {
            if (!spec.diffMarked) {
                continue;
            }
            if (expected.find(spec.type) == expected.end()) {
                templateOrder.push_back(spec.type);
            }
            expected[spec.type] += static_cast<size_t>(spec.count);
        }

        std::vector<domain::TokenType> containerOrder;
        std::map<domain::TokenType, size_t> actual;
        for (const auto& token : tokenRegistry_->findByContainer(containerSerial)) {
            if (actual.find(token.type) == actual.end()) {
                containerOrder.push_back(token.type);
            }
            actual[token.type] += 1;
        }

        domain::TemplateDiff diff;
        for (auto type : templateOrder) {
            size_t want = expected[type];
            size_t have = actual.count(type) ? actual[type] : 0;
            size_t common = std::min(want, have);
            diff.matching.insert(diff.matching.end(), common, domain::toString(type));
            diff.added.insert(diff.added.end(), want - common, domain::toString(type));
        }
        for (auto type : containerOrder) {
            size_t want = expected.count(type) ? expected[type] : 0;
            if (actual[type] > want) {
                diff.removed.insert(diff.removed.end(), actual[type] - want, domain::toString(type));
            }
        }
        return diff;
    }
};

} // namespace containers::application
