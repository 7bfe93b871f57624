#pragma once

#include <string>
#include <cstdlib>

namespace containers::settings {

/**
 * @brief Общие настройки сервиса контейнеров
 *
 * Читает из ENV:
 * - CONTAINER_STORAGE (default: "postgres") - "postgres" или "memory"
 * - CONTAINER_PAGE_SIZE (default: 15)
 */
class ContainerSettings {
public:
    ContainerSettings() {
        if (const char* storage = std::getenv("CONTAINER_STORAGE")) {
            storage_ = storage;
        }
        if (const char* pageSize = std::getenv("CONTAINER_PAGE_SIZE")) {
            pageSize_ = std::stoi(pageSize);
        }
    }

    std::string getStorage() const { return storage_; }
    bool useInMemoryStorage() const { return storage_ == "memory"; }
    int getPageSize() const { return pageSize_; }

private:
    std::string storage_ = "postgres";
    int pageSize_ = 15;
};

} // namespace containers::settings
