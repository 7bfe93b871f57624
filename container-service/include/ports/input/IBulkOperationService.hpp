#pragma once

#include "domain/BatchResult.hpp"
#include <string>
#include <vector>

namespace containers::ports::input {

/**
 * @brief Пакетные операции над токенами контейнера
 *
 * activate/deactivate выполняются поштучно (частичный успех допустим),
 * удаление выполняется одним атомарным вызовом реестра токенов.
 */
class IBulkOperationService {
public:
    virtual ~IBulkOperationService() = default;

    /**
     * @brief Применить действие ко всем токенам контейнера
     * @param action "activate" | "deactivate" | "remove"
     * @throws ContainerError UNSUPPORTED_ACTION для другого действия
     */
    virtual domain::BatchResult bulkAction(const std::string& serial, const std::string& action) = 0;

    /**
     * @brief Отвязать перечисленные токены (все или ни одного)
     * @throws ContainerError INVALID_PARAMETER если хоть один не привязан к контейнеру
     */
    virtual domain::BatchResult removeTokens(
        const std::string& serial,
        const std::vector<std::string>& tokenSerials,
        bool deleteTokens
    ) = 0;
};

} // namespace containers::ports::input
