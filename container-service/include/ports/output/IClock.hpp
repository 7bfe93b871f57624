#pragma once

#include "domain/Timestamp.hpp"

namespace containers::ports::output {

/**
 * @brief Источник времени (подменяется в тестах)
 */
class IClock {
public:
    virtual ~IClock() = default;
    virtual domain::Timestamp now() const = 0;
};

} // namespace containers::ports::output
