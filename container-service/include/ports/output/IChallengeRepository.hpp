#pragma once

#include "domain/RegistrationChallenge.hpp"
#include <string>
#include <optional>

namespace containers::ports::output {

/**
 * @brief Хранилище challenge регистрации (не больше одного на контейнер)
 */
class IChallengeRepository {
public:
    virtual ~IChallengeRepository() = default;

    /// Заменяет предыдущий challenge контейнера
    virtual void save(const domain::RegistrationChallenge& challenge) = 0;
    virtual std::optional<domain::RegistrationChallenge> findByContainer(const std::string& containerSerial) = 0;
    virtual bool remove(const std::string& containerSerial) = 0;
};

} // namespace containers::ports::output
