#pragma once

#include "ports/output/IChallengeRepository.hpp"
#include <ThreadSafeMap.hpp>

namespace containers::adapters::secondary {

/**
 * @brief In-memory хранилище challenge регистрации
 */
class InMemoryChallengeRepository : public ports::output::IChallengeRepository {
public:
    void save(const domain::RegistrationChallenge& challenge) override {
        challenges_.insert(challenge.containerSerial,
                           std::make_shared<domain::RegistrationChallenge>(challenge));
    }

    std::optional<domain::RegistrationChallenge> findByContainer(const std::string& containerSerial) override {
        auto challenge = challenges_.find(containerSerial);
        return challenge ? std::optional(*challenge) : std::nullopt;
    }

    bool remove(const std::string& containerSerial) override {
        return challenges_.remove(containerSerial);
    }

private:
    ThreadSafeMap<std::string, domain::RegistrationChallenge> challenges_;
};

} // namespace containers::adapters::secondary
