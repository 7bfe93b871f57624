#pragma once

#include <string>

namespace containers::domain {

/**
 * @brief Владелец токена или контейнера: пользователь в realm
 */
struct Owner {
    std::string user;
    std::string realm;

    Owner() = default;
    Owner(std::string user, std::string realm)
        : user(std::move(user)), realm(std::move(realm)) {}

    bool operator==(const Owner& other) const {
        return user == other.user && realm == other.realm;
    }
    bool operator!=(const Owner& other) const { return !(*this == other); }

    std::string toString() const { return user + "@" + realm; }
};

} // namespace containers::domain
