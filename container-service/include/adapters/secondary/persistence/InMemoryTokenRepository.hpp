#pragma once

#include "ports/output/ITokenRepository.hpp"
#include <map>
#include <shared_mutex>
#include <mutex>
#include <algorithm>

namespace containers::adapters::secondary {

/**
 * @brief In-memory реализация репозитория токенов
 *
 * Один shared_mutex на всё хранилище: detachAll проверяет
 * и меняет набор токенов под одной exclusive блокировкой.
 */
class InMemoryTokenRepository : public ports::output::ITokenRepository {
public:
    void save(const domain::Token& token) override {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        tokens_[token.serial] = token;
    }

    std::optional<domain::Token> findBySerial(const std::string& serial) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = tokens_.find(serial);
        return it != tokens_.end() ? std::optional(it->second) : std::nullopt;
    }

    std::vector<domain::Token> findByContainer(const std::string& containerSerial) override {
        std::vector<domain::Token> result;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            for (const auto& [serial, token] : tokens_) {
                if (token.containerSerial == containerSerial) {
                    result.push_back(token);
                }
            }
        }
        std::sort(result.begin(), result.end(), [](const domain::Token& a, const domain::Token& b) {
            if (!(a.boundAt == b.boundAt)) return a.boundAt < b.boundAt;
            return a.serial < b.serial;
        });
        return result;
    }

    std::vector<domain::Token> findAll() override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<domain::Token> result;
        for (const auto& [serial, token] : tokens_) {
            result.push_back(token);
        }
        return result;
    }

    bool exists(const std::string& serial) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return tokens_.count(serial) > 0;
    }

    bool remove(const std::string& serial) override {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return tokens_.erase(serial) > 0;
    }

    bool detachAll(
        const std::string& containerSerial,
        const std::vector<std::string>& serials,
        bool deleteTokens
    ) override {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (const auto& serial : serials) {
            auto it = tokens_.find(serial);
            if (it == tokens_.end() || it->second.containerSerial != containerSerial) {
                return false;
            }
        }
        for (const auto& serial : serials) {
            if (deleteTokens) {
                tokens_.erase(serial);
            } else {
                tokens_[serial].containerSerial.reset();
            }
        }
        return true;
    }

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, domain::Token> tokens_;
};

} // namespace containers::adapters::secondary
