#pragma once

#include <string>
#include <random>
#include <sstream>
#include <iomanip>
#include <cstdint>

namespace containers::utils {

/**
 * @brief Генератор serial номеров токенов и контейнеров
 *
 * Формат: PREFIX + 8 hex цифр в верхнем регистре (например, SMPH00A1B2C3).
 * Уникальность проверяет вызывающий по своему репозиторию.
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class SerialGenerator {
public:
    static std::string generate(const std::string& prefix) {
        thread_local std::random_device rd;
        thread_local std::mt19937 gen(rd());
        std::uniform_int_distribution<uint32_t> dist;

        std::ostringstream ss;
        ss << prefix << std::hex << std::uppercase << std::setfill('0') << std::setw(8) << dist(gen);
        return ss.str();
    }
};

} // namespace containers::utils
