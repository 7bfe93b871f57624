#pragma once

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>

#include <string>
#include <vector>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace containers::utils {

/**
 * @brief Криптографические примитивы регистрации (OpenSSL)
 */
class CryptoUtils {
public:
    /**
     * @brief Случайный секрет в hex (CSPRNG)
     * @throws std::runtime_error если RAND_bytes не смог выдать энтропию
     */
    static std::string randomHex(size_t bytes) {
        std::vector<unsigned char> buffer(bytes);
        if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
            throw std::runtime_error("RAND_bytes failed");
        }
        return toHex(buffer.data(), buffer.size());
    }

    /**
     * @brief SHA-256 строки в hex
     */
    static std::string sha256Hex(const std::string& data) {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int length = 0;
        if (EVP_Digest(data.data(), data.size(), digest, &length, EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("EVP_Digest(SHA-256) failed");
        }
        return toHex(digest, length);
    }

    /**
     * @brief Сравнение за постоянное время (для nonce и хэшей)
     */
    static bool constantTimeEquals(const std::string& a, const std::string& b) {
        if (a.size() != b.size()) {
            return false;
        }
        return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
    }

private:
    static std::string toHex(const unsigned char* data, size_t size) {
        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        for (size_t i = 0; i < size; ++i) {
            ss << std::setw(2) << static_cast<int>(data[i]);
        }
        return ss.str();
    }
};

} // namespace containers::utils
