#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace ordering::utils {

/**
 * @brief UUID v4 для заказов и интеграционных событий
 *
 * Генератор thread_local, поэтому вызов безопасен из любого потока.
 */
class UuidGenerator {
public:
    /**
     * @brief xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
     */
    static std::string generate() {
        thread_local std::mt19937_64 gen(std::random_device{}());
        std::uniform_int_distribution<uint64_t> dist;

        std::array<uint8_t, 16> bytes{};
        uint64_t hi = dist(gen);
        uint64_t lo = dist(gen);
        for (size_t i = 0; i < 8; ++i) {
            bytes[i] = static_cast<uint8_t>(hi >> (56 - 8 * i));
            bytes[8 + i] = static_cast<uint8_t>(lo >> (56 - 8 * i));
        }
        bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

        static const char* hex = "0123456789abcdef";
        std::string out;
        out.reserve(36);
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                out.push_back('-');
            }
            out.push_back(hex[bytes[i] >> 4]);
            out.push_back(hex[bytes[i] & 0x0F]);
        }
        return out;
    }

    /**
     * @brief UUID с префиксом, например "ord-3f2a..."
     */
    static std::string generateWithPrefix(const std::string& prefix) {
        return prefix + "-" + generate();
    }
};

} // namespace ordering::utils
