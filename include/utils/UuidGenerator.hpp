#pragma once

#include <cstdint>
#include <string>
#include <random>
#include <sstream>
#include <iomanip>

namespace bullion::utils {

/**
 * @brief Генератор идентификаторов ордеров и задач
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class UuidGenerator {
public:
    /**
     * @brief Генерирует UUID v4
     *
     * Формат: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
     * где x - hex digit, y - один из [8, 9, a, b]
     */
    static std::string generate() {
        auto& gen = engine();
        std::uniform_int_distribution<uint64_t> dist;

        uint64_t part1 = dist(gen);
        uint64_t part2 = dist(gen);

        std::ostringstream ss;
        ss << std::hex << std::setfill('0');

        ss << std::setw(8) << ((part1 >> 32) & 0xFFFFFFFF) << "-";
        ss << std::setw(4) << ((part1 >> 16) & 0xFFFF) << "-";
        ss << std::setw(4) << ((part1 & 0x0FFF) | 0x4000) << "-";  // version 4
        ss << std::setw(4) << (((part2 >> 48) & 0x3FFF) | 0x8000) << "-";  // variant
        ss << std::setw(12) << (part2 & 0xFFFFFFFFFFFF);

        return ss.str();
    }

    /**
     * @brief Идентификатор ордера: "ord-" + UUID
     */
    static std::string orderId() {
        return "ord-" + generate();
    }

    /**
     * @brief Идентификатор задачи в очереди: "task-" + UUID
     */
    static std::string processingId() {
        return "task-" + generate();
    }

private:
    static std::mt19937_64& engine() {
        thread_local std::random_device rd;
        thread_local std::mt19937_64 gen(rd());
        return gen;
    }
};

} // namespace bullion::utils
