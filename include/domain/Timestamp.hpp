#pragma once

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cstdint>
#include <cctype>
#include <stdexcept>

namespace bullion::domain {

/**
 * @brief Временная метка (UTC, точность - миллисекунды)
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() : value(truncatedNow()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(truncatedNow());
    }

    static Timestamp fromEpochMillis(int64_t millis) {
        return Timestamp(std::chrono::system_clock::time_point(std::chrono::milliseconds(millis)));
    }

    int64_t toEpochMillis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(value.time_since_epoch()).count();
    }

    /**
     * @brief Разбор ISO 8601: "2024-05-01T10:00:00Z" или "2024-05-01T10:00:00.250Z"
     */
    static Timestamp fromString(const std::string& str) {
        std::tm tm = {};
        std::istringstream ss(str);
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            throw std::invalid_argument("Invalid timestamp: " + str);
        }

        int64_t millis = 0;
        if (ss.peek() == '.') {
            ss.get();
            int digits = 0;
            while (std::isdigit(ss.peek())) {
                char c = static_cast<char>(ss.get());
                if (digits < 3) {
                    millis = millis * 10 + (c - '0');
                    ++digits;
                }
            }
            for (; digits < 3; ++digits) {
                millis *= 10;
            }
        }

        // timegm: строка всегда в UTC, mktime дал бы сдвиг на локальную зону
        auto seconds = static_cast<int64_t>(timegm(&tm));
        return fromEpochMillis(seconds * 1000 + millis);
    }

    std::string toString() const {
        int64_t millis = toEpochMillis();
        auto time_t_val = static_cast<std::time_t>(millis / 1000);
        std::tm tm = {};
        gmtime_r(&time_t_val, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
           << "." << std::setw(3) << std::setfill('0') << (millis % 1000) << "Z";
        return ss.str();
    }

    bool operator<(const Timestamp& other) const {
        return value < other.value;
    }

    bool operator>(const Timestamp& other) const {
        return value > other.value;
    }

    bool operator==(const Timestamp& other) const {
        return value == other.value;
    }

    bool operator!=(const Timestamp& other) const {
        return value != other.value;
    }

private:
    // Хранилища держат миллисекунды, поэтому и в памяти точность та же
    static std::chrono::system_clock::time_point truncatedNow() {
        return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
    }
};

} // namespace bullion::domain
