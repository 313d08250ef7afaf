#pragma once

#include <stdexcept>
#include <string>

namespace bullion::domain {

/**
 * @brief Бэкенд очереди недоступен или отказал
 */
class QueueException : public std::runtime_error {
public:
    explicit QueueException(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace bullion::domain
