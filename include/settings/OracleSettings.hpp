#pragma once

#include <chrono>
#include <cstdlib>
#include <string>

namespace bullion::settings {

class OracleSettings {
public:
    std::chrono::milliseconds getLookupTimeout() const {
        const char* timeout = std::getenv("PRICE_LOOKUP_TIMEOUT_MS");
        return std::chrono::milliseconds(timeout ? std::stoi(timeout) : 2000);
    }
};

} // namespace bullion::settings
