#pragma once

#include "domain/enums/SettlementPolicy.hpp"
#include <chrono>

namespace bullion::settings {

class IWorkerSettings {
public:
    virtual ~IWorkerSettings() = default;

    virtual std::chrono::milliseconds getDequeueTimeout() const = 0;
    virtual std::chrono::milliseconds getIdleSleep() const = 0;
    virtual std::chrono::milliseconds getErrorBackoff() const = 0;
    virtual domain::SettlementPolicy getSettlementPolicy() const = 0;
};

} // namespace bullion::settings
