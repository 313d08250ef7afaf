#pragma once

#include <chrono>
#include <string>

namespace bullion::settings {

class IQueueSettings {
public:
    virtual ~IQueueSettings() = default;

    virtual std::string getQueueName() const = 0;
    virtual std::chrono::seconds getStatusTtl() const = 0;
    virtual std::chrono::milliseconds getPollInterval() const = 0;
};

} // namespace bullion::settings
