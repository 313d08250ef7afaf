#pragma once

#include "ports/output/IPriceOracle.hpp"
#include <map>
#include <mutex>

namespace bullion::adapters::secondary {

/**
 * @brief In-memory источник цен
 *
 * Цены задаются явно через setPrice(); используется в режиме
 * BULLION_STORAGE=memory и в тестах.
 */
class InMemoryPriceOracle : public ports::output::IPriceOracle {
public:
    std::optional<domain::PriceSnapshot> getCurrentPrice(domain::Symbol symbol) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = prices_.find(symbol);
        if (it == prices_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void setPrice(const domain::PriceSnapshot& snapshot) {
        std::lock_guard<std::mutex> lock(mutex_);
        prices_[snapshot.symbol] = snapshot;
    }

    void removePrice(domain::Symbol symbol) {
        std::lock_guard<std::mutex> lock(mutex_);
        prices_.erase(symbol);
    }

private:
    std::mutex mutex_;
    std::map<domain::Symbol, domain::PriceSnapshot> prices_;
};

} // namespace bullion::adapters::secondary
