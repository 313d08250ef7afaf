#pragma once

#include "ports/output/IOrderRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

namespace bullion::adapters::secondary {

/**
 * @brief In-memory реализация хранилища ордеров
 *
 * Ордера лежат в ThreadSafeMap, индекс по пользователю
 * защищён отдельным мьютексом. Порядок вставки хранится, чтобы история
 * была стабильной при одинаковом createdAt.
 */
class InMemoryOrderRepository : public ports::output::IOrderRepository {
public:
    void save(const domain::Order& order) override {
        orders_.insert(order.id, std::make_shared<domain::Order>(order));

        std::lock_guard<std::mutex> lock(indexMutex_);
        if (sequence_.emplace(order.id, nextSequence_).second) {
            ++nextSequence_;
            userOrders_[order.userId].push_back(order.id);
        }
    }

    /**
     * @brief Перезаписать ордер целиком (побеждает последняя запись)
     */
    void update(const domain::Order& order) override {
        save(order);
    }

    std::optional<domain::Order> findById(const std::string& orderId) override {
        auto order = orders_.find(orderId);
        return order ? std::optional<domain::Order>(*order) : std::nullopt;
    }

    std::vector<domain::Order> findByUserId(const std::string& userId, size_t limit, size_t offset) override {
        std::vector<std::pair<uint64_t, std::string>> ids;
        {
            std::lock_guard<std::mutex> lock(indexMutex_);
            auto it = userOrders_.find(userId);
            if (it != userOrders_.end()) {
                for (const auto& id : it->second) {
                    ids.emplace_back(sequence_[id], id);
                }
            }
        }

        std::vector<std::pair<uint64_t, domain::Order>> found;
        for (const auto& [seq, id] : ids) {
            if (auto order = orders_.find(id)) {
                found.emplace_back(seq, *order);
            }
        }

        // Новые первыми
        std::sort(found.begin(), found.end(),
            [](const auto& a, const auto& b) {
                if (a.second.createdAt != b.second.createdAt) {
                    return a.second.createdAt > b.second.createdAt;
                }
                return a.first > b.first;
            });

        std::vector<domain::Order> result;
        for (size_t i = offset; i < found.size() && result.size() < limit; ++i) {
            result.push_back(found[i].second);
        }
        return result;
    }

    size_t size() const {
        return orders_.size();
    }

private:
    ThreadSafeMap<std::string, domain::Order> orders_;

    std::mutex indexMutex_;
    std::map<std::string, std::vector<std::string>> userOrders_;
    std::map<std::string, uint64_t> sequence_;
    uint64_t nextSequence_ = 0;
};

} // namespace bullion::adapters::secondary
