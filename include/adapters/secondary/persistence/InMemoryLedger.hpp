#pragma once

#include "ports/output/ILedger.hpp"
#include <ThreadSafeMap.hpp>
#include <iostream>
#include <mutex>

namespace bullion::adapters::secondary {

/**
 * @brief In-memory реализация балансов
 *
 * У каждого счёта свой мьютекс: adjust() читает и пишет баланс
 * под ним, поэтому корректировки одного счёта не теряются,
 * а разные счета не блокируют друг друга.
 */
class InMemoryLedger : public ports::output::ILedger {
public:
    std::optional<domain::Decimal> getBalance(const std::string& userId) override {
        auto account = accounts_.find(userId);
        if (!account) {
            return std::nullopt;
        }
        std::lock_guard<std::mutex> lock(account->mutex);
        return account->balance;
    }

    bool adjust(const std::string& userId, const domain::Decimal& delta) override {
        auto account = accounts_.find(userId);
        if (!account) {
            return false;
        }

        std::lock_guard<std::mutex> lock(account->mutex);
        auto newBalance = account->balance + delta;
        if (newBalance.isNegative()) {
            return false;
        }
        account->balance = newBalance;
        return true;
    }

    void openAccount(const std::string& userId, const domain::Decimal& initialBalance) override {
        auto account = std::make_shared<Account>();
        account->balance = initialBalance;
        if (accounts_.insertIfAbsent(userId, account)) {
            std::cout << "[InMemoryLedger] Opened account " << userId
                      << " with " << initialBalance << " THB" << std::endl;
        }
    }

private:
    struct Account {
        std::mutex mutex;
        domain::Decimal balance;
    };

    ThreadSafeMap<std::string, Account> accounts_;
};

} // namespace bullion::adapters::secondary
