// include/adapters/secondary/persistence/PostgresLedger.hpp
#pragma once

#include "ports/output/ILedger.hpp"
#include "domain/exceptions/LedgerException.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace bullion::adapters::secondary {

/**
 * @brief PostgreSQL реализация балансов
 *
 * Таблица: accounts
 * - user_id VARCHAR(64) PRIMARY KEY
 * - balance NUMERIC(20,8) NOT NULL DEFAULT 0 CHECK (balance >= 0)
 * - updated_at TIMESTAMPTZ DEFAULT NOW()
 *
 * adjust() - один условный UPDATE: проверка и запись атомарны
 * на уровне строки, конкурентные корректировки не теряются.
 */
class PostgresLedger : public ports::output::ILedger {
public:
    explicit PostgresLedger(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    std::optional<domain::Decimal> getBalance(const std::string& userId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT balance::TEXT AS balance FROM accounts WHERE user_id = $1",
                userId
            );
            txn.commit();

            if (result.empty()) {
                return std::nullopt;
            }
            return domain::Decimal::fromString(result[0]["balance"].as<std::string>());

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedger] getBalance error: " << e.what() << std::endl;
            throw domain::LedgerException(e.what());
        }
    }

    bool adjust(const std::string& userId, const domain::Decimal& delta) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "UPDATE accounts "
                "SET balance = balance + $2::NUMERIC, updated_at = NOW() "
                "WHERE user_id = $1 AND balance + $2::NUMERIC >= 0 "
                "RETURNING balance::TEXT AS balance",
                userId,
                delta.toString()
            );

            if (result.empty()) {
                // Счёта нет или баланс ушёл бы в минус
                return false;
            }

            txn.commit();
            std::cout << "[PostgresLedger] Adjusted " << userId << " by " << delta
                      << ", balance " << result[0]["balance"].as<std::string>() << std::endl;
            return true;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedger] adjust error: " << e.what() << std::endl;
            throw domain::LedgerException(e.what());
        }
    }

    void openAccount(const std::string& userId, const domain::Decimal& initialBalance) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params(
                "INSERT INTO accounts (user_id, balance, updated_at) "
                "VALUES ($1, $2::NUMERIC, NOW()) "
                "ON CONFLICT (user_id) DO NOTHING",
                userId,
                initialBalance.toString()
            );

            txn.commit();
            std::cout << "[PostgresLedger] Opened account " << userId << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedger] openAccount error: " << e.what() << std::endl;
            throw domain::LedgerException(e.what());
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS accounts (
                    user_id VARCHAR(64) PRIMARY KEY,
                    balance NUMERIC(20,8) NOT NULL DEFAULT 0 CHECK (balance >= 0),
                    updated_at TIMESTAMPTZ DEFAULT NOW()
                )
            )");

            txn.commit();
            std::cout << "[PostgresLedger] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedger] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }
};

} // namespace bullion::adapters::secondary
