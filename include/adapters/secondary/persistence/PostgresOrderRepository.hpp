// include/adapters/secondary/persistence/PostgresOrderRepository.hpp
#pragma once

#include "ports/output/IOrderRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <cstdint>
#include <limits>
#include <memory>
#include <iostream>

namespace bullion::adapters::secondary {

/**
 * @brief PostgreSQL реализация хранилища ордеров
 *
 * Таблица: orders. Десятичные поля - NUMERIC(20,8), передаются и читаются
 * строками, поэтому цикл создание → чтение → обновление точный.
 * Время хранится в TIMESTAMPTZ, в коде - миллисекунды epoch.
 */
class PostgresOrderRepository : public ports::output::IOrderRepository {
public:
    explicit PostgresOrderRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    void save(const domain::Order& order) override {
        upsert(order, "save");
        std::cout << "[PostgresOrderRepository] Saved order: " << order.id << std::endl;
    }

    /**
     * @brief Перезаписать строку целиком (побеждает последняя запись)
     */
    void update(const domain::Order& order) override {
        upsert(order, "update");
    }

    std::optional<domain::Order> findById(const std::string& orderId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                std::string(SELECT_COLUMNS) + "FROM orders WHERE id = $1",
                orderId
            );
            txn.commit();

            if (result.empty()) {
                return std::nullopt;
            }
            return rowToOrder(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrderRepository] findById error: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::Order> findByUserId(const std::string& userId, size_t limit, size_t offset) override {
        std::vector<domain::Order> orders;

        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                std::string(SELECT_COLUMNS) +
                "FROM orders WHERE user_id = $1 "
                "ORDER BY created_at DESC, seq DESC "
                "LIMIT $2 OFFSET $3",
                userId,
                toBigint(limit),
                toBigint(offset)
            );
            txn.commit();

            for (const auto& row : result) {
                orders.push_back(rowToOrder(row));
            }

        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrderRepository] findByUserId error: " << e.what() << std::endl;
            throw;
        }

        return orders;
    }

private:
    static constexpr const char* SELECT_COLUMNS =
        "SELECT id, user_id, symbol, side, "
        "       requested_amount::TEXT AS requested_amount, "
        "       quoted_price_per_unit::TEXT AS quoted_price_per_unit, "
        "       quantity::TEXT AS quantity, "
        "       executed_quantity::TEXT AS executed_quantity, "
        "       executed_price_per_unit::TEXT AS executed_price_per_unit, "
        "       executed_amount::TEXT AS executed_amount, "
        "       status, processing_id, poll_url, error_message, hold_released, priority, "
        "       (EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_at_ms, "
        "       (EXTRACT(EPOCH FROM updated_at) * 1000)::BIGINT AS updated_at_ms ";

    std::shared_ptr<settings::DbSettings> settings_;

    void upsert(const domain::Order& order, const char* operation) {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params(
                R"(
                    INSERT INTO orders (
                        id, user_id, symbol, side,
                        requested_amount, quoted_price_per_unit, quantity,
                        executed_quantity, executed_price_per_unit, executed_amount,
                        status, processing_id, poll_url, error_message, priority,
                        created_at, updated_at, hold_released
                    )
                    VALUES (
                        $1, $2, $3, $4,
                        $5::NUMERIC, $6::NUMERIC, $7::NUMERIC,
                        $8::NUMERIC, NULLIF($9, '')::NUMERIC, NULLIF($10, '')::NUMERIC,
                        $11, $12, $13, $14, $15,
                        to_timestamp($16::BIGINT / 1000.0), to_timestamp($17::BIGINT / 1000.0),
                        $18::BOOLEAN
                    )
                    ON CONFLICT (id) DO UPDATE SET
                        quantity = EXCLUDED.quantity,
                        executed_quantity = EXCLUDED.executed_quantity,
                        executed_price_per_unit = EXCLUDED.executed_price_per_unit,
                        executed_amount = EXCLUDED.executed_amount,
                        status = EXCLUDED.status,
                        poll_url = EXCLUDED.poll_url,
                        error_message = EXCLUDED.error_message,
                        hold_released = EXCLUDED.hold_released,
                        updated_at = EXCLUDED.updated_at
                )",
                order.id,
                order.userId,
                domain::toString(order.symbol),
                domain::toString(order.side),
                order.requestedAmount.toString(),
                order.quotedPricePerUnit.toString(),
                order.quantity.toString(),
                order.executedQuantity.toString(),
                order.executedPricePerUnit ? order.executedPricePerUnit->toString() : std::string(),
                order.executedAmount ? order.executedAmount->toString() : std::string(),
                domain::toString(order.status),
                order.processingId,
                order.pollUrl,
                order.errorMessage,
                order.priority,
                order.createdAt.toEpochMillis(),
                order.updatedAt.toEpochMillis(),
                order.holdReleased
            );

            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrderRepository] " << operation << " error: " << e.what() << std::endl;
            throw;
        }
    }

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS orders (
                    id VARCHAR(64) PRIMARY KEY,
                    seq BIGSERIAL,
                    user_id VARCHAR(64) NOT NULL,
                    symbol VARCHAR(16) NOT NULL,
                    side VARCHAR(8) NOT NULL,
                    requested_amount NUMERIC(20,8) NOT NULL,
                    quoted_price_per_unit NUMERIC(20,8) NOT NULL,
                    quantity NUMERIC(20,8) NOT NULL DEFAULT 0,
                    executed_quantity NUMERIC(20,8) NOT NULL DEFAULT 0,
                    executed_price_per_unit NUMERIC(20,8),
                    executed_amount NUMERIC(20,8),
                    status VARCHAR(16) NOT NULL,
                    processing_id VARCHAR(64) NOT NULL,
                    poll_url VARCHAR(255) NOT NULL DEFAULT '',
                    error_message TEXT NOT NULL DEFAULT '',
                    hold_released BOOLEAN NOT NULL DEFAULT FALSE,
                    priority INT NOT NULL DEFAULT 0,
                    created_at TIMESTAMPTZ NOT NULL,
                    updated_at TIMESTAMPTZ NOT NULL
                );

                CREATE INDEX IF NOT EXISTS idx_orders_user
                ON orders(user_id, created_at DESC);

                CREATE UNIQUE INDEX IF NOT EXISTS idx_orders_processing
                ON orders(processing_id);
            )");

            txn.commit();
            std::cout << "[PostgresOrderRepository] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrderRepository] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }

    static int64_t toBigint(size_t value) {
        constexpr auto maxValue = static_cast<size_t>(std::numeric_limits<int64_t>::max());
        return static_cast<int64_t>(value > maxValue ? maxValue : value);
    }

    static std::optional<domain::Decimal> optionalDecimal(const pqxx::field& field) {
        if (field.is_null()) {
            return std::nullopt;
        }
        return domain::Decimal::fromString(field.as<std::string>());
    }

    domain::Order rowToOrder(const pqxx::row& row) const {
        domain::Order order;
        order.id = row["id"].as<std::string>();
        order.userId = row["user_id"].as<std::string>();

        auto symbol = domain::parseSymbol(row["symbol"].as<std::string>());
        auto side = domain::parseOrderSide(row["side"].as<std::string>());
        auto status = domain::parseOrderStatus(row["status"].as<std::string>());
        if (!symbol || !side || !status) {
            throw std::runtime_error("Corrupted order row: " + order.id);
        }
        order.symbol = *symbol;
        order.side = *side;
        order.status = *status;

        order.requestedAmount = domain::Decimal::fromString(row["requested_amount"].as<std::string>());
        order.quotedPricePerUnit = domain::Decimal::fromString(row["quoted_price_per_unit"].as<std::string>());
        order.quantity = domain::Decimal::fromString(row["quantity"].as<std::string>());
        order.executedQuantity = domain::Decimal::fromString(row["executed_quantity"].as<std::string>());
        order.executedPricePerUnit = optionalDecimal(row["executed_price_per_unit"]);
        order.executedAmount = optionalDecimal(row["executed_amount"]);
        order.processingId = row["processing_id"].as<std::string>();
        order.pollUrl = row["poll_url"].as<std::string>();
        order.errorMessage = row["error_message"].as<std::string>();
        order.holdReleased = row["hold_released"].as<bool>();
        order.priority = row["priority"].as<int>();
        order.createdAt = domain::Timestamp::fromEpochMillis(row["created_at_ms"].as<int64_t>());
        order.updatedAt = domain::Timestamp::fromEpochMillis(row["updated_at_ms"].as<int64_t>());
        return order;
    }
};

} // namespace bullion::adapters::secondary
