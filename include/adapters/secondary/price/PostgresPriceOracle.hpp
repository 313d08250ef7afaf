// include/adapters/secondary/price/PostgresPriceOracle.hpp
#pragma once

#include "ports/output/IPriceOracle.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <string>
#include <iostream>

namespace bullion::adapters::secondary {

/**
 * @brief Цены из таблиц, которые заполняет сборщик котировок
 *
 * - gold_prices: price (spot, единая цена)
 * - gold96_prices: buy_price (ask) и sell_price (bid)
 *
 * Берётся последняя по timestamp строка. Схему не создаёт:
 * таблицы принадлежат сборщику.
 *
 * Запрос ограничен statement_timeout из DbSettings, подключение -
 * connect_timeout: зависшая база даёт исключение, а не вечное ожидание.
 */
class PostgresPriceOracle : public ports::output::IPriceOracle {
public:
    explicit PostgresPriceOracle(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresPriceOracle] Created" << std::endl;
    }

    std::optional<domain::PriceSnapshot> getCurrentPrice(domain::Symbol symbol) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            txn.exec("SET LOCAL statement_timeout = " +
                     std::to_string(settings_->getStatementTimeout().count()));

            pqxx::result result;
            if (symbol == domain::Symbol::SPOT) {
                result = txn.exec(
                    "SELECT ROUND(price::NUMERIC, 8)::TEXT AS price, "
                    "       (EXTRACT(EPOCH FROM timestamp) * 1000)::BIGINT AS as_of_ms "
                    "FROM gold_prices ORDER BY timestamp DESC, id DESC LIMIT 1"
                );
            } else {
                result = txn.exec(
                    "SELECT ROUND(buy_price::NUMERIC, 8)::TEXT AS ask, "
                    "       ROUND(sell_price::NUMERIC, 8)::TEXT AS bid, "
                    "       (EXTRACT(EPOCH FROM timestamp) * 1000)::BIGINT AS as_of_ms "
                    "FROM gold96_prices ORDER BY timestamp DESC, id DESC LIMIT 1"
                );
            }
            txn.commit();

            if (result.empty()) {
                return std::nullopt;
            }

            const auto& row = result[0];
            auto snapshot = symbol == domain::Symbol::SPOT
                ? domain::PriceSnapshot::single(
                      symbol, domain::Decimal::fromString(row["price"].as<std::string>()))
                : domain::PriceSnapshot::twoSided(
                      symbol,
                      domain::Decimal::fromString(row["bid"].as<std::string>()),
                      domain::Decimal::fromString(row["ask"].as<std::string>()));
            snapshot.asOf = domain::Timestamp::fromEpochMillis(row["as_of_ms"].as<int64_t>());
            return snapshot;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPriceOracle] getCurrentPrice error: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace bullion::adapters::secondary
