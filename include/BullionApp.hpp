#pragma once

#include <atomic>
#include <memory>
#include <string>

// Forward declarations - Ports
namespace bullion::ports::input {
    class IOrderService;
    class IPortfolioService;
    class IMetricsService;
}

namespace bullion::ports::output {
    class IPriceOracle;
    class ILedger;
}

namespace bullion::settings {
    class AppSettings;
}

namespace bullion::application {
    class ExecutionWorker;
}

/**
 * @class BullionApp
 * @brief Процесс исполнения ордеров на золото
 *
 * Жизненный цикл:
 * 1. configureInjection() - Boost.DI: настройки, адаптеры, сервисы, воркер
 * 2. start воркера
 * 3. ожидание stop() с периодическим отчётом о состоянии очереди
 * 4. остановка воркера, вывод метрик
 *
 * Архитектура: Hexagonal (Ports & Adapters)
 * - Secondary Adapters: Postgres* или InMemory* (BULLION_STORAGE)
 * - PriceOracle всегда обёрнут в TimeoutPriceOracle
 */
class BullionApp
{
public:
    BullionApp();
    ~BullionApp();

    /**
     * @brief Собрать зависимости, запустить воркер и ждать stop()
     */
    void run();

    /**
     * @brief Запросить остановку (безопасно вызывать из обработчика сигнала)
     */
    void stop();

private:
    std::shared_ptr<bullion::settings::AppSettings> settings_;
    std::shared_ptr<bullion::ports::output::IPriceOracle> basePriceOracle_;
    std::shared_ptr<bullion::ports::output::ILedger> ledger_;
    std::shared_ptr<bullion::ports::input::IOrderService> orderService_;
    std::shared_ptr<bullion::ports::input::IPortfolioService> portfolioService_;
    std::shared_ptr<bullion::ports::input::IMetricsService> metrics_;
    std::shared_ptr<bullion::application::ExecutionWorker> worker_;

    std::atomic<bool> stopRequested_{false};
    std::string demoOrderId_;

    void configureInjection();
    void seedDemoData();
    void placeDemoOrder();
    void reportDemoOrder();
    void logHealth();
    void printStartupBanner();
};
