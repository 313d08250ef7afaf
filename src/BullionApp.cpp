#include "BullionApp.hpp"

#include <boost/di.hpp>

// Application Services
#include "application/ExecutionWorker.hpp"
#include "application/MetricsService.hpp"
#include "application/OrderService.hpp"
#include "application/PortfolioService.hpp"

// Secondary Adapters
#include "adapters/secondary/persistence/InMemoryLedger.hpp"
#include "adapters/secondary/persistence/InMemoryOrderRepository.hpp"
#include "adapters/secondary/persistence/PostgresLedger.hpp"
#include "adapters/secondary/persistence/PostgresOrderRepository.hpp"
#include "adapters/secondary/price/InMemoryPriceOracle.hpp"
#include "adapters/secondary/price/PostgresPriceOracle.hpp"
#include "adapters/secondary/price/TimeoutPriceOracle.hpp"
#include "adapters/secondary/queue/InMemoryWorkQueue.hpp"
#include "adapters/secondary/queue/PostgresWorkQueue.hpp"
#include "domain/exceptions/QueueException.hpp"

// Settings
#include "settings/AppSettings.hpp"
#include "settings/DbSettings.hpp"
#include "settings/MetricsSettings.hpp"
#include "settings/OracleSettings.hpp"
#include "settings/QueueSettings.hpp"
#include "settings/WorkerSettings.hpp"

#include <chrono>
#include <iostream>
#include <thread>

namespace di = boost::di;

using namespace bullion;

// ============================================================================
// Демо-данные для BULLION_STORAGE=memory
// ============================================================================
namespace demo
{
    const std::string USER_ID = "demo-user";
    const char* INITIAL_BALANCE = "1000.00";
    const char* ORDER_AMOUNT = "500.00";
    const char* SPOT_PRICE = "2000.00";
    const char* GOLD96_BID = "1990.00";
    const char* GOLD96_ASK = "2010.00";
}

// ============================================================================
// BullionApp Implementation
// ============================================================================

BullionApp::BullionApp()
    : settings_(std::make_shared<settings::AppSettings>())
{
    std::cout << "[BullionApp] Application created" << std::endl;
}

BullionApp::~BullionApp()
{
    if (worker_)
    {
        worker_->stop();
    }
    std::cout << "[BullionApp] Application destroyed" << std::endl;
}

void BullionApp::run()
{
    configureInjection();

    if (settings_->useInMemoryStorage())
    {
        seedDemoData();
    }

    worker_->start();

    if (settings_->useInMemoryStorage())
    {
        placeDemoOrder();
    }

    const auto tick = std::chrono::milliseconds(200);
    const auto interval = std::chrono::seconds(settings_->getHealthLogIntervalSeconds());
    auto nextReport = std::chrono::steady_clock::now();

    while (!stopRequested_)
    {
        if (std::chrono::steady_clock::now() >= nextReport)
        {
            logHealth();
            nextReport = std::chrono::steady_clock::now() + interval;
        }
        std::this_thread::sleep_for(tick);
    }

    std::cout << "[BullionApp] Stopping..." << std::endl;
    worker_->stop();

    if (!demoOrderId_.empty())
    {
        reportDemoOrder();
    }

    std::cout << "\n[BullionApp] Metrics:\n" << metrics_->toPrometheusFormat() << std::endl;
}

void BullionApp::stop()
{
    stopRequested_ = true;
}

void BullionApp::configureInjection()
{
    printStartupBanner();

    std::cout << "[BullionApp] Configuring Boost.DI injection (storage="
              << settings_->getStorage() << ")..." << std::endl;

    auto queueSettings = std::make_shared<settings::QueueSettings>();
    auto oracleSettings = std::make_shared<settings::OracleSettings>();

    // ========================================================================
    // Secondary Adapters: выбор хранилища
    // ========================================================================

    std::shared_ptr<ports::output::IWorkQueue> queue;
    std::shared_ptr<ports::output::IOrderRepository> orders;

    if (settings_->useInMemoryStorage())
    {
        basePriceOracle_ = std::make_shared<adapters::secondary::InMemoryPriceOracle>();
        ledger_ = std::make_shared<adapters::secondary::InMemoryLedger>();
        orders = std::make_shared<adapters::secondary::InMemoryOrderRepository>();
        queue = std::make_shared<adapters::secondary::InMemoryWorkQueue>(queueSettings);
    }
    else
    {
        auto dbSettings = std::make_shared<settings::DbSettings>();
        basePriceOracle_ = std::make_shared<adapters::secondary::PostgresPriceOracle>(dbSettings);
        ledger_ = std::make_shared<adapters::secondary::PostgresLedger>(dbSettings);
        orders = std::make_shared<adapters::secondary::PostgresOrderRepository>(dbSettings);
        queue = std::make_shared<adapters::secondary::PostgresWorkQueue>(dbSettings, queueSettings);
    }

    if (settings_->clearQueueOnStart())
    {
        std::cout << "[BullionApp] Dropping pending tasks (BULLION_CLEAR_QUEUE_ON_START)" << std::endl;
        try
        {
            queue->clear();
        }
        catch (const domain::QueueException& e)
        {
            std::cerr << "[BullionApp] Queue clear failed: " << e.what() << std::endl;
        }
    }

    // Декоратор собирается вручную: ему нужен конкретный делегат
    auto priceOracle = std::make_shared<adapters::secondary::TimeoutPriceOracle>(
        basePriceOracle_, oracleSettings->getLookupTimeout());

    // ========================================================================
    // Boost.DI Injector Configuration
    // ========================================================================

    auto injector = di::make_injector(

        // ====================================================================
        // Layer 1: Settings + Secondary Adapters (Output Ports)
        // ====================================================================

        di::bind<settings::AppSettings>().to(settings_),

        di::bind<settings::IQueueSettings>().to(queueSettings),

        di::bind<settings::IWorkerSettings>()
            .to<settings::WorkerSettings>()
            .in(di::singleton),

        di::bind<settings::IMetricsSettings>()
            .to<settings::MetricsSettings>()
            .in(di::singleton),

        di::bind<ports::output::IPriceOracle>().to(priceOracle),
        di::bind<ports::output::ILedger>().to(ledger_),
        di::bind<ports::output::IOrderRepository>().to(orders),
        di::bind<ports::output::IWorkQueue>().to(queue),

        // ====================================================================
        // Layer 2: Application Services (Input Ports)
        // ====================================================================

        di::bind<ports::input::IMetricsService>()
            .to<application::MetricsService>()
            .in(di::singleton),

        di::bind<ports::input::IOrderService>()
            .to<application::OrderService>()
            .in(di::singleton),

        di::bind<ports::input::IPortfolioService>()
            .to<application::PortfolioService>()
            .in(di::singleton));

    metrics_ = injector.create<std::shared_ptr<ports::input::IMetricsService>>();
    orderService_ = injector.create<std::shared_ptr<ports::input::IOrderService>>();
    portfolioService_ = injector.create<std::shared_ptr<ports::input::IPortfolioService>>();
    worker_ = injector.create<std::shared_ptr<application::ExecutionWorker>>();

    std::cout << "\n📦 Boost.DI Injector configured:" << std::endl;
    std::cout << "  ✓ Settings (4 bindings)" << std::endl;
    std::cout << "  ✓ Secondary Adapters (4 bindings)" << std::endl;
    std::cout << "  ✓ Application Services (3 bindings)" << std::endl;
    std::cout << "  ✓ ExecutionWorker" << std::endl;
}

void BullionApp::seedDemoData()
{
    auto oracle = std::dynamic_pointer_cast<adapters::secondary::InMemoryPriceOracle>(basePriceOracle_);
    if (oracle)
    {
        oracle->setPrice(domain::PriceSnapshot::single(
            domain::Symbol::SPOT, domain::Decimal::fromString(demo::SPOT_PRICE)));
        oracle->setPrice(domain::PriceSnapshot::twoSided(
            domain::Symbol::GOLD96,
            domain::Decimal::fromString(demo::GOLD96_BID),
            domain::Decimal::fromString(demo::GOLD96_ASK)));
    }

    ledger_->openAccount(demo::USER_ID, domain::Decimal::fromString(demo::INITIAL_BALANCE));
    std::cout << "[BullionApp] Demo data seeded: " << demo::USER_ID
              << " balance " << demo::INITIAL_BALANCE << std::endl;
}

void BullionApp::placeDemoOrder()
{
    try
    {
        auto order = orderService_->placeOrder(domain::OrderRequest(
            demo::USER_ID, domain::Symbol::SPOT, domain::OrderSide::BUY,
            domain::Decimal::fromString(demo::ORDER_AMOUNT)));
        demoOrderId_ = order.id;
        std::cout << "[BullionApp] Demo order placed: " << order.id
                  << " (poll " << order.pollUrl << ")" << std::endl;
    }
    catch (const domain::OrderException& e)
    {
        std::cerr << "[BullionApp] Demo order rejected (" << domain::toString(e.code())
                  << "): " << e.what() << std::endl;
    }
}

void BullionApp::reportDemoOrder()
{
    try
    {
        auto poll = orderService_->pollStatus(demoOrderId_, demo::USER_ID);
        std::cout << "[BullionApp] Demo order " << demoOrderId_ << ": "
                  << poll.toJson().dump() << std::endl;

        auto portfolio = portfolioService_->getPortfolio(demo::USER_ID);
        std::cout << "[BullionApp] Demo portfolio: cash " << portfolio.cash;
        for (const auto& holding : portfolio.holdings)
        {
            std::cout << ", " << domain::toString(holding.symbol) << " " << holding.quantity;
        }
        std::cout << ", total " << portfolio.totalValue() << std::endl;
    }
    catch (const domain::OrderException& e)
    {
        std::cerr << "[BullionApp] Demo report error: " << e.what() << std::endl;
    }
}

void BullionApp::logHealth()
{
    auto health = orderService_->getQueueHealth();
    auto status = worker_->status();

    std::cout << "[BullionApp] Health: queue " << health.toJson().dump()
              << ", worker running=" << std::boolalpha << status.running
              << " processed=" << status.processedCount
              << " failed=" << status.failedCount << std::endl;
}

void BullionApp::printStartupBanner()
{
    std::cout << std::endl;
    std::cout << "╔══════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║        Bullion: Gold Order Execution Worker          ║" << std::endl;
    std::cout << "║                                                      ║" << std::endl;
    std::cout << "║  Architecture: Hexagonal (Ports & Adapters)          ║" << std::endl;
    std::cout << "║  DI Framework: Boost.DI                              ║" << std::endl;
    std::cout << "║  Storage:      PostgreSQL (libpqxx) / in-memory      ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════╝" << std::endl;
    std::cout << std::endl;
}
