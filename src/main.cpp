#include "BullionApp.hpp"
#include <iostream>
#include <csignal>

// Глобальный указатель для обработки сигналов
BullionApp* g_app = nullptr;

void signalHandler(int signal)
{
    if (g_app)
    {
        g_app->stop();
    }
    (void)signal;
}

int main()
{
    try
    {
        BullionApp app;
        g_app = &app;

        // Обработчики сигналов для graceful shutdown
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        std::cout << "========================================" << std::endl;
        std::cout << "  Bullion Worker Starting" << std::endl;
        std::cout << "  Press Ctrl+C to stop" << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << std::endl;

        app.run();
        g_app = nullptr;

        std::cout << "\n========================================" << std::endl;
        std::cout << "  Bullion Worker Stopped" << std::endl;
        std::cout << "========================================" << std::endl;

        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
