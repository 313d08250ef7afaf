#pragma once

#include "ports/output/IPriceOracle.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace bullion::adapters::secondary {

/**
 * @brief Декоратор IPriceOracle с ограничением времени ответа
 *
 * Запросы к делегату выполняет один собственный поток, по очереди.
 * Вызывающий ждёт не дольше timeout, после чего получает nullopt
 * (PriceUnavailable); брошенный запрос поток пропускает, не вызывая делегата.
 * Если в очереди уже maxPending запросов, новый сразу получает nullopt.
 *
 * Время самого обращения к источнику ограничивает делегат
 * (для PostgresPriceOracle - statement_timeout): деструктор ждёт
 * текущий запрос.
 */
class TimeoutPriceOracle : public ports::output::IPriceOracle {
public:
    TimeoutPriceOracle(
        std::shared_ptr<ports::output::IPriceOracle> delegate,
        std::chrono::milliseconds timeout,
        size_t maxPending = 64)
        : delegate_(std::move(delegate))
        , timeout_(timeout)
        , maxPending_(maxPending)
    {
        lookupThread_ = std::thread([this]() { lookupLoop(); });
    }

    ~TimeoutPriceOracle() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        wakeup_.notify_all();
        if (lookupThread_.joinable()) {
            lookupThread_.join();
        }
    }

    TimeoutPriceOracle(const TimeoutPriceOracle&) = delete;
    TimeoutPriceOracle& operator=(const TimeoutPriceOracle&) = delete;

    std::optional<domain::PriceSnapshot> getCurrentPrice(domain::Symbol symbol) override {
        auto lookup = std::make_shared<Lookup>();
        lookup->symbol = symbol;
        auto future = lookup->promise.get_future();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                return std::nullopt;
            }
            if (pending_.size() >= maxPending_) {
                std::cerr << "[TimeoutPriceOracle] " << pending_.size()
                          << " lookups pending, rejecting " << domain::toString(symbol) << std::endl;
                return std::nullopt;
            }
            pending_.push_back(lookup);
        }
        wakeup_.notify_one();

        if (future.wait_for(timeout_) != std::future_status::ready) {
            lookup->abandoned = true;
            std::cerr << "[TimeoutPriceOracle] Price lookup for " << domain::toString(symbol)
                      << " timed out after " << timeout_.count() << "ms" << std::endl;
            return std::nullopt;
        }

        try {
            return future.get();
        } catch (const std::exception& e) {
            std::cerr << "[TimeoutPriceOracle] Price lookup for " << domain::toString(symbol)
                      << " failed: " << e.what() << std::endl;
            return std::nullopt;
        }
    }

    size_t pendingCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

private:
    struct Lookup {
        domain::Symbol symbol = domain::Symbol::SPOT;
        std::promise<std::optional<domain::PriceSnapshot>> promise;
        std::atomic<bool> abandoned{false};
    };

    std::shared_ptr<ports::output::IPriceOracle> delegate_;
    std::chrono::milliseconds timeout_;
    size_t maxPending_;

    mutable std::mutex mutex_;
    std::condition_variable wakeup_;
    std::deque<std::shared_ptr<Lookup>> pending_;
    bool stopping_ = false;
    std::thread lookupThread_;

    void lookupLoop() {
        while (true) {
            std::shared_ptr<Lookup> lookup;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                wakeup_.wait(lock, [this]() { return stopping_ || !pending_.empty(); });
                if (stopping_) {
                    return;
                }
                lookup = pending_.front();
                pending_.pop_front();
            }

            if (lookup->abandoned) {
                continue;
            }

            try {
                lookup->promise.set_value(delegate_->getCurrentPrice(lookup->symbol));
            } catch (...) {
                // Исключение делегата доходит до вызывающего через future
                lookup->promise.set_exception(std::current_exception());
            }
        }
    }
};

} // namespace bullion::adapters::secondary
