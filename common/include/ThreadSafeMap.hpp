#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>

/**
 * @file ThreadSafeMap.hpp
 * @brief Потокобезопасная hash-map со значениями в shared_ptr
 *
 * Читатели берут shared_lock, писатели - unique_lock.
 * Значения хранятся как shared_ptr: find() отдаёт снимок, который
 * остаётся валидным после замены значения по тому же ключу.
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    void insert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_[key] = value;
    }

    /**
     * @brief Вставить значение, только если ключа ещё нет
     * @return true если вставлено
     */
    bool insertIfAbsent(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.emplace(key, value).second;
    }

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};
