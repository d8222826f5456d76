#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <functional>

/**
 * @file ThreadSafeMap.hpp
 * @brief Потокобезопасный словарь shared_ptr-значений
 *
 * Чтение под shared_lock, запись под unique_lock.
 * Значения живут в shared_ptr, поэтому найденный элемент остаётся
 * валидным и после того, как лок словаря отпущен.
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    using Factory = std::function<std::shared_ptr<V>()>;

    ThreadSafeMap() = default;

    void insert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_); // ← UNIQUE_LOCK для WRITE!
        map_[key] = value;
    }

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_); // ← shared_lock для READ
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    /**
     * @brief Найти значение или атомарно вставить созданное фабрикой
     *
     * Если два потока одновременно просят отсутствующий ключ,
     * оба получат один и тот же объект.
     */
    std::shared_ptr<V> findOrInsert(const K &key, const Factory &factory)
    {
        if (auto existing = find(key))
        {
            return existing;
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it != map_.end())
        {
            return it->second;
        }
        auto created = factory();
        map_.emplace(key, created);
        return created;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_); // ← shared_lock для READ
        return map_.find(key) != map_.end();
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
