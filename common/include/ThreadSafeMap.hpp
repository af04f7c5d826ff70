#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>

/**
 * @brief Потокобезопасная таблица shared_ptr-значений
 *
 * Читатели берут shared_lock, писатели unique_lock.
 * Значения отдаются наружу как shared_ptr, поэтому объект живёт,
 * пока на него есть ссылка, даже если ключ уже удалён из таблицы.
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
     * @brief Вставить значение, если ключа ещё нет
     * @return Значение, которое лежит в таблице после вызова (старое или новое)
     */
    std::shared_ptr<V> insertIfAbsent(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto [it, inserted] = map_.emplace(key, value);
        return it->second;
    }

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    bool erase(const K &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};
