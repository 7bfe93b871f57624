#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <vector>

/**
 * @brief Потокобезопасный словарь key -> shared_ptr<value>
 *
 * Чтение под shared_lock, запись под unique_lock.
 * Значения отдаются как shared_ptr, поэтому объект живёт,
 * пока на него есть ссылка, даже после remove().
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

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    /**
     * @brief Найти значение или атомарно создать его фабрикой
     *
     * Два потока с одним ключом всегда получают один и тот же объект.
     */
    template <typename Factory>
    std::shared_ptr<V> findOrInsert(const K &key, Factory factory)
    {
        return findOrInsert(key, factory, [](V &) {});
    }

    /**
     * @brief findOrInsert, вызывающий visit(value) под блокировкой словаря
     *
     * visit может выполняться под shared_lock в нескольких потоках сразу,
     * поэтому он должен менять значение только атомарно.
     * Вместе с eraseIf позволяет вести счётчик ссылок без гонки с удалением.
     */
    template <typename Factory, typename Visitor>
    std::shared_ptr<V> findOrInsert(const K &key, Factory factory, Visitor visit)
    {
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = map_.find(key);
            if (it != map_.end())
            {
                visit(*it->second);
                return it->second;
            }
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it != map_.end())
        {
            visit(*it->second);
            return it->second;
        }
        auto value = factory();
        visit(*value);
        map_[key] = value;
        return value;
    }

    /**
     * @brief Удалить ключ, если predicate(value) вернул true (под unique_lock)
     */
    template <typename Predicate>
    bool eraseIf(const K &key, Predicate predicate)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end() || !predicate(*it->second))
        {
            return false;
        }
        map_.erase(it);
        return true;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    bool remove(const K &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    std::vector<std::shared_ptr<V>> getAll() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<std::shared_ptr<V>> result;
        result.reserve(map_.size());
        for (const auto &entry : map_)
        {
            result.push_back(entry.second);
        }
        return result;
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

    void clear()
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_.clear();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};
