#pragma once

#include <ThreadSafeMap.hpp>

#include <atomic>
#include <mutex>
#include <system_error>
#include <utility>
#include <memory>
#include <string>
#include <vector>
#include <set>

namespace containers::application {

/**
 * @brief Набор сущностей, которые операция блокирует одновременно
 */
struct LockSet {
    std::set<std::string> templates;
    std::set<std::string> containers;
    std::set<std::string> tokens;
};

/**
 * @brief Менеджер блокировок по сущностям (шаблон, контейнер, токен)
 *
 * Глобальный порядок захвата: шаблоны, затем контейнеры, затем токены,
 * внутри группы по возрастанию ключа. Две операции, переносящие токены
 * между одними и теми же контейнерами, не могут взаимно заблокироваться.
 *
 * Мьютексы рекурсивные: реестр токенов может повторно захватить токен,
 * уже захваченный сервисом контейнеров в том же потоке.
 */
class EntityLockManager {
    /// Мьютекс сущности и число Guard, которые его держат или ждут
    struct Entry {
        std::recursive_mutex mutex;
        std::atomic<size_t> holders{0};
    };

public:
    /**
     * @brief RAII владелец захваченных мьютексов
     *
     * При освобождении последнего держателя запись удаляется из таблицы,
     * так что таблица содержит только занятые сущности.
     */
    class Guard {
    public:
        Guard() = default;

        Guard(Guard&& other) noexcept
            : owner_(other.owner_), held_(std::move(other.held_)) {
            other.owner_ = nullptr;
            other.held_.clear();
        }

        Guard& operator=(Guard&& other) noexcept {
            if (this != &other) {
                release();
                owner_ = other.owner_;
                held_ = std::move(other.held_);
                other.owner_ = nullptr;
                other.held_.clear();
            }
            return *this;
        }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        ~Guard() { release(); }

    private:
        friend class EntityLockManager;
        EntityLockManager* owner_ = nullptr;
        std::vector<std::pair<std::string, std::shared_ptr<Entry>>> held_;

        void release() noexcept {
            // Освобождаем в обратном порядке захвата
            while (!held_.empty()) {
                std::string key = std::move(held_.back().first);
                held_.back().second->mutex.unlock();
                held_.pop_back();
                if (owner_) {
                    owner_->forget(key);
                }
            }
        }
    };

    Guard lock(const LockSet& set) {
        Guard guard;
        guard.owner_ = this;
        acquire(guard, "template:", set.templates);
        acquire(guard, "container:", set.containers);
        acquire(guard, "token:", set.tokens);
        return guard;
    }

    Guard lockContainer(const std::string& serial) {
        LockSet set;
        set.containers.insert(serial);
        return lock(set);
    }

    Guard lockToken(const std::string& serial) {
        LockSet set;
        set.tokens.insert(serial);
        return lock(set);
    }

    Guard lockTemplate(const std::string& name) {
        LockSet set;
        set.templates.insert(name);
        return lock(set);
    }

    /// Число сущностей, которые сейчас захвачены или ожидаются
    size_t size() const { return entries_.size(); }

private:
    ThreadSafeMap<std::string, Entry> entries_;

    void acquire(Guard& guard, const std::string& kind, const std::set<std::string>& keys) {
        for (const auto& key : keys) {
            std::string fullKey = kind + key;
            // holders растёт до захвата мьютекса: ожидающую запись никто не удалит
            auto entry = entries_.findOrInsert(
                fullKey,
                []() { return std::make_shared<Entry>(); },
                [](Entry& e) { e.holders.fetch_add(1); });
            try {
                entry->mutex.lock();
            } catch (const std::system_error&) {
                forget(fullKey);
                throw;
            }
            guard.held_.emplace_back(std::move(fullKey), std::move(entry));
        }
    }

    void forget(const std::string& key) noexcept {
        entries_.eraseIf(key, [](Entry& e) { return e.holders.fetch_sub(1) == 1; });
    }
};

} // namespace containers::application
