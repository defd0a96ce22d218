// NotificationQueue.h — Канал уведомлений ядро → UI
// Ядро пишет из своих потоков, UI забирает в своём цикле событий

#pragma once

#include <deque>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <chrono>
#include <cstddef>

namespace OreonPickup {

template <typename T>
class NotificationQueue {
public:
    /// capacity = 0: без ограничения. Иначе при переполнении
    /// выбрасывается самое старое уведомление.
    explicit NotificationQueue(size_t capacity = 0)
        : m_capacity(capacity) {}

    // Запрет копирования
    NotificationQueue(const NotificationQueue&) = delete;
    NotificationQueue& operator=(const NotificationQueue&) = delete;

    /// Добавить уведомление. После close() молча отбрасывается.
    /// @return false если очередь закрыта
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed) return false;
            if (m_capacity > 0 && m_items.size() >= m_capacity) {
                m_items.pop_front();
                m_dropped++;
            }
            m_items.push_back(std::move(item));
        }
        m_cv.notify_one();
        return true;
    }

    /// Забрать без ожидания
    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_items.empty()) return std::nullopt;
        T item = std::move(m_items.front());
        m_items.pop_front();
        return item;
    }

    /// Ждать уведомление не дольше timeout.
    /// nullopt при таймауте или если очередь закрыта и пуста.
    template <typename Rep, typename Period>
    std::optional<T> waitPop(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait_for(lock, timeout, [this]() { return !m_items.empty() || m_closed; });
        if (m_items.empty()) return std::nullopt;
        T item = std::move(m_items.front());
        m_items.pop_front();
        return item;
    }

    /// Ждать пока не появится уведомление или очередь не закроют
    std::optional<T> waitPop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this]() { return !m_items.empty() || m_closed; });
        if (m_items.empty()) return std::nullopt;
        T item = std::move(m_items.front());
        m_items.pop_front();
        return item;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_cv.notify_all();
    }

    /// Открыть заново (после close) и выбросить остатки
    void reset() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_items.clear();
        m_closed = false;
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items.size();
    }

    size_t capacity() const { return m_capacity; }

    /// Сколько уведомлений выброшено из-за переполнения
    size_t dropped() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_dropped;
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<T> m_items;
    const size_t m_capacity;
    size_t m_dropped = 0;
    bool m_closed = false;
};

} // namespace OreonPickup
