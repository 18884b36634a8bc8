#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>

// Очередь между потоком mosquitto и основным циклом приложения
template<typename T>
class SafeQueue
{
public:
    SafeQueue() = default;
    ~SafeQueue() = default;

    SafeQueue(const SafeQueue &) = delete;
    SafeQueue &operator=(const SafeQueue &) = delete;

    template<typename... Args>
    void emplace(Args &&...args)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.emplace(std::forward<Args>(args)...);
        }
        cond_var_.notify_one();
    }

    // Извлечение без ожидания
    std::optional<T> tryPop()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return takeFront();
    }

    // Извлечение с таймаутом
    std::optional<T> popFor(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cond_var_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
            return std::nullopt;
        }
        return takeFront();
    }

    // Сброс накопленного, например при перезапуске
    void clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::queue<T> empty;
        queue_.swap(empty);
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    std::optional<T> takeFront()
    {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    mutable std::mutex mutex_;
    std::condition_variable cond_var_;
    std::queue<T> queue_;
};
