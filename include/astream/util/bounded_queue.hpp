#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace astream::util
{
/**
 *  FIFO borné mono-producteur / mono-consommateur.
 *
 *  - push() bloque tant que la file est pleine (backpressure)
 *  - pop()  bloque tant que la file est vide et ouverte
 *  - close() refuse les push suivants ; les pop vident le reste
 *    puis renvoient std::nullopt
 */
template<typename T>
class BoundedQueue
{
public:
    explicit BoundedQueue(std::size_t capacity) : cap_(capacity ? capacity : 1) {}

    /** false if the queue was closed before `v` could be stored. */
    bool push(T v)
    {
        std::unique_lock<std::mutex> lk(m_);
        not_full_.wait(lk, [this] { return closed_ || dq_.size() < cap_; });
        if (closed_) return false;
        dq_.push_back(std::move(v));
        not_empty_.notify_one();
        return true;
    }

    /** std::nullopt once closed and drained. */
    std::optional<T> pop()
    {
        std::unique_lock<std::mutex> lk(m_);
        not_empty_.wait(lk, [this] { return closed_ || !dq_.empty(); });
        if (dq_.empty()) return std::nullopt;
        T v = std::move(dq_.front());
        dq_.pop_front();
        not_full_.notify_one();
        return v;
    }

    void close() noexcept
    {
        {
            std::lock_guard<std::mutex> lk(m_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    [[nodiscard]] bool closed() const
    {
        std::lock_guard<std::mutex> lk(m_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const
    {
        std::lock_guard<std::mutex> lk(m_);
        return dq_.size();
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return cap_; }

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

private:
    const std::size_t       cap_;
    mutable std::mutex      m_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::deque<T>           dq_;
    bool                    closed_ {false};
};

} // namespace astream::util
