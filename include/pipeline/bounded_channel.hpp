// -----------------------------------------------------------------------------
// Bounded, ordered channel between a producer thread and one consumer
// (header-only)
// -----------------------------------------------------------------------------
#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <absl/status/status.h>

namespace rev::pipeline {

namespace detail {

template <typename T>
struct ChannelCore {
    explicit ChannelCore(std::size_t cap) : capacity(cap == 0 ? 1 : cap) {}

    std::mutex              mu;
    std::condition_variable not_full;
    std::condition_variable not_empty;
    std::deque<T>           queue;
    std::size_t             capacity;
    std::size_t             senders   {0};
    bool                    tx_closed {false};
    bool                    rx_closed {false};
    absl::Status            status;   ///< terminal status set by the producer
};

} // namespace detail

template <typename T>
class Sender {
public:
    Sender() = default;
    explicit Sender(std::shared_ptr<detail::ChannelCore<T>> core) : core_(std::move(core))
    {
        std::lock_guard<std::mutex> lock(core_->mu);
        ++core_->senders;
    }

    Sender(const Sender& other) : core_(other.core_)
    {
        if (!core_) return;
        std::lock_guard<std::mutex> lock(core_->mu);
        ++core_->senders;
    }
    Sender& operator=(const Sender& other)
    {
        if (this != &other) {
            Sender tmp(other);
            swap(tmp);
        }
        return *this;
    }
    Sender(Sender&& other) noexcept : core_(std::move(other.core_)) {}
    Sender& operator=(Sender&& other) noexcept
    {
        if (this != &other) {
            release();
            core_ = std::move(other.core_);
        }
        return *this;
    }
    ~Sender() { release(); }

    /// Blocks while the channel is full. Returns false, without blocking,
    /// once the receiving end is closed.
    bool send(T value)
    {
        if (!core_) return false;
        std::unique_lock<std::mutex> lock(core_->mu);
        core_->not_full.wait(lock, [&] {
            return core_->rx_closed || core_->tx_closed || core_->queue.size() < core_->capacity;
        });
        if (core_->rx_closed || core_->tx_closed) return false;
        core_->queue.push_back(std::move(value));
        core_->not_empty.notify_one();
        return true;
    }

    /// Ends the stream for every sender; the receiver still drains what is buffered.
    void close(absl::Status status = absl::OkStatus())
    {
        if (!core_) return;
        std::lock_guard<std::mutex> lock(core_->mu);
        if (!core_->tx_closed) {
            core_->tx_closed = true;
            core_->status    = std::move(status);
        }
        core_->not_empty.notify_all();
        core_->not_full.notify_all();
    }

    bool isClosed() const
    {
        if (!core_) return true;
        std::lock_guard<std::mutex> lock(core_->mu);
        return core_->rx_closed || core_->tx_closed;
    }

    void swap(Sender& other) noexcept { core_.swap(other.core_); }

private:
    void release()
    {
        if (!core_) return;
        {
            std::lock_guard<std::mutex> lock(core_->mu);
            if (--core_->senders == 0) {
                core_->tx_closed = true;
                core_->not_empty.notify_all();
            }
        }
        core_.reset();
    }

    std::shared_ptr<detail::ChannelCore<T>> core_;
};

template <typename T>
class Receiver {
public:
    Receiver() = default;
    explicit Receiver(std::shared_ptr<detail::ChannelCore<T>> core) : core_(std::move(core)) {}

    Receiver(const Receiver&)            = delete; // non-copyable
    Receiver& operator=(const Receiver&) = delete; // non-copyable
    Receiver(Receiver&&) noexcept            = default; // movable
    Receiver& operator=(Receiver&& other) noexcept
    {
        if (this != &other) {
            close();
            core_ = std::move(other.core_);
        }
        return *this;
    }
    ~Receiver() { close(); }

    /// Blocks until an item arrives; std::nullopt at end of stream.
    std::optional<T> receive()
    {
        if (!core_) return std::nullopt;
        std::unique_lock<std::mutex> lock(core_->mu);
        core_->not_empty.wait(lock, [&] {
            return !core_->queue.empty() || core_->tx_closed || core_->rx_closed;
        });
        return popLocked();
    }

    /// Never blocks.
    std::optional<T> tryReceive()
    {
        if (!core_) return std::nullopt;
        std::lock_guard<std::mutex> lock(core_->mu);
        return popLocked();
    }

    /// True once the producer side is closed and every item was taken.
    bool finished() const
    {
        if (!core_) return true;
        std::lock_guard<std::mutex> lock(core_->mu);
        return core_->rx_closed || (core_->tx_closed && core_->queue.empty());
    }

    /// Terminal status. OK while open and after a normal end.
    absl::Status status() const
    {
        if (!core_) return absl::OkStatus();
        std::lock_guard<std::mutex> lock(core_->mu);
        return core_->status;
    }

    /// Drops buffered items; any blocked or later send fails.
    void close()
    {
        if (!core_) return;
        std::lock_guard<std::mutex> lock(core_->mu);
        core_->rx_closed = true;
        core_->queue.clear();
        core_->not_full.notify_all();
    }

private:
    std::optional<T> popLocked()
    {
        if (core_->rx_closed || core_->queue.empty()) return std::nullopt;
        std::optional<T> out(std::move(core_->queue.front()));
        core_->queue.pop_front();
        core_->not_full.notify_one();
        return out;
    }

    std::shared_ptr<detail::ChannelCore<T>> core_;
};

template <typename T>
std::pair<Sender<T>, Receiver<T>> MakeChannel(std::size_t capacity)
{
    auto core = std::make_shared<detail::ChannelCore<T>>(capacity);
    return {Sender<T>(core), Receiver<T>(core)};
}

} // namespace rev::pipeline
