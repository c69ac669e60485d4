#pragma once

#include "pipeline/bounded_channel.hpp"
#include "pipeline/stream_reaper.hpp"

#include <optional>
#include <thread>
#include <utility>

namespace rev::pipeline {

/// Consumer handle of a running pipeline: the receiving end plus the producer
/// thread feeding it.
template <typename T>
class ReviewStream {
public:
    ReviewStream() = default;
    ReviewStream(Receiver<T> rx, std::jthread producer)
        : rx_(std::move(rx)), producer_(std::move(producer)) {}

    ReviewStream(ReviewStream&&) noexcept = default;
    ReviewStream& operator=(ReviewStream&& other) noexcept
    {
        if (this != &other) {
            shutdown();
            rx_       = std::move(other.rx_);
            producer_ = std::move(other.producer_);
        }
        return *this;
    }

    // The producer can only be joined once it is unblocked, so close first.
    ~ReviewStream() { shutdown(); }

    std::optional<T> receive()    { return rx_.receive(); }
    std::optional<T> tryReceive() { return rx_.tryReceive(); }
    bool finished() const         { return rx_.finished(); }
    absl::Status status() const   { return rx_.status(); }

    void close() { rx_.close(); }

    /// Closes the stream and hands the producer to `reaper` instead of
    /// joining it here. The stream is empty afterwards.
    void release(StreamReaper& reaper)
    {
        rx_.close();
        reaper.adopt(std::move(producer_));
    }

    /// Joins the producer. Call close() first unless the stream is drained.
    void wait()
    {
        if (producer_.joinable()) producer_.join();
    }

private:
    void shutdown()
    {
        rx_.close();
        wait();
    }

    Receiver<T>  rx_;
    std::jthread producer_;
};

} // namespace rev::pipeline
