#include "pipeline/stream_reaper.hpp"
#include "util/log.hpp"

namespace rev::pipeline {

StreamReaper::StreamReaper()
    : worker_([this](std::stop_token stop) { run(stop); })
{
}

void StreamReaper::adopt(std::jthread producer)
{
    if (!producer.joinable()) return;
    {
        std::lock_guard<std::mutex> lock(mu_);
        queue_.push_back(std::move(producer));
    }
    cv_.notify_one();
}

std::size_t StreamReaper::pending() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size() + joining_;
}

void StreamReaper::run(std::stop_token stop)
{
    for (;;) {
        std::jthread next;
        {
            std::unique_lock<std::mutex> lock(mu_);
            // On stop the queue is still drained before leaving.
            cv_.wait(lock, stop, [&] { return !queue_.empty(); });
            if (queue_.empty()) return;
            next = std::move(queue_.front());
            queue_.pop_front();
            ++joining_;
        }

        next.join();
        util::LogDebug("Reaper", "producer joined");

        std::lock_guard<std::mutex> lock(mu_);
        --joining_;
    }
}

} // namespace rev::pipeline
