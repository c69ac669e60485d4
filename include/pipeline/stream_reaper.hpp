#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <stop_token>
#include <thread>

namespace rev::pipeline {

/// Joins retired producer threads on a thread of its own, so whoever drops a
/// stream never waits on a request in flight. Whatever is still pending is
/// joined when the reaper is destroyed.
class StreamReaper {
public:
    StreamReaper();
    ~StreamReaper() = default;

    StreamReaper(const StreamReaper&)            = delete; // non-copyable
    StreamReaper& operator=(const StreamReaper&) = delete; // non-copyable

    void adopt(std::jthread producer);

    /// Producers adopted but not joined yet.
    std::size_t pending() const;

private:
    void run(std::stop_token stop);

    mutable std::mutex          mu_;
    std::condition_variable_any cv_;
    std::deque<std::jthread>    queue_;
    std::size_t                 joining_ {0};
    std::jthread                worker_;   // last: stops before the queue goes away
};

} // namespace rev::pipeline
