#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace NOdin {
namespace NActors {

/**
 * @class TBlockingPool
 * @brief Worker threads for filesystem access, DNS and other blocking calls.
 *
 * Jobs run in submission order on whichever worker is free. Stop() lets
 * running jobs finish, discards queued ones and joins the workers.
 */
class TBlockingPool {
public:
    explicit TBlockingPool(size_t threads);
    ~TBlockingPool();

    TBlockingPool(const TBlockingPool&) = delete;
    TBlockingPool& operator=(const TBlockingPool&) = delete;

    /// Returns false if the pool is stopped.
    bool Submit(std::function<void()> job);
    void Stop();

    size_t Size() const {
        return Threads_.size();
    }

private:
    void Worker();

    std::mutex Mutex_;
    std::condition_variable Cv_;
    std::deque<std::function<void()>> Jobs_;
    bool Stopped_ = false;
    std::vector<std::thread> Threads_;
};

} // namespace NActors
} // namespace NOdin
