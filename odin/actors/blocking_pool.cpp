#include "blocking_pool.hpp"

#include <odin/log.hpp>

#include <exception>

#include <pthread.h>
#include <signal.h>

namespace NOdin {
namespace NActors {

TBlockingPool::TBlockingPool(size_t threads) {
    Threads_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        Threads_.emplace_back([this]() { Worker(); });
    }
}

TBlockingPool::~TBlockingPool() {
    Stop();
}

bool TBlockingPool::Submit(std::function<void()> job) {
    {
        std::lock_guard guard(Mutex_);
        if (Stopped_) {
            return false;
        }
        Jobs_.emplace_back(std::move(job));
    }
    Cv_.notify_one();
    return true;
}

void TBlockingPool::Stop() {
    {
        std::lock_guard guard(Mutex_);
        if (Stopped_) {
            return;
        }
        Stopped_ = true;
        Jobs_.clear();
    }
    Cv_.notify_all();
    for (auto& thread : Threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void TBlockingPool::Worker() {
    // process signals go to the loop thread
    sigset_t all;
    sigfillset(&all);
    pthread_sigmask(SIG_BLOCK, &all, nullptr);

    while (true) {
        std::function<void()> job;
        {
            std::unique_lock lock(Mutex_);
            Cv_.wait(lock, [this] { return Stopped_ || !Jobs_.empty(); });
            if (Stopped_) {
                return;
            }
            job = std::move(Jobs_.front());
            Jobs_.pop_front();
        }
        try {
            job();
        } catch (const std::exception& ex) {
            ODIN_ERROR << "blocking job failed: " << ex.what();
        }
    }
}

} // namespace NActors
} // namespace NOdin
