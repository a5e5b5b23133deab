#include "scheduler.hpp"
#include "actorsystem.hpp"

#include <algorithm>
#include <stdexcept>

namespace NOdin {
namespace NActors {

TScheduler::TScheduler(TActorSystem* system, TPollerBase* poller, std::chrono::milliseconds granularity)
    : System_(system)
    , Poller_(poller)
    , Granularity_(granularity)
{
    Fire_ = [](TScheduler* self) -> TFuture<void> {
        while (true) {
            co_await std::suspend_always{};
            self->RunDue();
        }
    }(this);
}

TScheduler::~TScheduler() {
    for (auto [id, when] : Armed_) {
        Poller_->RemoveTimer(id, when);
    }
}

TScheduler::TToken TScheduler::ScheduleCallback(TTime deadline, TCallback callback) {
    return Add(deadline, std::chrono::milliseconds(0), [callback = std::move(callback)](uint32_t) {
        callback();
        return false;
    });
}

TScheduler::TToken TScheduler::ScheduleRepeatingCallback(TTime first, std::chrono::milliseconds interval, TRepeatingCallback callback) {
    if (interval.count() <= 0) {
        throw std::invalid_argument("repeating interval must be positive");
    }
    return Add(first, interval, std::move(callback));
}

TScheduler::TToken TScheduler::Add(TTime deadline, std::chrono::milliseconds interval, TRepeatingCallback callback) {
    TToken token;
    {
        std::lock_guard guard(Mutex_);
        token = NextToken_++;
        Jobs_.emplace(token, TJob{deadline, interval, std::move(callback)});
        Queue_.push(TQueued{deadline, NextSeq_++, token});
    }
    if (System_->IsLoopThread()) {
        Arm();
    } else {
        System_->Post([this]() { Arm(); });
    }
    return token;
}

bool TScheduler::Cancel(TToken token) {
    std::lock_guard guard(Mutex_);
    return Jobs_.erase(token) > 0;
}

size_t TScheduler::Size() const {
    std::lock_guard guard(Mutex_);
    return Jobs_.size();
}

void TScheduler::Arm() {
    TTime next;
    {
        std::lock_guard guard(Mutex_);
        while (!Queue_.empty() && !Jobs_.contains(Queue_.top().Token)) {
            Queue_.pop();
        }
        if (Queue_.empty()) {
            return;
        }
        next = Queue_.top().Deadline;
    }

    if (Granularity_.count() > 1) {
        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(next.time_since_epoch()).count();
        auto step = std::chrono::duration_cast<std::chrono::nanoseconds>(Granularity_).count();
        ns = (ns + step - 1) / step * step;
        next = TTime(std::chrono::duration_cast<TClock::duration>(std::chrono::nanoseconds(ns)));
    }

    for (const auto& [id, when] : Armed_) {
        if (when <= next) {
            return;
        }
    }
    Armed_.emplace_back(Poller_->AddTimer(next, Fire_.raw()), next);
}

void TScheduler::RunDue() {
    auto now = TClock::now();
    std::erase_if(Armed_, [now](const auto& armed) { return armed.second <= now; });

    while (true) {
        TRepeatingCallback callback;
        TToken token;
        uint32_t periods = 1;
        bool repeat = false;
        {
            std::lock_guard guard(Mutex_);
            if (Queue_.empty() || Queue_.top().Deadline > now) {
                break;
            }
            auto queued = Queue_.top();
            Queue_.pop();
            auto it = Jobs_.find(queued.Token);
            if (it == Jobs_.end()) {
                continue; // cancelled
            }
            token = queued.Token;
            auto& job = it->second;
            if (job.Interval.count() == 0) {
                callback = std::move(job.Callback);
                Jobs_.erase(it);
            } else {
                periods = static_cast<uint32_t>(1 + (now - job.Deadline) / job.Interval);
                job.Deadline += periods * job.Interval;
                Queue_.push(TQueued{job.Deadline, NextSeq_++, token});
                callback = job.Callback;
                repeat = true;
            }
        }

        bool keep = false;
        try {
            keep = callback(periods);
        } catch (const std::exception& ex) {
            ODIN_ERROR << "scheduled job " << token << " failed: " << ex.what();
        }
        if (repeat && !keep) {
            Cancel(token);
        }
    }

    Arm();
}

} // namespace NActors
} // namespace NOdin
