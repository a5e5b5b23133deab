#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <queue>
#include <tuple>
#include <unordered_map>
#include <vector>

#include <odin/base.hpp>
#include <odin/corochain.hpp>
#include <odin/log.hpp>
#include <odin/poller.hpp>

#include "handle.hpp"

namespace NOdin {
namespace NActors {

/**
 * @class TScheduler
 * @brief Deadline-ordered delivery of messages, signals and callbacks.
 *
 * Owned by the actor system and shares its poller and clock. Jobs sit in a
 * priority queue ordered by (deadline, insertion sequence) plus a table of
 * live tokens. Cancel() only erases the token; the queue entry becomes a
 * tombstone skipped when it comes up.
 *
 * A repeating job that fell behind by k periods fires once and is told k
 * (see TRepeatingCallback). Jobs run on the loop thread; scheduling and
 * cancelling is allowed from any thread.
 */
class TScheduler {
public:
    using TToken = uint64_t;
    using TCallback = std::function<void()>;
    // Receives the number of elapsed periods, returns false to stop repeating.
    using TRepeatingCallback = std::function<bool(uint32_t)>;

    TScheduler(TActorSystem* system, TPollerBase* poller, std::chrono::milliseconds granularity);
    ~TScheduler();

    TScheduler(const TScheduler&) = delete;
    TScheduler& operator=(const TScheduler&) = delete;

    TToken ScheduleCallback(TTime deadline, TCallback callback);
    TToken ScheduleRepeatingCallback(TTime first, std::chrono::milliseconds interval, TRepeatingCallback callback);

    /// TrySend()s @p payload to @p target after @p delay. A full mailbox drops it with a warning and counts it in Dropped().
    template<typename TMsgSet, CMemberOf<TMsgSet> T>
    TToken ScheduleOnce(const TActorHandle<TMsgSet>& target, T payload, std::chrono::milliseconds delay) {
        return ScheduleCallback(TClock::now() + delay, [target, payload = std::move(payload)]() mutable {
            Deliver(target, std::move(payload));
        });
    }

    /// Delivers a copy of @p payload every @p interval. Stops once the target is gone.
    template<typename TMsgSet, CMemberOf<TMsgSet> T>
    TToken ScheduleRepeating(const TActorHandle<TMsgSet>& target, T payload, std::chrono::milliseconds initial, std::chrono::milliseconds interval) {
        return ScheduleRepeatingCallback(TClock::now() + initial, interval, [target, payload = std::move(payload)](uint32_t) {
            return Deliver(target, T(payload));
        });
    }

    /// Runs @p closure on the target's turn after @p delay.
    template<typename TMsgSet>
    TToken ScheduleExec(const TActorHandle<TMsgSet>& target, std::function<void()> closure, std::chrono::milliseconds delay) {
        return ScheduleCallback(TClock::now() + delay, [target, closure = std::move(closure)]() mutable {
            auto res = target.Exec(std::move(closure));
            if (!res && res.error().Kind != EErrorKind::ReceiverGone) {
                ODIN_WARN << "scheduled exec for '" << target.Name() << "' dropped: " << res.error().ToString();
            }
        });
    }

    /// Returns true if the job was live. Has no effect on a fired one-shot job.
    bool Cancel(TToken token);

    /// Number of live jobs.
    size_t Size() const;

private:
    template<typename TMsgSet, typename T>
    static bool Deliver(const TActorHandle<TMsgSet>& target, T&& payload) {
        auto res = target.TrySend(std::forward<T>(payload));
        if (res) {
            return true;
        }
        if (res.error().Kind == EErrorKind::MailboxFull) {
            ODIN_WARN << "scheduled message for '" << target.Name() << "' dropped: mailbox is full";
            return true;
        }
        return false;
    }

    struct TJob {
        TTime Deadline;
        std::chrono::milliseconds Interval{0};
        TRepeatingCallback Callback;
    };

    struct TQueued {
        TTime Deadline;
        uint64_t Seq;
        TToken Token;

        bool operator<(const TQueued& other) const {
            return std::tie(Deadline, Seq) > std::tie(other.Deadline, other.Seq);
        }
    };

    TToken Add(TTime deadline, std::chrono::milliseconds interval, TRepeatingCallback callback);
    void RunDue();
    void Arm();

    TActorSystem* System_;
    TPollerBase* Poller_;
    std::chrono::milliseconds Granularity_;

    mutable std::mutex Mutex_;
    std::priority_queue<TQueued> Queue_;
    std::unordered_map<TToken, TJob> Jobs_;
    TToken NextToken_ = 1;
    uint64_t NextSeq_ = 0;

    // poller timers that will resume Fire_, loop thread only
    std::vector<std::pair<unsigned, TTime>> Armed_;
    TFuture<void> Fire_;
};

} // namespace NActors
} // namespace NOdin
