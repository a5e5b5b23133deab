#include <chrono>
#include <memory>
#include <stdexcept>
#include <stdarg.h>
#include <stddef.h>
#include <setjmp.h>
#include <thread>
#include <unordered_set>
#include <vector>

#include <odin/all.hpp>
#include <odin/actors/actorsystem.hpp>

#include "testlib.h"

extern "C" {
#include <cmocka.h>
}

using namespace NOdin;
using namespace NOdin::NActors;

namespace {

struct TTick {
    int Value = 0;
};

class TTickRecorder: public TActor<TTickRecorder, TMessageSet<TTick>> {
public:
    explicit TTickRecorder(std::shared_ptr<std::vector<int>> seen)
        : Seen(std::move(seen))
    { }

    void Receive(TTick&& tick, TContext&) {
        Seen->push_back(tick.Value);
    }

private:
    std::shared_ptr<std::vector<int>> Seen;
};

struct TTimerStats {
    int Fires = 0;
    uint32_t Coalesced = 0;
    bool Inside = false;
    bool Reentered = false;
    std::vector<TTimerId> Ids;
};

struct TArm {
    TTimerId Id = 0;
    int DelayMs = 0;
    bool Repeat = false;
};

struct TDisarm {
    TTimerId Id = 0;
};

class TTimerActor: public TActor<TTimerActor, TMessageSet<TArm, TDisarm>> {
public:
    TTimerActor(std::shared_ptr<TTimerStats> stats, std::chrono::milliseconds work)
        : Stats(std::move(stats))
        , Work(work)
    { }

    void Receive(TArm&& arm, TContext& ctx) {
        if (arm.Repeat) {
            ctx.StartRepeatTimer(arm.Id, std::chrono::milliseconds(arm.DelayMs));
        } else {
            ctx.StartTimer(arm.Id, std::chrono::milliseconds(arm.DelayMs));
        }
    }

    void Receive(TDisarm&& disarm, TContext& ctx) {
        ctx.CancelTimer(disarm.Id);
    }

    TFuture<TReceiveAction> OnTimer(TTimerId id, uint32_t coalesced, TContext& ctx) override {
        if (Stats->Inside) {
            Stats->Reentered = true;
        }
        Stats->Inside = true;
        ++Stats->Fires;
        Stats->Coalesced += coalesced;
        Stats->Ids.push_back(id);
        if (Work.count() > 0) {
            co_await ctx.Sleep(Work);
        }
        Stats->Inside = false;
        co_return TReceiveAction::Continue();
    }

private:
    std::shared_ptr<TTimerStats> Stats;
    std::chrono::milliseconds Work;
};

} // namespace

void test_deadline_order(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    auto& scheduler = system.Scheduler();
    std::vector<int> fired;

    auto now = TClock::now();
    scheduler.ScheduleCallback(now + std::chrono::milliseconds(40), [&]() { fired.push_back(4); });
    scheduler.ScheduleCallback(now + std::chrono::milliseconds(10), [&]() { fired.push_back(1); });
    scheduler.ScheduleCallback(now + std::chrono::milliseconds(30), [&]() { fired.push_back(3); });
    scheduler.ScheduleCallback(now + std::chrono::milliseconds(20), [&]() { fired.push_back(2); });
    // equal deadlines keep insertion order
    scheduler.ScheduleCallback(now + std::chrono::milliseconds(30), [&]() { fired.push_back(5); });
    scheduler.ScheduleCallback(now + std::chrono::milliseconds(30), [&]() { fired.push_back(6); });
    assert_int_equal(scheduler.Size(), 6);

    assert_true(step_until(loop, [&]() { return fired.size() == 6; }));
    std::vector<int> expected = {1, 2, 3, 5, 6, 4};
    assert_true(fired == expected);
    assert_int_equal(scheduler.Size(), 0);
}

void test_never_early(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    auto deadline = TClock::now() + std::chrono::milliseconds(50);
    TTime firedAt{};

    system.Scheduler().ScheduleCallback(deadline, [&]() { firedAt = TClock::now(); });
    assert_true(step_until(loop, [&]() { return firedAt != TTime{}; }));
    assert_true(firedAt >= deadline);
}

void test_past_deadline(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    bool fired = false;

    system.Scheduler().ScheduleCallback(TClock::now() - std::chrono::seconds(1), [&]() { fired = true; });
    assert_true(step_until(loop, [&]() { return fired; }, std::chrono::milliseconds(500)));
}

void test_cancel(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    auto& scheduler = system.Scheduler();
    bool cancelled = false;
    bool fired = false;

    auto first = scheduler.ScheduleCallback(TClock::now() + std::chrono::milliseconds(20), [&]() { cancelled = true; });
    auto second = scheduler.ScheduleCallback(TClock::now() + std::chrono::milliseconds(30), [&]() { fired = true; });
    assert_true(first != second);
    assert_true(scheduler.Cancel(first));
    assert_false(scheduler.Cancel(first));
    assert_int_equal(scheduler.Size(), 1);

    assert_true(step_until(loop, [&]() { return fired; }));
    step_for(loop, std::chrono::milliseconds(20));
    assert_false(cancelled);
    // already fired
    assert_false(scheduler.Cancel(second));
    assert_false(scheduler.Cancel(12345));
}

void test_cancel_from_thread(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    auto& scheduler = system.Scheduler();
    bool fired = false;

    auto token = scheduler.ScheduleCallback(TClock::now() + std::chrono::milliseconds(30), [&]() { fired = true; });
    bool cancelled = false;
    std::thread canceller([&]() { cancelled = scheduler.Cancel(token); });
    canceller.join();

    step_for(loop, std::chrono::milliseconds(60));
    assert_true(cancelled);
    assert_false(fired);
}

void test_repeating_callback(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    auto& scheduler = system.Scheduler();
    int calls = 0;

    scheduler.ScheduleRepeatingCallback(TClock::now() + std::chrono::milliseconds(5), std::chrono::milliseconds(5), [&](uint32_t periods) {
        assert_true(periods >= 1);
        return ++calls < 3;
    });
    assert_true(step_until(loop, [&]() { return calls == 3; }));
    step_for(loop, std::chrono::milliseconds(30));
    assert_int_equal(calls, 3);
    assert_int_equal(scheduler.Size(), 0);
}

void test_repeating_coalesces(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    std::vector<uint32_t> periods;

    auto token = system.Scheduler().ScheduleRepeatingCallback(TClock::now() + std::chrono::milliseconds(10), std::chrono::milliseconds(10), [&](uint32_t elapsed) {
        periods.push_back(elapsed);
        return true;
    });

    // block the loop thread across several periods
    std::this_thread::sleep_for(std::chrono::milliseconds(65));
    assert_true(step_until(loop, [&]() { return !periods.empty(); }));
    assert_int_equal(periods.size(), 1);
    assert_true(periods[0] >= 5);

    assert_true(step_until(loop, [&]() { return periods.size() >= 2; }));
    assert_true(system.Scheduler().Cancel(token));
}

void test_repeating_bad_interval(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    bool thrown = false;
    try {
        system.Scheduler().ScheduleRepeatingCallback(TClock::now(), std::chrono::milliseconds(0), [](uint32_t) { return true; });
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert_true(thrown);
    assert_int_equal(system.Scheduler().Size(), 0);
}

void test_schedule_once(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    auto seen = std::make_shared<std::vector<int>>();

    auto recorder = system.Spawn<TTickRecorder>("recorder", {}, seen);
    system.Scheduler().ScheduleOnce(recorder, TTick{2}, std::chrono::milliseconds(20));
    system.Scheduler().ScheduleOnce(recorder, TTick{1}, std::chrono::milliseconds(10));
    auto cancelled = system.Scheduler().ScheduleOnce(recorder, TTick{3}, std::chrono::milliseconds(15));
    assert_true(system.Scheduler().Cancel(cancelled));

    assert_true(step_until(loop, [&]() { return seen->size() == 2; }));
    assert_int_equal((*seen)[0], 1);
    assert_int_equal((*seen)[1], 2);
}

void test_schedule_once_full_mailbox(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    auto seen = std::make_shared<std::vector<int>>();

    auto recorder = system.Spawn<TTickRecorder>("recorder", TSpawnOptions{.Capacity = 1}, seen);
    assert_true(recorder.SendSystem(NSignal::TPause{}).has_value());
    assert_true(recorder.TrySend(TTick{0}).has_value());
    system.Scheduler().ScheduleOnce(recorder, TTick{1}, std::chrono::milliseconds(5));

    assert_true(step_until(loop, [&]() { return recorder.Dropped() == 1; }));
    assert_true(recorder.SendSystem(NSignal::TResume{}).has_value());
    assert_true(step_until(loop, [&]() { return seen->size() == 1; }));
    step_for(loop, std::chrono::milliseconds(20));
    assert_int_equal(seen->size(), 1);
    assert_int_equal((*seen)[0], 0);
}

void test_schedule_repeating(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    auto seen = std::make_shared<std::vector<int>>();

    auto recorder = system.Spawn<TTickRecorder>("recorder", {}, seen);
    auto token = system.Scheduler().ScheduleRepeating(recorder, TTick{7}, std::chrono::milliseconds(0), std::chrono::milliseconds(10));
    assert_true(step_until(loop, [&]() { return seen->size() >= 3; }));
    for (int v : *seen) {
        assert_int_equal(v, 7);
    }
    assert_true(system.Scheduler().Cancel(token));
}

void test_schedule_repeating_target_gone(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    auto seen = std::make_shared<std::vector<int>>();

    auto recorder = system.Spawn<TTickRecorder>("recorder", {}, seen);
    system.Scheduler().ScheduleRepeating(recorder, TTick{1}, std::chrono::milliseconds(10), std::chrono::milliseconds(10));
    assert_int_equal(system.Scheduler().Size(), 1);

    system.Shutdown();
    system.ProcessRequests(loop);
    assert_true(step_until(loop, [&]() { return system.Scheduler().Size() == 0; }));
}

void test_schedule_exec(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    auto seen = std::make_shared<std::vector<int>>();
    bool ran = false;

    auto recorder = system.Spawn<TTickRecorder>("recorder", {}, seen);
    auto start = TClock::now();
    TTime ranAt{};
    system.Scheduler().ScheduleExec(recorder, [&]() { ran = true; ranAt = TClock::now(); }, std::chrono::milliseconds(20));
    assert_true(step_until(loop, [&]() { return ran; }));
    assert_true(ranAt - start >= std::chrono::milliseconds(20));
}

void test_actor_one_shot_timer(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    auto stats = std::make_shared<TTimerStats>();

    auto actor = system.Spawn<TTimerActor>("timers", {}, stats, std::chrono::milliseconds(0));
    assert_true(actor.TrySend(TArm{1, 10, false}).has_value());
    assert_true(actor.TrySend(TArm{2, 30, false}).has_value());
    assert_true(actor.TrySend(TArm{3, 20, false}).has_value());
    assert_true(actor.TrySend(TDisarm{3}).has_value());

    assert_true(step_until(loop, [&]() { return stats->Fires == 2; }));
    step_for(loop, std::chrono::milliseconds(40));
    assert_int_equal(stats->Fires, 2);
    assert_int_equal(stats->Ids[0], 1);
    assert_int_equal(stats->Ids[1], 2);
    assert_int_equal(stats->Coalesced, 2);
}

void test_actor_timer_restart_replaces(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    auto stats = std::make_shared<TTimerStats>();

    auto actor = system.Spawn<TTimerActor>("timers", {}, stats, std::chrono::milliseconds(0));
    assert_true(actor.TrySend(TArm{1, 10, false}).has_value());
    assert_true(actor.TrySend(TArm{1, 40, false}).has_value());

    auto start = TClock::now();
    assert_true(step_until(loop, [&]() { return stats->Fires == 1; }));
    assert_true(TClock::now() - start >= std::chrono::milliseconds(35));
    step_for(loop, std::chrono::milliseconds(30));
    assert_int_equal(stats->Fires, 1);
}

void test_actor_timer_coalescing(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    auto stats = std::make_shared<TTimerStats>();

    auto actor = system.Spawn<TTimerActor>("timers", {}, stats, std::chrono::milliseconds(55));
    assert_true(actor.TrySend(TArm{7, 10, true}).has_value());
    step_for(loop, std::chrono::milliseconds(200));

    assert_true(stats->Fires >= 2);
    assert_true(stats->Fires <= 20);
    assert_false(stats->Reentered);
    // missed periods are reported, not dropped
    assert_true(stats->Coalesced > static_cast<uint32_t>(stats->Fires));

    assert_true(actor.TrySend(TDisarm{7}).has_value());
    step_for(loop, std::chrono::milliseconds(80));
    int fires = stats->Fires;
    step_for(loop, std::chrono::milliseconds(80));
    assert_int_equal(stats->Fires, fires);
}

void test_actor_timers_cancelled_on_stop(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    auto stats = std::make_shared<TTimerStats>();

    auto actor = system.Spawn<TTimerActor>("timers", {}, stats, std::chrono::milliseconds(0));
    assert_true(actor.TrySend(TArm{1, 10, true}).has_value());
    assert_true(step_until(loop, [&]() { return stats->Fires >= 1; }));

    system.Shutdown();
    system.ProcessRequests(loop);
    assert_true(step_until(loop, [&]() { return system.Scheduler().Size() == 0; }));
}

int main(int argc, char** argv) {
    TInitializer init;

    std::vector<CMUnitTest> tests;
    std::unordered_set<std::string> filters;
    tests.reserve(100);

    parse_filters(argc, argv, filters);

    ADD_TEST(cmocka_unit_test, test_deadline_order);
    ADD_TEST(cmocka_unit_test, test_never_early);
    ADD_TEST(cmocka_unit_test, test_past_deadline);
    ADD_TEST(cmocka_unit_test, test_cancel);
    ADD_TEST(cmocka_unit_test, test_cancel_from_thread);
    ADD_TEST(cmocka_unit_test, test_repeating_callback);
    ADD_TEST(cmocka_unit_test, test_repeating_coalesces);
    ADD_TEST(cmocka_unit_test, test_repeating_bad_interval);
    ADD_TEST(cmocka_unit_test, test_schedule_once);
    ADD_TEST(cmocka_unit_test, test_schedule_once_full_mailbox);
    ADD_TEST(cmocka_unit_test, test_schedule_repeating);
    ADD_TEST(cmocka_unit_test, test_schedule_repeating_target_gone);
    ADD_TEST(cmocka_unit_test, test_schedule_exec);
    ADD_TEST(cmocka_unit_test, test_actor_one_shot_timer);
    ADD_TEST(cmocka_unit_test, test_actor_timer_restart_replaces);
    ADD_TEST(cmocka_unit_test, test_actor_timer_coalescing);
    ADD_TEST(cmocka_unit_test, test_actor_timers_cancelled_on_stop);

    return _cmocka_run_group_tests("test_scheduler", tests.data(), tests.size(), NULL, NULL);
}
