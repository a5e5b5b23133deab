#include "actorsystem.hpp"

#include <cstring>
#include <system_error>

#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <pthread.h>
#include <unistd.h>

namespace NOdin {
namespace NActors {

const char* ToString(EActorState state) {
    switch (state) {
    case EActorState::Initializing: return "Initializing";
    case EActorState::Running: return "Running";
    case EActorState::Stopping: return "Stopping";
    case EActorState::Terminated: return "Terminated";
    }
    return "Unknown";
}

TActorTimers::~TActorTimers() {
    CancelAll();
}

void TActorTimers::Start(TTimerId id, std::chrono::milliseconds delay, std::chrono::milliseconds interval, bool repeat) {
    Cancel(id);

    auto tick = std::make_shared<TTimerTick>();
    auto emit = [mailbox = Mailbox_, tick, id](uint32_t periods) {
        auto box = mailbox.lock();
        if (!box || box->IsClosed()) {
            return false;
        }
        if (tick->InFlight) {
            tick->Missed += periods;
            return true;
        }
        tick->InFlight = true;
        tick->Missed += periods - 1;
        return box->SendSystem(NSignal::TTimer{id, tick}).has_value();
    };

    auto& scheduler = System_->Scheduler();
    TEntry entry{0, tick, repeat};
    if (repeat) {
        entry.Token = scheduler.ScheduleRepeatingCallback(TClock::now() + delay, interval, std::move(emit));
    } else {
        entry.Token = scheduler.ScheduleCallback(TClock::now() + delay, [emit = std::move(emit)]() {
            if (!emit(1)) {
                ODIN_TRACE << "timer tick dropped, actor is gone";
            }
        });
    }
    Timers_[id] = std::move(entry);
}

void TActorTimers::Cancel(TTimerId id) {
    auto it = Timers_.find(id);
    if (it == Timers_.end()) {
        return;
    }
    System_->Scheduler().Cancel(it->second.Token);
    Timers_.erase(it);
}

void TActorTimers::CancelAll() {
    for (auto& [id, entry] : Timers_) {
        System_->Scheduler().Cancel(entry.Token);
    }
    Timers_.clear();
}

uint32_t TActorTimers::Accept(const NSignal::TTimer& timer) {
    auto it = Timers_.find(timer.Id);
    if (it == Timers_.end() || it->second.Tick != timer.Tick) {
        return 0;
    }
    uint32_t count = 1 + std::exchange(timer.Tick->Missed, 0);
    if (!it->second.Repeat) {
        Timers_.erase(it);
    }
    return count;
}

void TActorTimers::Done(const NSignal::TTimer& timer) {
    if (timer.Tick) {
        timer.Tick->InFlight = false;
    }
}

TActorSystem::TActorSystem(TPollerBase* poller, TSystemOptions options)
    : Poller_(poller)
    , Options_(options)
    , LoopThread_(std::this_thread::get_id())
{
    if (Options_.MailboxCapacity == 0) {
        throw TOdinError(EErrorKind::ConfigError, "mailbox capacity must be positive");
    }

    Scheduler_ = std::make_unique<TScheduler>(this, poller, Options_.SchedulerGranularity);
    Pool_ = std::make_unique<TBlockingPool>(Options_.BlockingThreads);

    WakeFd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (WakeFd_ < 0) {
        throw std::system_error(errno, std::generic_category(), "eventfd");
    }
    WakeFile_ = std::make_unique<TFileHandle>(WakeFd_, *Poller_);

    DrainTask_ = DrainLoop();
    WakeTask_ = ReadWakeups();

    if (Options_.Heartbeat.count() > 0) {
        HeartbeatToken_ = Scheduler_->ScheduleRepeatingCallback(TClock::now() + Options_.Heartbeat, Options_.Heartbeat, [this](uint32_t) {
            Heartbeat();
            return true;
        });
    }
}

TActorSystem::~TActorSystem() {
    std::vector<std::function<void()>> posted;
    {
        std::lock_guard guard(PostMutex_);
        Stopped_ = true;
        posted.swap(Posted_);
    }
    posted.clear();

    Pool_->Stop();

    std::vector<std::shared_ptr<TCellBase>> cells;
    {
        std::lock_guard guard(RegistryMutex_);
        for (auto& [name, cell] : Cells_) {
            cells.emplace_back(std::move(cell));
        }
        Cells_.clear();
        for (auto& cell : Graveyard_) {
            cells.emplace_back(std::move(cell));
        }
        Graveyard_.clear();
    }
    for (auto& cell : cells) {
        cell->MailboxBase()->Close();
    }
    cells.clear();

    ShutdownTask_ = {};
    if (HeartbeatToken_) {
        Scheduler_->Cancel(HeartbeatToken_);
    }
    Scheduler_.reset();

    for (auto id : DrainTimers_) {
        Poller_->RemoveTimer(id, TTime{});
    }
    if (SignalFile_) {
        SignalFile_->Close();
    }
    SignalTask_ = {};
    WakeFile_->Close();
    WakeTask_ = {};
    DrainTask_ = {};
}

void TActorSystem::Register(std::shared_ptr<TCellBase> cell) {
    std::lock_guard guard(RegistryMutex_);
    auto name = cell->Name();
    auto [it, inserted] = Cells_.emplace(name, std::move(cell));
    if (!inserted) {
        throw TOdinError(EErrorKind::NameConflict, "actor '" + name + "' already exists");
    }
}

size_t TActorSystem::ActorsSize() const {
    std::lock_guard guard(RegistryMutex_);
    return Cells_.size();
}

std::vector<std::shared_ptr<TCellBase>> TActorSystem::Cells() const {
    std::lock_guard guard(RegistryMutex_);
    std::vector<std::shared_ptr<TCellBase>> cells;
    cells.reserve(Cells_.size());
    for (const auto& [name, cell] : Cells_) {
        cells.emplace_back(cell);
    }
    return cells;
}

void TActorSystem::Post(std::function<void()> fn) {
    bool arm = false;
    {
        std::lock_guard guard(PostMutex_);
        if (Stopped_) {
            return;
        }
        Posted_.emplace_back(std::move(fn));
        arm = !std::exchange(DrainScheduled_, true);
    }
    if (!arm) {
        return;
    }
    if (IsLoopThread()) {
        DrainTimers_.push_back(Poller_->AddTimer(TTime{}, DrainTask_.raw()));
    } else {
        uint64_t one = 1;
        if (::write(WakeFd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
            ODIN_ERROR << "cannot wake the loop: " << strerror(errno);
        }
    }
}

void TActorSystem::Drain() {
    std::vector<std::shared_ptr<TCellBase>> dead;
    {
        std::lock_guard guard(RegistryMutex_);
        dead.swap(Graveyard_);
    }
    dead.clear();

    std::vector<std::function<void()>> batch;
    {
        std::lock_guard guard(PostMutex_);
        batch.swap(Posted_);
        DrainScheduled_ = false;
    }
    for (auto& fn : batch) {
        fn();
    }
}

TFuture<void> TActorSystem::DrainLoop() {
    while (true) {
        co_await std::suspend_always{};
        if (!DrainTimers_.empty()) {
            DrainTimers_.pop_front();
        }
        Drain();
    }
}

TFuture<void> TActorSystem::ReadWakeups() {
    uint64_t value = 0;
    while (true) {
        auto size = co_await WakeFile_->ReadSome(&value, sizeof(value));
        if (size == sizeof(value)) {
            Drain();
        }
    }
}

void TActorSystem::HandleSignals(const std::vector<int>& signals) {
    sigset_t mask;
    sigemptyset(&mask);
    for (int sig : signals) {
        sigaddset(&mask, sig);
    }
    if (int err = pthread_sigmask(SIG_BLOCK, &mask, nullptr); err != 0) {
        throw std::system_error(err, std::generic_category(), "pthread_sigmask");
    }
    int fd = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "signalfd");
    }
    if (SignalFile_) {
        SignalFile_->Close();
    }
    SignalTask_ = {};
    SignalFile_ = std::make_unique<TFileHandle>(fd, *Poller_);
    SignalTask_ = ReadSignals();
}

TFuture<void> TActorSystem::ReadSignals() {
    signalfd_siginfo info;
    while (true) {
        auto size = co_await SignalFile_->ReadSome(&info, sizeof(info));
        if (size != sizeof(info)) {
            continue;
        }
        ODIN_INFO << "received signal " << strsignal(info.ssi_signo) << ", shutting down";
        Shutdown();
    }
}

void TActorSystem::Shutdown() {
    if (ShutdownRequested_.exchange(true)) {
        return;
    }
    Post([this]() {
        ShutdownTask_ = RunShutdown();
    });
}

TFuture<void> TActorSystem::RunShutdown() {
    auto cells = Cells();
    ODIN_INFO << "stopping " << cells.size() << " actors";
    for (auto& cell : cells) {
        if (auto res = cell->MailboxBase()->SendSystem(NSignal::TTerminate{}); !res) {
            ODIN_DEBUG << "terminate not delivered: " << res.error().ToString();
        }
    }
    cells.clear();

    if (ActorsSize() > 0) {
        Quiescent_ = std::make_shared<TParked>();
        auto token = Scheduler_->ScheduleCallback(TClock::now() + Options_.GracePeriod, [slot = Quiescent_]() {
            slot->Fire();
        });
        co_await TParkAwaiter(Quiescent_);
        Scheduler_->Cancel(token);
        Quiescent_.reset();
    }

    std::vector<std::shared_ptr<TCellBase>> stuck;
    {
        std::lock_guard guard(RegistryMutex_);
        for (auto& [name, cell] : Cells_) {
            stuck.emplace_back(std::move(cell));
        }
        Cells_.clear();
    }
    for (auto& cell : stuck) {
        ODIN_WARN << "actor '" << cell->Name() << "' did not stop within "
            << Options_.GracePeriod.count() << "ms, dropping it";
        cell->Kill();
    }
    stuck.clear();

    Finished_ = true;
    ODIN_INFO << "actor system stopped";
}

void TActorSystem::OnActorTerminated(TCellBase* cell) {
    bool empty = false;
    {
        std::lock_guard guard(RegistryMutex_);
        auto it = Cells_.find(cell->Name());
        if (it != Cells_.end() && it->second.get() == cell) {
            Graveyard_.emplace_back(std::move(it->second));
            Cells_.erase(it);
        }
        empty = Cells_.empty();
    }
    // the drain also collects the graveyard
    Post([this, empty]() {
        if (empty && Quiescent_) {
            Quiescent_->Fire();
        }
    });
}

void TActorSystem::Heartbeat() {
    ++HeartbeatCycle_;
    for (auto& cell : Cells()) {
        if (cell->PingSent() != 0 && cell->LastPong() < cell->PingSent()) {
            ODIN_WARN << "actor '" << cell->Name() << "' missed heartbeat " << cell->PingSent()
                << " (state " << ToString(cell->State()) << ")";
        }
        if (cell->MailboxBase()->SendSystem(NSignal::TPing{HeartbeatCycle_})) {
            cell->SetPingSent(HeartbeatCycle_);
        }
    }
}

} // namespace NActors
} // namespace NOdin
