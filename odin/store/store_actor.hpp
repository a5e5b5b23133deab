#pragma once

#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <odin/action/action.hpp>
#include <odin/actors/actor.hpp>
#include <odin/actors/actorsystem.hpp>
#include <odin/log.hpp>

#include "persistent_store.hpp"
#include "shared_store.hpp"

namespace NOdin {
namespace NStore {

template<typename V>
struct TSetShared {
    std::string Key;
    V Value{};
    std::string Owner;
    std::string Comment;
};

struct TRemoveShared {
    std::string Key;
};

/// Runs a read-only action over the whole store, between two changes.
template<typename V>
struct TExecSnapshotAction {
    NAction::TDynAction<ISharedStore<V>> Action;
};

enum class EStoreChange {
    Set,
    Remove,
};

template<typename V>
struct TSharedStoreChange {
    EStoreChange Kind = EStoreChange::Set;
    std::string Key;
    std::optional<TSharedItem<V>> Old;
    std::optional<TSharedItem<V>> New;
    // valid while the change action runs
    const ISharedStore<V>* Store = nullptr;
};

/// Registers an action executed for every subsequent change.
template<typename V>
struct TSubscribeStore {
    NAction::TDynAction<TSharedStoreChange<V>> Action;
};

struct TGetShared {
    std::string Key;
};

template<typename V>
using TQueryShared = NActors::TQuery<TGetShared, std::optional<TSharedItem<V>>>;

/// Every item whose key matches @p Pattern (see GlobMatch), ordered by key.
struct TListShared {
    std::string Pattern = "**";
};

template<typename V>
using TQuerySharedItems = NActors::TQuery<TListShared, std::vector<TSharedItem<V>>>;

/// Writes pending changes now.
struct TFlushStore { };

template<typename V>
using TSharedStoreMessages = NActors::TMessageSet<
    TSetShared<V>,
    TRemoveShared,
    TExecSnapshotAction<V>,
    TSubscribeStore<V>,
    TQueryShared<V>,
    TQuerySharedItems<V>,
    TFlushStore>;

struct TSharedStoreOptions {
    // empty: memory only
    std::string Path;
    std::chrono::milliseconds Debounce{200};
};

/**
 * @class TSharedStoreActor
 * @brief Owns a shared store and serializes every access through its mailbox.
 *
 * Changes are applied in mailbox order and fanned out to the subscribed
 * actions in the same order. With a path configured the store is loaded
 * from its snapshot on start and written back after changes settle, and
 * once more on stop.
 *
 * @code{.cpp}
 * auto store = system.Spawn<TSharedStoreActor<nlohmann::json>>("store", {}, TSharedStoreOptions{"/var/lib/odin/shared.bin"});
 * store.TrySend(TSetShared<nlohmann::json>{"view.camera", {{"lat", 37.4}}, "admin", ""});
 * @endcode
 */
template<typename V>
class TSharedStoreActor: public NActors::TActor<TSharedStoreActor<V>, TSharedStoreMessages<V>> {
public:
    using TMessages = TSharedStoreMessages<V>;
    using TContext = NActors::TActorContext<TMessages>;
    using TChange = TSharedStoreChange<V>;

    static constexpr NActors::TTimerId FlushTimer = 1;

    explicit TSharedStoreActor(TSharedStoreOptions options, NAction::TDynAction<ISharedStore<V>> init = {})
        : Options_(std::move(options))
        , Init_(std::move(init))
    {
        if (Options_.Path.empty()) {
            Store_ = std::make_unique<THashMapStore<V>>();
        } else {
            auto store = std::make_unique<TPersistentHashMapStore<V>>(Options_.Path, Options_.Debounce);
            Persistent_ = store.get();
            Store_ = std::move(store);
        }
    }

    TFuture<void> OnStart(TContext& ctx) override {
        if (Persistent_) {
            auto* store = Persistent_;
            auto load = [store]() { store->Load(); };
            co_await ctx.Offload(std::move(load));
        }
        if (Init_) {
            auto res = co_await Init_->Execute(*Store_);
            if (!res) {
                ODIN_WARN << "init action of '" << ctx.Name() << "' failed: " << res.error().ToString();
            }
        }
    }

    TFuture<void> OnStop(TContext& ctx) override {
        if (Persistent_ && Persistent_->Dirty()) {
            co_await Flush(ctx);
        }
    }

    TFuture<NActors::TReceiveAction> OnTimer(NActors::TTimerId id, uint32_t, TContext& ctx) override {
        if (id == FlushTimer) {
            co_await MaybeFlush(ctx);
        }
        co_return NActors::TReceiveAction::Continue();
    }

    TFuture<void> Receive(TSetShared<V>&& set, TContext& ctx) {
        TSharedItem<V> item{std::move(set.Key), std::move(set.Value), NowMillis(), std::move(set.Owner), std::move(set.Comment)};
        auto old = Store_->Insert(item);
        auto key = item.Key;
        // GCC 12 destroys prvalue coroutine arguments inside co_await twice
        TChange change{EStoreChange::Set, std::move(key), std::move(old), std::move(item), Store_.get()};
        co_await Notify(std::move(change));
        SchedulePersist(ctx);
    }

    TFuture<void> Receive(TRemoveShared&& remove, TContext& ctx) {
        auto old = Store_->Remove(remove.Key);
        if (!old) {
            co_return;
        }
        TChange change{EStoreChange::Remove, std::move(remove.Key), std::move(old), std::nullopt, Store_.get()};
        co_await Notify(std::move(change));
        SchedulePersist(ctx);
    }

    TFuture<void> Receive(TExecSnapshotAction<V>&& exec, TContext& ctx) {
        if (!exec.Action) {
            co_return;
        }
        auto res = co_await exec.Action->Execute(*Store_);
        if (!res) {
            ODIN_WARN << "snapshot action on '" << ctx.Name() << "' failed: " << res.error().ToString();
        }
    }

    void Receive(TSubscribeStore<V>&& subscribe, TContext&) {
        if (!subscribe.Action) {
            return;
        }
        Changes_.Add(NAction::TAction<TChange>([action = std::move(subscribe.Action)](const TChange& change) {
            return action->Execute(change);
        }, "store change action"));
    }

    void Receive(TQueryShared<V>&& query, TContext&) {
        std::optional<TSharedItem<V>> item;
        if (auto* found = Store_->Get(query.Question.Key)) {
            item = *found;
        }
        query.Respond(std::move(item));
    }

    void Receive(TQuerySharedItems<V>&& query, TContext&) {
        std::vector<TSharedItem<V>> items;
        Store_->GlobForEach(query.Question.Pattern, [&](const TSharedItem<V>& item) {
            items.push_back(item);
        });
        std::sort(items.begin(), items.end(), [](const auto& a, const auto& b) {
            return a.Key < b.Key;
        });
        query.Respond(std::move(items));
    }

    TFuture<void> Receive(TFlushStore&&, TContext& ctx) {
        if (Persistent_ && Persistent_->Dirty()) {
            co_await Flush(ctx);
        }
    }

    const ISharedStore<V>& Store() const {
        return *Store_;
    }

private:
    TFuture<void> Notify(TChange change) {
        if (Changes_.Empty()) {
            co_return;
        }
        auto res = co_await Changes_.Execute(change);
        if (!res) {
            ODIN_WARN << "change of '" << change.Key << "': " << res.error().ToString();
        }
    }

    void SchedulePersist(TContext& ctx) {
        if (!Persistent_) {
            return;
        }
        if (auto deadline = Persistent_->FlushDeadline()) {
            auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - TClock::now());
            ctx.StartTimer(FlushTimer, std::max(delay, std::chrono::milliseconds(0)));
        }
    }

    TFuture<void> MaybeFlush(TContext& ctx) {
        if (!Persistent_) {
            co_return;
        }
        auto deadline = Persistent_->FlushDeadline();
        if (!deadline) {
            co_return;
        }
        if (TClock::now() < *deadline) {
            SchedulePersist(ctx);
            co_return;
        }
        co_await Flush(ctx);
    }

    TFuture<void> Flush(TContext& ctx) {
        auto data = Persistent_->Snapshot();
        auto path = Persistent_->Path();
        auto count = Persistent_->Size();
        // changes made while the write runs mark the store dirty again
        auto dirtySince = Persistent_->MarkClean();
        auto write = [path, data = std::move(data)]() {
            WriteFileAtomically(path, data);
        };
        try {
            co_await ctx.Offload(std::move(write));
            ODIN_DEBUG << "wrote " << count << " items to " << path;
        } catch (const std::exception& ex) {
            ODIN_ERROR << "cannot write store snapshot " << path << ": " << ex.what();
            Persistent_->MarkUnflushed(dirtySince);
        }
    }

    TSharedStoreOptions Options_;
    NAction::TDynAction<ISharedStore<V>> Init_;
    std::unique_ptr<ISharedStore<V>> Store_;
    TPersistentHashMapStore<V>* Persistent_ = nullptr;
    NAction::TActionList<TChange> Changes_;
};

} // namespace NStore
} // namespace NOdin
