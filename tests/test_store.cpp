#include <chrono>
#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <stdarg.h>
#include <stddef.h>
#include <setjmp.h>
#include <stdlib.h>
#include <thread>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

#include <odin/all.hpp>
#include <odin/actors/actorsystem.hpp>
#include <odin/store/store_actor.hpp>

#include "testlib.h"

extern "C" {
#include <cmocka.h>
}

using namespace NOdin;
using namespace NOdin::NActors;
using namespace NOdin::NStore;
using json = nlohmann::json;

namespace {

using TJsonStore = TSharedStoreActor<json>;
using TJsonStoreHandle = TActorHandle<TSharedStoreMessages<json>>;

class TTempDir {
public:
    TTempDir() {
        char tmpl[] = "/tmp/odin_store_XXXXXX";
        char* dir = mkdtemp(tmpl);
        assert_non_null(dir);
        Path_ = dir;
    }

    ~TTempDir() {
        std::error_code ec;
        std::filesystem::remove_all(Path_, ec);
    }

    std::string File(const std::string& name) const {
        return Path_ + "/" + name;
    }

private:
    std::string Path_;
};

template<typename A, typename Q, typename THandle>
TResult<A> ask(TLoop<TDefaultPoller>& loop, const THandle& handle, Q question) {
    TResult<A> result = MakeError(EErrorKind::Internal, "not answered");
    TFuture<void> h = [](THandle handle, Q question, TResult<A>* result) -> TFuture<void> {
        *result = co_await handle.template Ask<A>(std::move(question), std::chrono::seconds(5));
    }(handle, std::move(question), &result);
    assert_true(step_until(loop, [&]() { return h.done(); }));
    return result;
}

std::optional<TSharedItem<json>> get(TLoop<TDefaultPoller>& loop, const TJsonStoreHandle& store, const std::string& key) {
    auto res = ask<std::optional<TSharedItem<json>>>(loop, store, TGetShared{key});
    assert_true(res.has_value());
    return *res;
}

std::vector<TSharedItem<json>> list(TLoop<TDefaultPoller>& loop, const TJsonStoreHandle& store, const std::string& pattern = "**") {
    auto res = ask<std::vector<TSharedItem<json>>>(loop, store, TListShared{pattern});
    assert_true(res.has_value());
    return *res;
}

struct TRecordedChange {
    EStoreChange Kind;
    std::string Key;
    std::optional<json> Old;
    std::optional<json> New;
    size_t StoreSize = 0;
};

} // namespace

void test_glob(void**) {
    assert_true(GlobMatch("**", "anything.at.all"));
    assert_true(GlobMatch("view.camera", "view.camera"));
    assert_false(GlobMatch("view.camera", "view.cameras"));
    assert_true(GlobMatch("view.*", "view.camera"));
    assert_false(GlobMatch("view.*", "view.camera.lat"));
    assert_true(GlobMatch("view.**", "view.camera.lat"));
    assert_true(GlobMatch("view.**", "view"));
    assert_false(GlobMatch("view.**", "viewer.camera"));
    assert_true(GlobMatch("v?ew.*", "view.x"));
    assert_false(GlobMatch("view?camera", "view.camera"));
    assert_true(GlobMatch("a.*.c", "a.bbb.c"));
    assert_false(GlobMatch("*", "a.b"));
    assert_true(GlobMatch("*.b", "a.b"));
    assert_true(GlobMatch("track-*", "track-42"));
}

void test_hash_map_store(void**) {
    THashMapStore<json> store;
    assert_int_equal(store.Size(), 0);
    assert_null(store.Get("a"));

    assert_false(store.Insert({"a", 1, 10, "me", ""}).has_value());
    auto old = store.Insert({"a", 2, 11, "you", "again"});
    assert_true(old.has_value());
    assert_true(old->Value == json(1));
    assert_true(store.Get("a")->Value == json(2));
    assert_true(store.Contains("a"));

    store.Insert({"b.x", "bx", 12, "", ""});
    store.Insert({"b.y", "by", 13, "", ""});
    int matched = 0;
    store.GlobForEach("b.*", [&](const TSharedItem<json>&) { ++matched; });
    assert_int_equal(matched, 2);

    auto doc = store.ToJson();
    assert_int_equal(doc.size(), 3);
    assert_true(doc["a"]["value"] == json(2));
    assert_string_equal(doc["a"]["owner"].get<std::string>().c_str(), "you");
    assert_string_equal(doc["a"]["comment"].get<std::string>().c_str(), "again");
    assert_int_equal(doc["a"]["timestamp"].get<int64_t>(), 11);

    assert_true(store.Remove("b.x").has_value());
    assert_false(store.Remove("b.x").has_value());
    assert_int_equal(store.Size(), 2);
    store.Clear();
    assert_int_equal(store.Size(), 0);
}

void test_value_codec(void**) {
    assert_string_equal(TValueCodec<int>::Encode(-42).c_str(), "-42");
    assert_int_equal(*TValueCodec<int>::Decode("17"), 17);
    assert_false(TValueCodec<int>::Decode("17x").has_value());
    assert_false(TValueCodec<int>::Decode("").has_value());
    assert_true(*TValueCodec<double>::Decode(TValueCodec<double>::Encode(0.25)) == 0.25);

    assert_true(*TValueCodec<json>::Decode("{\"a\":[1,2]}") == json({{"a", {1, 2}}}));
    assert_false(TValueCodec<json>::Decode("{broken").has_value());
    assert_string_equal(TValueCodec<std::string>::Decode("plain")->c_str(), "plain");
}

void test_snapshot_codec(void**) {
    std::vector<TSnapshotEntry> entries = {
        {"a", 1, "owner", "", "{\"x\":1}"},
        {"b", -5, "", "note", std::string("\0bin", 4)},
    };
    auto data = EncodeSnapshot(entries);
    assert_int_equal(static_cast<uint8_t>(data[0]), 1);
    assert_int_equal(static_cast<uint8_t>(data[1]), 0);

    auto decoded = DecodeSnapshot(data);
    assert_true(decoded.has_value());
    assert_int_equal(decoded->size(), 2);
    assert_string_equal((*decoded)[0].Owner.c_str(), "owner");
    assert_int_equal((*decoded)[1].Timestamp, -5);
    assert_true((*decoded)[1].Value == std::string("\0bin", 4));

    auto empty = DecodeSnapshot(EncodeSnapshot({}));
    assert_true(empty.has_value());
    assert_true(empty->empty());

    for (size_t cut = 0; cut < data.size(); ++cut) {
        assert_false(DecodeSnapshot(std::string_view(data).substr(0, cut)).has_value());
    }
    assert_false(DecodeSnapshot(data + "x").has_value());

    auto badVersion = data;
    badVersion[0] = 2;
    assert_false(DecodeSnapshot(badVersion).has_value());
}

void test_files(void**) {
    TTempDir dir;
    auto path = dir.File("data.bin");
    assert_false(ReadFile(path).has_value());

    WriteFileAtomically(path, "first");
    WriteFileAtomically(path, "second");
    assert_string_equal(ReadFile(path)->c_str(), "second");
    assert_false(std::filesystem::exists(path + ".tmp"));

    bool thrown = false;
    try {
        WriteFileAtomically(dir.File("missing/dir/file"), "x");
    } catch (const std::system_error&) {
        thrown = true;
    }
    assert_true(thrown);

    // a failed rename must still release the temporary file's descriptor
    auto open_fds = []() {
        auto n = std::distance(std::filesystem::directory_iterator("/proc/self/fd"), std::filesystem::directory_iterator{});
        return static_cast<long>(n);
    };
    std::filesystem::create_directories(dir.File("occupied/child"));
    auto fdsBefore = open_fds();
    thrown = false;
    try {
        WriteFileAtomically(dir.File("occupied"), "x");
    } catch (const std::system_error&) {
        thrown = true;
    }
    assert_true(thrown);
    assert_int_equal(open_fds(), fdsBefore);
    assert_false(std::filesystem::exists(dir.File("occupied.tmp")));
}

void test_persistent_store(void**) {
    TTempDir dir;
    auto path = dir.File("store.bin");

    TPersistentHashMapStore<json> store(path, std::chrono::milliseconds(50));
    assert_int_equal(store.Load(), 0);
    assert_false(store.Dirty());
    assert_false(store.FlushDeadline().has_value());

    store.Insert({"view.camera", {{"lat", 37.4}}, 100, "admin", "home"});
    store.Insert({"count", 3, 101, "", ""});
    assert_true(store.Dirty());
    assert_false(store.Remove("missing").has_value());

    store.FlushNow();
    assert_false(store.Dirty());

    TPersistentHashMapStore<json> reloaded(path);
    assert_int_equal(reloaded.Load(), 2);
    assert_true(*reloaded.Get("view.camera") == *store.Get("view.camera"));
    assert_true(reloaded.Get("count")->Value == json(3));
    assert_false(reloaded.Dirty());

    // removing a missing key changes nothing
    assert_false(reloaded.Remove("nope").has_value());
    assert_false(reloaded.Dirty());
    assert_true(reloaded.Remove("count").has_value());
    assert_true(reloaded.Dirty());
}

void test_persistent_store_corrupt(void**) {
    TTempDir dir;
    auto path = dir.File("store.bin");
    WriteFileAtomically(path, "definitely not a snapshot");

    int warnings = 0;
    TLogger::Instance().SetSink([&](ELogLevel level, const std::string&) {
        if (level == ELogLevel::Warn) {
            ++warnings;
        }
    });
    TPersistentHashMapStore<json> store(path);
    store.Insert({"stale", 1, 0, "", ""});
    assert_int_equal(store.Load(), 0);
    TLogger::Instance().ResetSink();

    assert_int_equal(store.Size(), 0);
    assert_int_equal(warnings, 1);

    // an undecodable value spoils the whole file
    WriteFileAtomically(path, EncodeSnapshot({{"k", 0, "", "", "{not json"}}));
    assert_int_equal(store.Load(), 0);
}

void test_flush_deadline(void**) {
    TPersistentHashMapStore<int> store("/nonexistent/never-written", std::chrono::milliseconds(20));

    auto before = TClock::now();
    store.Insert({"k", 1, 0, "", ""});
    auto after = TClock::now();
    auto deadline = *store.FlushDeadline();
    assert_true(deadline >= before + std::chrono::milliseconds(20));
    assert_true(deadline <= after + std::chrono::milliseconds(20));

    // steady changes push the deadline out, but not past five windows
    for (int i = 0; i < 15; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        store.Insert({"k", i, 0, "", ""});
    }
    deadline = *store.FlushDeadline();
    assert_true(deadline >= before + std::chrono::milliseconds(100));
    assert_true(deadline <= after + std::chrono::milliseconds(100));

    auto dirtySince = store.MarkClean();
    assert_true(dirtySince.has_value());
    assert_false(store.FlushDeadline().has_value());

    // a failed write puts the store back to dirty, keeping the first change time
    store.MarkUnflushed(dirtySince);
    assert_true(store.Dirty());
    assert_true(*store.FlushDeadline() <= *dirtySince + std::chrono::milliseconds(100));
    store.MarkClean();
    store.MarkUnflushed(std::nullopt);
    assert_false(store.Dirty());
}

void test_store_changes(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    std::vector<TRecordedChange> changes;

    auto store = system.Spawn<TJsonStore>("store", {}, TSharedStoreOptions{});
    assert_true(store.TrySend(TSubscribeStore<json>{MakeDynAction<TSharedStoreChange<json>>([&](const TSharedStoreChange<json>& change) {
        TRecordedChange rec{change.Kind, change.Key, std::nullopt, std::nullopt, change.Store->Size()};
        if (change.Old) {
            rec.Old = change.Old->Value;
        }
        if (change.New) {
            rec.New = change.New->Value;
        }
        changes.push_back(rec);
    })}).has_value());

    assert_true(store.TrySend(TSetShared<json>{"a", 1, "alice", ""}).has_value());
    assert_true(store.TrySend(TSetShared<json>{"b", 2, "bob", ""}).has_value());
    assert_true(store.TrySend(TSetShared<json>{"a", 3, "carol", "fix"}).has_value());
    assert_true(store.TrySend(TRemoveShared{"b"}).has_value());
    assert_true(store.TrySend(TRemoveShared{"missing"}).has_value());
    assert_true(store.TrySend(TSetShared<json>{"c", "done", "", ""}).has_value());

    assert_true(step_until(loop, [&]() { return changes.size() == 5; }));
    step_for(loop, std::chrono::milliseconds(20));
    assert_int_equal(changes.size(), 5);

    assert_true(changes[0].Kind == EStoreChange::Set);
    assert_string_equal(changes[0].Key.c_str(), "a");
    assert_false(changes[0].Old.has_value());
    assert_true(*changes[0].New == json(1));
    assert_int_equal(changes[0].StoreSize, 1);

    assert_string_equal(changes[1].Key.c_str(), "b");
    assert_int_equal(changes[1].StoreSize, 2);

    assert_string_equal(changes[2].Key.c_str(), "a");
    assert_true(*changes[2].Old == json(1));
    assert_true(*changes[2].New == json(3));

    assert_true(changes[3].Kind == EStoreChange::Remove);
    assert_string_equal(changes[3].Key.c_str(), "b");
    assert_true(*changes[3].Old == json(2));
    assert_false(changes[3].New.has_value());
    assert_int_equal(changes[3].StoreSize, 1);

    assert_string_equal(changes[4].Key.c_str(), "c");

    auto a = get(loop, store, "a");
    assert_true(a.has_value());
    assert_string_equal(a->Owner.c_str(), "carol");
    assert_string_equal(a->Comment.c_str(), "fix");
    assert_true(a->Timestamp > 0);
    assert_false(get(loop, store, "b").has_value());
}

void test_store_failing_subscriber(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    int good = 0;

    auto store = system.Spawn<TJsonStore>("store", {}, TSharedStoreOptions{});
    store.TrySend(TSubscribeStore<json>{MakeDynAction<TSharedStoreChange<json>>([](const TSharedStoreChange<json>&) {
        return false;
    })});
    store.TrySend(TSubscribeStore<json>{MakeDynAction<TSharedStoreChange<json>>([&](const TSharedStoreChange<json>&) {
        ++good;
    })});
    store.TrySend(TSetShared<json>{"k", 1, "", ""});

    assert_true(step_until(loop, [&]() { return good == 1; }));
    // a failing subscriber does not stop the store
    assert_true(get(loop, store, "k").has_value());
    assert_true(store.IsAlive());
}

void test_store_snapshot_action(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    size_t seenSize = 0;
    std::vector<std::string> keys;

    auto store = system.Spawn<TJsonStore>("store", {}, TSharedStoreOptions{});
    store.TrySend(TSetShared<json>{"x.1", 1, "", ""});
    store.TrySend(TSetShared<json>{"x.2", 2, "", ""});
    store.TrySend(TSetShared<json>{"y.1", 3, "", ""});
    store.TrySend(TExecSnapshotAction<json>{MakeDynAction<ISharedStore<json>>([&](const ISharedStore<json>& s) {
        seenSize = s.Size();
        s.GlobForEach("x.*", [&](const TSharedItem<json>& item) { keys.push_back(item.Key); });
    })});

    assert_true(step_until(loop, [&]() { return seenSize != 0; }));
    assert_int_equal(seenSize, 3);
    assert_int_equal(keys.size(), 2);
}

void test_store_list(void**) {
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());

    auto store = system.Spawn<TJsonStore>("store", {}, TSharedStoreOptions{});
    for (auto key : {"track.3", "track.1", "view.camera", "track.2"}) {
        store.TrySend(TSetShared<json>{key, key, "", ""});
    }

    auto tracks = list(loop, store, "track.*");
    assert_int_equal(tracks.size(), 3);
    assert_string_equal(tracks[0].Key.c_str(), "track.1");
    assert_string_equal(tracks[1].Key.c_str(), "track.2");
    assert_string_equal(tracks[2].Key.c_str(), "track.3");

    auto all = list(loop, store);
    assert_int_equal(all.size(), 4);
    assert_string_equal(all[3].Key.c_str(), "view.camera");
    assert_true(list(loop, store, "none.*").empty());
}

void test_store_persistence(void**) {
    TTempDir dir;
    auto path = dir.File("shared.bin");

    {
        TLoop<TDefaultPoller> loop;
        TActorSystem system(&loop.Poller());
        auto store = system.Spawn<TJsonStore>("store", {}, TSharedStoreOptions{path, std::chrono::seconds(60)});
        store.TrySend(TSetShared<json>{"view.camera", {{"lat", 37.4}, {"lon", -122.1}}, "admin", "default view"});
        assert_true(step_until(loop, [&]() { return get(loop, store, "view.camera").has_value(); }));
        // the debounce window is long, so only the stop flush can write it
        assert_false(std::filesystem::exists(path));

        system.Shutdown();
        system.ProcessRequests(loop);
        assert_true(std::filesystem::exists(path));
    }

    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    size_t initSize = 100;
    auto init = MakeDynAction<ISharedStore<json>>([&](const ISharedStore<json>& s) { initSize = s.Size(); });
    auto store = system.Spawn<TJsonStore>("store", {}, TSharedStoreOptions{path}, init);

    auto item = get(loop, store, "view.camera");
    assert_true(item.has_value());
    assert_int_equal(initSize, 1);
    assert_true(item->Value["lat"] == json(37.4));
    assert_string_equal(item->Owner.c_str(), "admin");
    assert_string_equal(item->Comment.c_str(), "default view");
}

void test_store_debounced_flush(void**) {
    TTempDir dir;
    auto path = dir.File("shared.bin");
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());

    auto store = system.Spawn<TJsonStore>("store", {}, TSharedStoreOptions{path, std::chrono::milliseconds(20)});
    store.TrySend(TSetShared<json>{"k", 1, "", ""});
    assert_true(step_until(loop, [&]() { return std::filesystem::exists(path); }, std::chrono::seconds(2)));

    auto entries = DecodeSnapshot(*ReadFile(path));
    assert_true(entries.has_value());
    assert_int_equal(entries->size(), 1);
    assert_string_equal((*entries)[0].Value.c_str(), "1");

    std::filesystem::remove(path);
    store.TrySend(TSetShared<json>{"k", 2, "", ""});
    store.TrySend(TFlushStore{});
    assert_true(step_until(loop, [&]() { return std::filesystem::exists(path); }, std::chrono::seconds(2)));
}

void test_store_flush_retry(void**) {
    TTempDir dir;
    auto path = dir.File("later/shared.bin");
    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());

    int errors = 0;
    TLogger::Instance().SetSink([&](ELogLevel level, const std::string&) {
        if (level == ELogLevel::Error) {
            ++errors;
        }
    });
    auto store = system.Spawn<TJsonStore>("store", {}, TSharedStoreOptions{path, std::chrono::seconds(60)});
    store.TrySend(TSetShared<json>{"k", 1, "", ""});
    store.TrySend(TFlushStore{});
    bool failed = step_until(loop, [&]() { return errors > 0; }, std::chrono::seconds(2));
    TLogger::Instance().ResetSink();
    assert_true(failed);
    assert_false(std::filesystem::exists(path));

    // nothing changed since, but the failed write left the store dirty
    std::filesystem::create_directories(dir.File("later"));
    store.TrySend(TFlushStore{});
    assert_true(step_until(loop, [&]() { return std::filesystem::exists(path); }, std::chrono::seconds(2)));

    auto entries = DecodeSnapshot(*ReadFile(path));
    assert_true(entries.has_value());
    assert_int_equal(entries->size(), 1);
}

void test_store_corrupt_snapshot(void**) {
    TTempDir dir;
    auto path = dir.File("shared.bin");
    WriteFileAtomically(path, std::string("\x01\x00\x05\x00\x00\x00", 6));

    TLoop<TDefaultPoller> loop;
    TActorSystem system(&loop.Poller());
    auto store = system.Spawn<TSharedStoreActor<int>>("store", {}, TSharedStoreOptions{path});
    using THandle = TActorHandle<TSharedStoreMessages<int>>;
    THandle handle = store;

    auto all = ask<std::vector<TSharedItem<int>>>(loop, handle, TListShared{});
    assert_true(all.has_value());
    assert_true(all->empty());
    assert_true(store.IsAlive());
}

int main(int argc, char** argv) {
    TInitializer init;

    std::vector<CMUnitTest> tests;
    std::unordered_set<std::string> filters;
    tests.reserve(100);

    parse_filters(argc, argv, filters);

    ADD_TEST(cmocka_unit_test, test_glob);
    ADD_TEST(cmocka_unit_test, test_hash_map_store);
    ADD_TEST(cmocka_unit_test, test_value_codec);
    ADD_TEST(cmocka_unit_test, test_snapshot_codec);
    ADD_TEST(cmocka_unit_test, test_files);
    ADD_TEST(cmocka_unit_test, test_persistent_store);
    ADD_TEST(cmocka_unit_test, test_persistent_store_corrupt);
    ADD_TEST(cmocka_unit_test, test_flush_deadline);
    ADD_TEST(cmocka_unit_test, test_store_changes);
    ADD_TEST(cmocka_unit_test, test_store_failing_subscriber);
    ADD_TEST(cmocka_unit_test, test_store_snapshot_action);
    ADD_TEST(cmocka_unit_test, test_store_list);
    ADD_TEST(cmocka_unit_test, test_store_persistence);
    ADD_TEST(cmocka_unit_test, test_store_debounced_flush);
    ADD_TEST(cmocka_unit_test, test_store_flush_retry);
    ADD_TEST(cmocka_unit_test, test_store_corrupt_snapshot);

    return _cmocka_run_group_tests("test_store", tests.data(), tests.size(), NULL, NULL);
}
