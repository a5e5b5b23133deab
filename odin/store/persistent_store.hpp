#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <odin/base.hpp>
#include <odin/log.hpp>

#include "shared_store.hpp"

namespace NOdin {
namespace NStore {

inline constexpr uint16_t SnapshotVersion = 1;

/// Untyped snapshot entry, the value still in its text encoding.
struct TSnapshotEntry {
    std::string Key;
    int64_t Timestamp = 0;
    std::string Owner;
    std::string Comment;
    std::string Value;
};

/**
 * @brief Snapshot file format, little-endian throughout:
 *
 *   u16 version (1), u32 count, count x { str key, i64 timestamp,
 *   str owner, str comment, str value }
 *
 * where str is a u32 length followed by the bytes.
 */
std::string EncodeSnapshot(const std::vector<TSnapshotEntry>& entries);

/// nullopt on unknown version or truncated data.
std::optional<std::vector<TSnapshotEntry>> DecodeSnapshot(std::string_view data);

/// Writes @p data to a temporary file beside @p path and renames it over @p path.
/// @throws std::system_error
void WriteFileAtomically(const std::string& path, std::string_view data);

/// nullopt if the file does not exist. @throws std::system_error on other failures
std::optional<std::string> ReadFile(const std::string& path);

/**
 * @class TPersistentHashMapStore
 * @brief In-memory store mirrored to a snapshot file.
 *
 * Changes mark the store dirty; the owner asks FlushDeadline() when to
 * write. A change inside the debounce window postpones the flush, but never
 * beyond five windows after the first unflushed change.
 */
template<typename V>
class TPersistentHashMapStore: public THashMapStore<V> {
public:
    using TItem = TSharedItem<V>;

    explicit TPersistentHashMapStore(std::string path, std::chrono::milliseconds debounce = std::chrono::milliseconds(200))
        : Path_(std::move(path))
        , Debounce_(debounce)
    { }

    const std::string& Path() const {
        return Path_;
    }

    std::chrono::milliseconds Debounce() const {
        return Debounce_;
    }

    /**
     * @brief Replaces the content with the snapshot file.
     *
     * A missing file gives an empty store. A corrupt file gives an empty
     * store and a warning. Returns the number of loaded items.
     */
    size_t Load() {
        this->Clear();
        MarkClean();

        std::optional<std::string> data;
        try {
            data = ReadFile(Path_);
        } catch (const std::exception& ex) {
            ODIN_WARN << "cannot read store snapshot " << Path_ << ": " << ex.what();
            return 0;
        }
        if (!data) {
            ODIN_INFO << "no store snapshot at " << Path_ << ", starting empty";
            return 0;
        }

        auto entries = DecodeSnapshot(*data);
        if (!entries) {
            ODIN_WARN << "store snapshot " << Path_ << " is corrupt, starting empty";
            return 0;
        }

        std::vector<TItem> items;
        items.reserve(entries->size());
        for (auto& entry : *entries) {
            auto value = TValueCodec<V>::Decode(entry.Value);
            if (!value) {
                ODIN_WARN << "store snapshot " << Path_ << " has an undecodable value for '" << entry.Key << "', starting empty";
                return 0;
            }
            items.emplace_back(TItem{std::move(entry.Key), std::move(*value), entry.Timestamp, std::move(entry.Owner), std::move(entry.Comment)});
        }
        for (auto& item : items) {
            THashMapStore<V>::Insert(std::move(item));
        }
        ODIN_INFO << "loaded " << this->Size() << " items from " << Path_;
        return this->Size();
    }

    std::optional<TItem> Insert(TItem item) override {
        MarkDirty();
        return THashMapStore<V>::Insert(std::move(item));
    }

    std::optional<TItem> Remove(const std::string& key) override {
        auto old = THashMapStore<V>::Remove(key);
        if (old) {
            MarkDirty();
        }
        return old;
    }

    bool Dirty() const {
        return FirstDirty_.has_value();
    }

    /// When the pending changes should be written, nullopt if there are none.
    std::optional<TTime> FlushDeadline() const {
        if (!FirstDirty_) {
            return std::nullopt;
        }
        return std::min(LastChange_ + Debounce_, *FirstDirty_ + 5 * Debounce_);
    }

    std::string Snapshot() const {
        std::vector<TSnapshotEntry> entries;
        entries.reserve(this->Size());
        this->ForEach([&](const TItem& item) {
            entries.emplace_back(TSnapshotEntry{item.Key, item.Timestamp, item.Owner, item.Comment, TValueCodec<V>::Encode(item.Value)});
        });
        return EncodeSnapshot(entries);
    }

    /// Returns when the store first became dirty, for MarkUnflushed().
    std::optional<TTime> MarkClean() {
        return std::exchange(FirstDirty_, std::nullopt);
    }

    /// Restores the dirty state after a failed write of a snapshot taken at MarkClean().
    void MarkUnflushed(std::optional<TTime> dirtySince) {
        if (!dirtySince) {
            return;
        }
        if (!FirstDirty_ || *dirtySince < *FirstDirty_) {
            FirstDirty_ = dirtySince;
        }
    }

    /// Synchronous write, for owners without a blocking pool.
    void FlushNow() {
        WriteFileAtomically(Path_, Snapshot());
        MarkClean();
    }

private:
    void MarkDirty() {
        LastChange_ = TClock::now();
        if (!FirstDirty_) {
            FirstDirty_ = LastChange_;
        }
    }

    std::string Path_;
    std::chrono::milliseconds Debounce_;
    std::optional<TTime> FirstDirty_;
    TTime LastChange_;
};

} // namespace NStore
} // namespace NOdin
