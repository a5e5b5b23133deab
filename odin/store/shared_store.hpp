#pragma once

#include <charconv>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace NOdin {
namespace NStore {

/// Milliseconds since the Unix epoch.
inline int64_t NowMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

/**
 * @brief Matches a dotted key against a glob.
 *
 * `*` matches any run of characters inside one key segment, `?` one
 * character other than '.', and a trailing `.**` or a lone `**` any
 * number of remaining segments.
 */
bool GlobMatch(std::string_view pattern, std::string_view key);

template<typename V>
struct TSharedItem {
    std::string Key;
    V Value{};
    int64_t Timestamp = 0;
    std::string Owner;
    std::string Comment;

    bool operator==(const TSharedItem&) const = default;
};

/**
 * @brief Text encoding of store values, used for snapshots and JSON views.
 */
template<typename V>
struct TValueCodec;

template<>
struct TValueCodec<std::string> {
    static std::string Encode(const std::string& value) {
        return value;
    }

    static std::optional<std::string> Decode(std::string_view text) {
        return std::string(text);
    }

    static nlohmann::json ToJson(const std::string& value) {
        return value;
    }
};

template<>
struct TValueCodec<nlohmann::json> {
    static std::string Encode(const nlohmann::json& value) {
        return value.dump();
    }

    static std::optional<nlohmann::json> Decode(std::string_view text) {
        auto value = nlohmann::json::parse(text, nullptr, false);
        if (value.is_discarded()) {
            return std::nullopt;
        }
        return value;
    }

    static nlohmann::json ToJson(const nlohmann::json& value) {
        return value;
    }
};

template<typename V>
    requires (std::is_arithmetic_v<V> && !std::is_same_v<V, bool>)
struct TValueCodec<V> {
    static std::string Encode(V value) {
        char buf[64];
        auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
        return std::string(buf, end);
    }

    static std::optional<V> Decode(std::string_view text) {
        V value{};
        auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || end != text.data() + text.size()) {
            return std::nullopt;
        }
        return value;
    }

    static nlohmann::json ToJson(V value) {
        return value;
    }
};

/**
 * @class ISharedStore
 * @brief Key to item map as seen by the store actor and its observers.
 */
template<typename V>
class ISharedStore {
public:
    using TItem = TSharedItem<V>;

    virtual ~ISharedStore() = default;

    virtual const TItem* Get(const std::string& key) const = 0;
    virtual size_t Size() const = 0;
    virtual void ForEach(const std::function<void(const TItem&)>& func) const = 0;

    /// Inserts or replaces an item, returns the previous one.
    virtual std::optional<TItem> Insert(TItem item) = 0;
    virtual std::optional<TItem> Remove(const std::string& key) = 0;

    bool Contains(const std::string& key) const {
        return Get(key) != nullptr;
    }

    void GlobForEach(std::string_view pattern, const std::function<void(const TItem&)>& func) const {
        ForEach([&](const TItem& item) {
            if (GlobMatch(pattern, item.Key)) {
                func(item);
            }
        });
    }

    /// `{"<key>": {"key": .., "value": .., "timestamp": .., "owner": .., "comment": ..}, ..}`
    nlohmann::json ToJson() const {
        auto result = nlohmann::json::object();
        ForEach([&](const TItem& item) {
            result[item.Key] = ItemToJson(item);
        });
        return result;
    }

    static nlohmann::json ItemToJson(const TItem& item) {
        return {
            {"key", item.Key},
            {"value", TValueCodec<V>::ToJson(item.Value)},
            {"timestamp", item.Timestamp},
            {"owner", item.Owner},
            {"comment", item.Comment},
        };
    }
};

/// In-memory store.
template<typename V>
class THashMapStore: public ISharedStore<V> {
public:
    using TItem = TSharedItem<V>;

    const TItem* Get(const std::string& key) const override {
        auto it = Items_.find(key);
        return it == Items_.end() ? nullptr : &it->second;
    }

    size_t Size() const override {
        return Items_.size();
    }

    void ForEach(const std::function<void(const TItem&)>& func) const override {
        for (const auto& [key, item] : Items_) {
            func(item);
        }
    }

    std::optional<TItem> Insert(TItem item) override {
        std::optional<TItem> old;
        auto it = Items_.find(item.Key);
        if (it != Items_.end()) {
            old = std::move(it->second);
            it->second = std::move(item);
        } else {
            auto key = item.Key;
            Items_.emplace(std::move(key), std::move(item));
        }
        return old;
    }

    std::optional<TItem> Remove(const std::string& key) override {
        auto it = Items_.find(key);
        if (it == Items_.end()) {
            return std::nullopt;
        }
        std::optional<TItem> old(std::move(it->second));
        Items_.erase(it);
        return old;
    }

    void Clear() {
        Items_.clear();
    }

private:
    std::unordered_map<std::string, TItem> Items_;
};

} // namespace NStore
} // namespace NOdin
