#include "persistent_store.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace NOdin {
namespace NStore {

namespace {

class TSnapshotWriter {
public:
    template<typename T>
    void Int(T value) {
        for (size_t i = 0; i < sizeof(T); ++i) {
            Data_.push_back(static_cast<char>((static_cast<uint64_t>(value) >> (8 * i)) & 0xff));
        }
    }

    void Str(std::string_view value) {
        Int(static_cast<uint32_t>(value.size()));
        Data_.append(value);
    }

    std::string Release() {
        return std::move(Data_);
    }

private:
    std::string Data_;
};

class TSnapshotReader {
public:
    explicit TSnapshotReader(std::string_view data)
        : Data_(data)
    { }

    template<typename T>
    bool Int(T& value) {
        if (Data_.size() < sizeof(T)) {
            return false;
        }
        uint64_t result = 0;
        for (size_t i = 0; i < sizeof(T); ++i) {
            result |= static_cast<uint64_t>(static_cast<uint8_t>(Data_[i])) << (8 * i);
        }
        value = static_cast<T>(result);
        Data_.remove_prefix(sizeof(T));
        return true;
    }

    bool Str(std::string& value) {
        uint32_t size = 0;
        if (!Int(size) || Data_.size() < size) {
            return false;
        }
        value.assign(Data_.data(), size);
        Data_.remove_prefix(size);
        return true;
    }

    bool Empty() const {
        return Data_.empty();
    }

private:
    std::string_view Data_;
};

} // namespace

std::string EncodeSnapshot(const std::vector<TSnapshotEntry>& entries) {
    TSnapshotWriter writer;
    writer.Int(SnapshotVersion);
    writer.Int(static_cast<uint32_t>(entries.size()));
    for (const auto& entry : entries) {
        writer.Str(entry.Key);
        writer.Int(entry.Timestamp);
        writer.Str(entry.Owner);
        writer.Str(entry.Comment);
        writer.Str(entry.Value);
    }
    return writer.Release();
}

std::optional<std::vector<TSnapshotEntry>> DecodeSnapshot(std::string_view data) {
    TSnapshotReader reader(data);
    uint16_t version = 0;
    uint32_t count = 0;
    if (!reader.Int(version) || version != SnapshotVersion || !reader.Int(count)) {
        return std::nullopt;
    }

    std::vector<TSnapshotEntry> entries;
    for (uint32_t i = 0; i < count; ++i) {
        TSnapshotEntry entry;
        if (!reader.Str(entry.Key)
            || !reader.Int(entry.Timestamp)
            || !reader.Str(entry.Owner)
            || !reader.Str(entry.Comment)
            || !reader.Str(entry.Value))
        {
            return std::nullopt;
        }
        entries.emplace_back(std::move(entry));
    }
    if (!reader.Empty()) {
        return std::nullopt;
    }
    return entries;
}

void WriteFileAtomically(const std::string& path, std::string_view data) {
    auto tmp = path + ".tmp";
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "open " + tmp);
    }

    size_t written = 0;
    while (written < data.size()) {
        auto n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            ::close(fd);
            ::unlink(tmp.c_str());
            throw std::system_error(err, std::generic_category(), "write " + tmp);
        }
        written += static_cast<size_t>(n);
    }

    int err = ::fsync(fd) < 0 ? errno : 0;
    if (::close(fd) < 0 && err == 0) {
        err = errno;
    }
    if (err != 0) {
        ::unlink(tmp.c_str());
        throw std::system_error(err, std::generic_category(), "sync " + tmp);
    }
    if (::rename(tmp.c_str(), path.c_str()) < 0) {
        err = errno;
        ::unlink(tmp.c_str());
        throw std::system_error(err, std::generic_category(), "rename " + tmp);
    }
}

std::optional<std::string> ReadFile(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT) {
            return std::nullopt;
        }
        throw std::system_error(errno, std::generic_category(), "open " + path);
    }

    std::string data;
    char buf[65536];
    while (true) {
        auto n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            ::close(fd);
            throw std::system_error(err, std::generic_category(), "read " + path);
        }
        if (n == 0) {
            break;
        }
        data.append(buf, static_cast<size_t>(n));
    }
    ::close(fd);
    return data;
}

} // namespace NStore
} // namespace NOdin
