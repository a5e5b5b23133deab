#pragma once

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

#include "corochain.hpp"

namespace NOdin {

/**
 * @brief Buffered reader over any stream with an awaitable ReadSome().
 *
 * Bytes read past a delimiter stay in the internal buffer and are returned
 * by the next call, so one reader must be used for the whole stream.
 */
template<typename TStream>
class TByteReader {
public:
    TByteReader(TStream& stream, std::string buffered = {})
        : Stream_(stream)
        , Buffer_(std::move(buffered))
    { }

    /// Hands over bytes read ahead but not consumed yet.
    std::string TakeBuffer() {
        return std::exchange(Buffer_, {});
    }

    /// Reads exactly @p size bytes. Throws if the peer closes first.
    TFuture<void> Read(void* data, size_t size) {
        char* out = static_cast<char*>(data);
        size_t copied = Drain(out, size);
        while (copied < size) {
            copied += co_await ReadOnce(out + copied, size - copied);
        }
    }

    /// Reads up to and including @p delimiter, failing once more than @p limit bytes are buffered.
    TFuture<std::string> ReadUntil(const std::string& delimiter, size_t limit = std::string::npos) {
        char chunk[4096];
        size_t from = 0;
        while (true) {
            auto pos = Buffer_.find(delimiter, from);
            if (pos != std::string::npos) {
                auto end = pos + delimiter.size();
                std::string line = Buffer_.substr(0, end);
                Buffer_.erase(0, end);
                co_return line;
            }
            if (Buffer_.size() > limit) {
                throw std::runtime_error("Delimiter not found within " + std::to_string(limit) + " bytes");
            }
            // a delimiter can straddle two chunks
            from = Buffer_.size() >= delimiter.size() ? Buffer_.size() - delimiter.size() + 1 : 0;
            auto n = co_await ReadOnce(chunk, sizeof(chunk));
            Buffer_.append(chunk, n);
        }
    }

    /// Buffered bytes if there are any, otherwise one read. 0 means end of stream.
    TFuture<ssize_t> ReadSome(void* data, size_t size) {
        if (!Buffer_.empty()) {
            co_return static_cast<ssize_t>(Drain(static_cast<char*>(data), size));
        }
        ssize_t n;
        do {
            n = co_await Stream_.ReadSome(data, size);
        } while (n < 0);
        co_return n;
    }

private:
    size_t Drain(char* out, size_t size) {
        size_t n = std::min(size, Buffer_.size());
        std::memcpy(out, Buffer_.data(), n);
        Buffer_.erase(0, n);
        return n;
    }

    TFuture<size_t> ReadOnce(char* out, size_t size) {
        while (true) {
            auto n = co_await Stream_.ReadSome(out, size);
            if (n == 0) {
                throw std::runtime_error("Connection closed");
            }
            if (n > 0) {
                co_return static_cast<size_t>(n);
            }
        }
    }

    TStream& Stream_;
    std::string Buffer_;
};

template<typename TStream>
class TByteWriter {
public:
    TByteWriter(TStream& stream)
        : Stream_(stream)
    { }

    /// Writes all of @p data. Throws if the peer stops accepting bytes.
    TFuture<void> Write(const void* data, size_t size) {
        const char* p = static_cast<const char*>(data);
        const char* end = p + size;
        while (p != end) {
            auto n = co_await Stream_.WriteSome(p, end - p);
            if (n == 0) {
                throw std::runtime_error("Connection closed");
            }
            if (n > 0) {
                p += n;
            }
        }
    }

    TFuture<void> Write(const std::string& data) {
        return Write(data.data(), data.size());
    }

private:
    TStream& Stream_;
};

} // namespace NOdin
