#pragma once

#include <odin/corochain.hpp>
#include <odin/log.hpp>
#include <odin/socket.hpp>
#include <odin/sockutils.hpp>
#include <odin/ssl.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace NOdin {
namespace NHttp {

struct TCaseLess {
    bool operator()(std::string_view a, std::string_view b) const;
};

bool EqualsNoCase(std::string_view a, std::string_view b);

/// Standard reason phrase of @p status, "Unknown" for codes not in the table.
const char* ReasonPhrase(int status);

std::string UrlDecode(std::string_view str);
/// Percent-encodes everything except unreserved characters (RFC 3986).
std::string UrlEncode(std::string_view str);

// /path?arg1=value1&arg2=value2#fragment
class TUri {
public:
    TUri() = default;
    TUri(const std::string& uriStr);
    const std::string& Path() const;
    const std::map<std::string, std::string>& QueryParameters() const;
    /// Query string as sent, without the '?'.
    const std::string& RawQuery() const;
    const std::string& Fragment() const;

private:
    void Parse(const std::string& uriStr);
    std::string Path_;
    std::map<std::string, std::string> QueryParameters_;
    std::string RawQuery_;
    std::string Fragment_;
};

/**
 * @class TRequest
 * @brief Parsed request head plus lazy body readers.
 *
 * Header names and values are views into the head buffer, so a request is
 * neither copied nor moved. Header lookup ignores case.
 */
class TRequest {
public:
    TRequest(std::string&& header,
        std::function<TFuture<ssize_t>(char*, size_t)> bodyReader,
        std::function<TFuture<std::string>()> chunkHeaderReader = {});

    TRequest(const TRequest&) = delete;
    TRequest& operator=(const TRequest&) = delete;

    std::string_view Method() const;
    const TUri& Uri() const;
    std::string_view Version() const { return Version_; }
    /// Request target exactly as it appeared on the request line.
    std::string_view Target() const { return Target_; }

    const std::map<std::string_view, std::string_view, TCaseLess>& Headers() const;
    std::optional<std::string_view> Header(std::string_view name) const;

    bool HasBody() const;
    TFuture<std::string> ReadBodyFull();
    TFuture<ssize_t> ReadBodySome(char* buffer, size_t size); // read up to Content-Length
    bool BodyConsumed() const;
    bool RequireConnectionClose() const;
    /// True for a websocket upgrade request.
    bool IsUpgrade() const;

private:
    void ParseRequestLine();
    void ParseHeaders();

    TFuture<ssize_t> ReadBodySomeContentLength(char* buffer, size_t size);
    TFuture<ssize_t> ReadBodySomeChunked(char* buffer, size_t size);

    std::string Header_;
    size_t HeaderStartPos_ = 0;
    std::map<std::string_view, std::string_view, TCaseLess> Headers_;
    size_t ContentLength_ = 0;
    bool HasBody_ = false;
    bool Chunked_ = false;
    bool BodyConsumed_ = false;
    size_t CurrentChunkSize_ = 0;
    std::function<TFuture<ssize_t>(char*, size_t)> BodyReader_;
    std::function<TFuture<std::string>()> ChunkHeaderReader_;
    std::string_view Method_;
    std::string_view Target_;
    TUri Uri_;
    std::string_view Version_;
};

class TResponse {
public:
    TResponse(std::function<TFuture<ssize_t>(const void*, size_t)> writer)
        : Writer_(std::move(writer))
    {}
    void SetStatus(int statusCode);
    void SetHeader(const std::string& name, const std::string& value);
    TFuture<void> SendHeaders();
    TFuture<void> WriteBodyChunk(const char* data, size_t size); // Chunked transfer encoding
    TFuture<void> WriteBodyFull(const std::string& data); // Content-Length + body
    /// Status, Content-Type and Content-Length plus the whole body in one go.
    TFuture<void> Reply(int statusCode, const std::string& contentType, const std::string& body);
    bool IsClosed() const;
    bool HeadersSent() const {
        return HeadersSent_;
    }
    int StatusCode() const {
        return StatusCode_;
    }
    size_t BytesSent() const {
        return BodyBytes_;
    }

private:
    TFuture<void> CompleteWrite(const char* data, size_t size);

    int StatusCode_ = 200;
    std::map<std::string, std::string, TCaseLess> Headers_;
    bool HeadersSent_ = false;
    bool Chunked_ = false;
    bool IsClosed_ = false;
    size_t BodyBytes_ = 0;
    std::function<TFuture<ssize_t>(const void*, size_t)> Writer_;
};

struct IRouter {
    virtual ~IRouter() = default;
    virtual TFuture<void> HandleRequest(TRequest& request, TResponse& response) = 0;
};

/**
 * @brief Takes over a connection whose request asked for an upgrade.
 *
 * @p buffered holds bytes the server read past the request head.
 */
template<typename TConn>
struct IUpgradeHandler {
    virtual ~IUpgradeHandler() = default;
    virtual TFuture<void> HandleUpgrade(TRequest& request, TConn& conn, std::string buffered, const std::string& peer) = 0;
};

/// nginx "combined" access line.
std::string FormatAccessLine(const TRequest& request, int status, size_t bytes, const std::string& peer);

/**
 * @class TWebServer
 * @brief HTTP/1.1 server over connections of type @p TConn.
 *
 * @p TConn is TSocket for plain HTTP or TSslSocket<TSocket> for HTTPS, in
 * which case every accepted socket goes through the TLS handshake first.
 * Requests on one connection are served sequentially (keep-alive).
 * Destroying the server (or Stop()) drops the listener and every open
 * connection.
 */
template<typename TConn>
class TWebServer {
public:
    TWebServer(TSocket&& serverSocket, IRouter& router, IUpgradeHandler<TConn>* upgrade = nullptr, TSslContext* ssl = nullptr)
        : ServerSocket(std::move(serverSocket))
        , Router(router)
        , Upgrade(upgrade)
        , Ssl(ssl)
    {
        if constexpr (!std::is_same_v<TConn, TSocket>) {
            if (!Ssl) {
                throw std::invalid_argument("TLS server needs an SSL context");
            }
        }
    }

    void Start() {
        Serving = Serve();
    }

    void Stop() {
        Serving = {};
        Clients.clear();
        ServerSocket.Close();
    }

    size_t ClientsSize() const {
        size_t alive = 0;
        for (const auto& [id, client] : Clients) {
            alive += !client.done();
        }
        return alive;
    }

private:
    TFuture<void> Serve() {
        while (true) {
            auto clientSocket = co_await ServerSocket.Accept();
            std::erase_if(Clients, [](const auto& client) { return client.second.done(); });
            auto id = NextClientId++;
            Clients.emplace(id, HandleClient(std::move(clientSocket)));
        }
    }

    TFuture<TConn> Wrap(TSocket socket) {
        if constexpr (std::is_same_v<TConn, TSocket>) {
            co_return std::move(socket);
        } else {
            TConn conn(std::move(socket), *Ssl);
            co_await conn.AcceptHandshake();
            co_return std::move(conn);
        }
    }

    TFuture<void> HandleClient(TSocket clientSocket) {
        std::string clientString = clientSocket.RemoteAddr() ? clientSocket.RemoteAddr()->ToString() : "unknown";

        try {
            TConn conn = co_await Wrap(std::move(clientSocket));
            auto byteReader = TByteReader<TConn>(conn);

            auto bodyReader = [&](char* buffer, size_t size) -> TFuture<ssize_t> {
                co_return co_await byteReader.ReadSome(buffer, size);
            };

            auto chunkHeaderReader = [&]() -> TFuture<std::string> {
                co_return co_await byteReader.ReadUntil("\r\n", MaxHeaderSize);
            };

            auto bodyWriter = [&](const void* data, size_t size) -> TFuture<ssize_t> {
                co_return co_await conn.WriteSome(data, size);
            };

            while (true) {
                auto header = co_await byteReader.ReadUntil("\r\n\r\n", MaxHeaderSize);
                TRequest request(std::move(header), bodyReader, chunkHeaderReader);
                if (Upgrade && request.IsUpgrade()) {
                    ODIN_INFO << FormatAccessLine(request, 101, 0, clientString);
                    auto buffered = byteReader.TakeBuffer();
                    co_await Upgrade->HandleUpgrade(request, conn, std::move(buffered), clientString);
                    break;
                }
                TResponse response(bodyWriter);
                co_await Router.HandleRequest(request, response);
                ODIN_INFO << FormatAccessLine(request, response.StatusCode(), response.BytesSent(), clientString);
                if (response.IsClosed() || request.RequireConnectionClose() || !request.BodyConsumed()) {
                    break;
                }
            }
        } catch (const std::exception& ex) {
            ODIN_DEBUG << "client " << clientString << ": " << ex.what();
        }
        co_return;
    }

    static constexpr size_t MaxHeaderSize = 64 * 1024;

    TSocket ServerSocket;
    IRouter& Router;
    IUpgradeHandler<TConn>* Upgrade;
    TSslContext* Ssl;
    TFuture<void> Serving;
    uint64_t NextClientId = 0;
    std::unordered_map<uint64_t, TFuture<void>> Clients;
};

} // namespace NHttp
} // namespace NOdin
