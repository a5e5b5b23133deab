#include "client.hpp"
#include "httpd.hpp"

#include <odin/base.hpp>
#include <odin/socket.hpp>
#include <odin/sockutils.hpp>

#include <cctype>
#include <charconv>
#include <stdexcept>
#include <system_error>

namespace NOdin {
namespace NHttp {

namespace {

template<typename TConn>
TFuture<std::string> ReadChunkedBody(TByteReader<TConn>& reader) {
    std::string body;
    while (true) {
        auto line = co_await reader.ReadUntil("\r\n", 1024);
        size_t size = 0;
        auto [end, ec] = std::from_chars(line.data(), line.data() + line.size(), size, 16);
        if (ec != std::errc{} || end == line.data()) {
            throw std::runtime_error("Invalid chunk header in response");
        }
        if (size == 0) {
            // trailers, if any, end with an empty line
            while ((co_await reader.ReadUntil("\r\n", 8192)) != "\r\n") { }
            co_return body;
        }
        if (body.size() + size > THttpClient::MaxResponseSize) {
            throw std::runtime_error("Response too large");
        }
        auto offset = body.size();
        body.resize(offset + size);
        co_await reader.Read(body.data() + offset, size);
        char crlf[2];
        co_await reader.Read(crlf, 2);
        if (crlf[0] != '\r' || crlf[1] != '\n') {
            throw std::runtime_error("Invalid chunk trailer in response");
        }
    }
}

template<typename TConn>
TFuture<std::string> ReadUntilEof(TByteReader<TConn>& reader) {
    std::string body;
    char buf[8192];
    while (true) {
        auto n = co_await reader.ReadSome(buf, sizeof(buf));
        if (n <= 0) {
            co_return body;
        }
        if (body.size() + n > THttpClient::MaxResponseSize) {
            throw std::runtime_error("Response too large");
        }
        body.append(buf, n);
    }
}

template<typename TConn>
TFuture<TClientResponse> Exchange(TConn& conn, const TUrl& url, const TClientRequest& request) {
    auto wire = FormatClientRequest(url, request);
    co_await TByteWriter<TConn>(conn).Write(wire);

    TByteReader<TConn> reader(conn);
    auto head = co_await reader.ReadUntil("\r\n\r\n", 64 * 1024);

    TClientResponse response;
    std::string_view view(head);
    auto lineEnd = view.find("\r\n");
    auto statusLine = view.substr(0, lineEnd);
    // HTTP/1.1 200 OK
    auto sp1 = statusLine.find(' ');
    if (!statusLine.starts_with("HTTP/") || sp1 == std::string_view::npos) {
        throw std::runtime_error("Invalid status line: " + std::string(statusLine));
    }
    auto codeStr = statusLine.substr(sp1 + 1, 3);
    auto [end, ec] = std::from_chars(codeStr.data(), codeStr.data() + codeStr.size(), response.Status);
    if (ec != std::errc{} || response.Status < 100 || response.Status > 999) {
        throw std::runtime_error("Invalid status line: " + std::string(statusLine));
    }
    if (sp1 + 5 <= statusLine.size()) {
        response.Reason = std::string(statusLine.substr(sp1 + 5));
    }

    size_t pos = lineEnd + 2;
    while (pos < view.size()) {
        auto next = view.find("\r\n", pos);
        if (next == std::string_view::npos || next == pos) {
            break;
        }
        auto line = view.substr(pos, next - pos);
        auto colon = line.find(':');
        if (colon != std::string_view::npos) {
            auto value = line.substr(colon + 1);
            while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
                value.remove_prefix(1);
            }
            response.Headers.emplace_back(std::string(line.substr(0, colon)), std::string(value));
        }
        pos = next + 2;
    }

    bool noBody = request.Method == "HEAD" || response.Status == 204 || response.Status == 304
        || (response.Status >= 100 && response.Status < 200);
    if (noBody) {
        co_return response;
    }

    auto encoding = response.Header("Transfer-Encoding");
    auto length = response.Header("Content-Length");
    if (encoding && encoding->find("chunked") != std::string_view::npos) {
        response.Body = co_await ReadChunkedBody(reader);
    } else if (length) {
        size_t size = 0;
        auto [lend, lec] = std::from_chars(length->data(), length->data() + length->size(), size);
        if (lec != std::errc{} || lend != length->data() + length->size()) {
            throw std::runtime_error("Invalid Content-Length in response");
        }
        if (size > THttpClient::MaxResponseSize) {
            throw std::runtime_error("Response too large");
        }
        response.Body.resize(size);
        co_await reader.Read(response.Body.data(), size);
    } else {
        response.Body = co_await ReadUntilEof(reader);
    }
    co_return response;
}

} // namespace

TUrl TUrl::Parse(std::string_view url) {
    TUrl result;
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string_view::npos) {
        throw std::invalid_argument("URL without scheme: " + std::string(url));
    }
    result.Scheme = std::string(url.substr(0, schemeEnd));
    for (auto& c : result.Scheme) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (result.Scheme != "http" && result.Scheme != "https") {
        throw std::invalid_argument("Unsupported URL scheme: " + result.Scheme);
    }
    result.Port = result.Secure() ? 443 : 80;

    auto rest = url.substr(schemeEnd + 3);
    auto authorityEnd = rest.find_first_of("/?#");
    auto authority = rest.substr(0, authorityEnd);
    if (authority.empty()) {
        throw std::invalid_argument("URL without host: " + std::string(url));
    }

    std::string_view portStr;
    if (authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            throw std::invalid_argument("Bad IPv6 host in URL: " + std::string(url));
        }
        result.Host = std::string(authority.substr(1, close - 1));
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                throw std::invalid_argument("Bad authority in URL: " + std::string(url));
            }
            portStr = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            portStr = authority.substr(colon + 1);
            authority = authority.substr(0, colon);
        }
        result.Host = std::string(authority);
    }
    if (result.Host.empty()) {
        throw std::invalid_argument("URL without host: " + std::string(url));
    }
    if (!portStr.empty()) {
        int port = 0;
        auto [end, ec] = std::from_chars(portStr.data(), portStr.data() + portStr.size(), port);
        if (ec != std::errc{} || end != portStr.data() + portStr.size() || port <= 0 || port > 65535) {
            throw std::invalid_argument("Bad port in URL: " + std::string(url));
        }
        result.Port = port;
    }

    if (authorityEnd != std::string_view::npos) {
        auto target = rest.substr(authorityEnd);
        if (auto hash = target.find('#'); hash != std::string_view::npos) {
            target = target.substr(0, hash);
        }
        result.Target = std::string(target);
        if (result.Target.empty() || result.Target.front() != '/') {
            result.Target.insert(result.Target.begin(), '/');
        }
    }
    return result;
}

std::optional<std::string_view> TClientResponse::Header(std::string_view name) const {
    for (const auto& [key, value] : Headers) {
        if (EqualsNoCase(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

std::string FormatClientRequest(const TUrl& url, const TClientRequest& request) {
    std::string wire = request.Method + " " + url.Target + " HTTP/1.1\r\n";

    bool hasHost = false;
    for (const auto& [name, value] : request.Headers) {
        // the connection is ours
        if (EqualsNoCase(name, "Connection") || EqualsNoCase(name, "Content-Length") || EqualsNoCase(name, "Transfer-Encoding")) {
            continue;
        }
        hasHost |= EqualsNoCase(name, "Host");
        wire += name + ": " + value + "\r\n";
    }
    if (!hasHost) {
        bool defaultPort = url.Port == (url.Secure() ? 443 : 80);
        auto host = url.Host.find(':') != std::string::npos ? "[" + url.Host + "]" : url.Host;
        wire += "Host: " + host + (defaultPort ? "" : ":" + std::to_string(url.Port)) + "\r\n";
    }
    wire += "Connection: close\r\n";
    if (!request.Body.empty() || request.Method == "POST" || request.Method == "PUT") {
        wire += "Content-Length: " + std::to_string(request.Body.size()) + "\r\n";
    }
    wire += "\r\n";
    wire += request.Body;
    return wire;
}

TFuture<TClientResponse> THttpClient::Fetch(TClientRequest request) {
    auto url = TUrl::Parse(request.Url);
    if (url.Secure() && !Ssl_) {
        throw std::runtime_error("https URL without an SSL context: " + request.Url);
    }

    auto addresses = co_await Resolver_(url.Host, url.Port);
    if (addresses.empty()) {
        throw std::runtime_error("Cannot resolve " + url.Host);
    }

    std::exception_ptr lastError;
    for (const auto& address : addresses) {
        TSocket socket(Poller_, address.Domain());
        try {
            co_await socket.Connect(address, TClock::now() + ConnectTimeout_);
        } catch (const std::system_error&) {
            lastError = std::current_exception();
            continue;
        }
        if (url.Secure()) {
            TSslSocket<TSocket> conn(std::move(socket), *Ssl_);
            conn.SslSetTlsExtHostName(url.Host);
            co_await conn.ConnectHandshake();
            co_return co_await Exchange(conn, url, request);
        }
        co_return co_await Exchange(socket, url, request);
    }
    std::rethrow_exception(lastError);
}

} // namespace NHttp
} // namespace NOdin
