#include "httpd.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <stdexcept>

namespace NOdin {
namespace NHttp {

namespace {

char Lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

std::string_view Trim(std::string_view value) {
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
        value.remove_suffix(1);
    }
    return value;
}

bool ContainsToken(std::string_view list, std::string_view token) {
    while (!list.empty()) {
        auto comma = list.find(',');
        auto item = Trim(list.substr(0, comma));
        if (EqualsNoCase(item, token)) {
            return true;
        }
        if (comma == std::string_view::npos) {
            break;
        }
        list.remove_prefix(comma + 1);
    }
    return false;
}

} // namespace

bool TCaseLess::operator()(std::string_view a, std::string_view b) const {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), [](char l, char r) {
        return Lower(l) < Lower(r);
    });
}

bool EqualsNoCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char l, char r) {
        return Lower(l) == Lower(r);
    });
}

const char* ReasonPhrase(int status) {
    switch (status) {
    case 101: return "Switching Protocols";
    case 200: return "OK";
    case 201: return "Created";
    case 204: return "No Content";
    case 301: return "Moved Permanently";
    case 302: return "Found";
    case 304: return "Not Modified";
    case 400: return "Bad Request";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 413: return "Payload Too Large";
    case 426: return "Upgrade Required";
    case 500: return "Internal Server Error";
    case 502: return "Bad Gateway";
    case 503: return "Service Unavailable";
    case 504: return "Gateway Timeout";
    default: return "Unknown";
    }
}

std::string UrlDecode(std::string_view str) {
    std::string result;
    result.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size() && std::isxdigit(static_cast<unsigned char>(str[i + 1]))
            && std::isxdigit(static_cast<unsigned char>(str[i + 2])))
        {
            char hex[3] = { str[i + 1], str[i + 2], 0 };
            result += static_cast<char>(std::strtol(hex, nullptr, 16));
            i += 2;
        } else if (str[i] == '+') {
            result += ' ';
        } else {
            result += str[i];
        }
    }

    return result;
}

std::string UrlEncode(std::string_view str) {
    static const char hex[] = "0123456789ABCDEF";
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        auto u = static_cast<unsigned char>(c);
        if (std::isalnum(u) || c == '-' || c == '_' || c == '.' || c == '~') {
            result += c;
        } else {
            result += '%';
            result += hex[u >> 4];
            result += hex[u & 0xf];
        }
    }
    return result;
}

TUri::TUri(const std::string& uriStr) {
    Parse(uriStr);
}

void TUri::Parse(const std::string& uriStr) {
    size_t pathEnd = uriStr.find_first_of("?#");
    Path_ = UrlDecode(std::string_view(uriStr).substr(0, pathEnd));

    if (pathEnd == std::string::npos) {
        return;
    }
    if (uriStr[pathEnd] == '#') {
        Fragment_ = UrlDecode(std::string_view(uriStr).substr(pathEnd + 1));
        return;
    }

    size_t queryEnd = uriStr.find('#', pathEnd);
    RawQuery_ = uriStr.substr(pathEnd + 1,
        queryEnd == std::string::npos ? std::string::npos : queryEnd - pathEnd - 1);

    std::string_view query(RawQuery_);
    size_t pos = 0;
    while (pos < query.size()) {
        size_t ampPos = query.find('&', pos);
        auto param = query.substr(pos, ampPos == std::string_view::npos ? std::string_view::npos : ampPos - pos);
        size_t eqPos = param.find('=');
        if (eqPos != std::string_view::npos) {
            QueryParameters_[UrlDecode(param.substr(0, eqPos))] = UrlDecode(param.substr(eqPos + 1));
        } else if (!param.empty()) {
            QueryParameters_[UrlDecode(param)] = "";
        }
        if (ampPos == std::string_view::npos) {
            break;
        }
        pos = ampPos + 1;
    }

    if (queryEnd != std::string::npos) {
        Fragment_ = UrlDecode(std::string_view(uriStr).substr(queryEnd + 1));
    }
}

const std::string& TUri::Fragment() const {
    return Fragment_;
}

const std::map<std::string, std::string>& TUri::QueryParameters() const {
    return QueryParameters_;
}

const std::string& TUri::RawQuery() const {
    return RawQuery_;
}

const std::string& TUri::Path() const {
    return Path_;
}

TRequest::TRequest(std::string&& header,
    std::function<TFuture<ssize_t>(char*, size_t)> bodyReader,
    std::function<TFuture<std::string>()> chunkHeaderReader)
    : Header_(std::move(header))
    , BodyReader_(std::move(bodyReader))
    , ChunkHeaderReader_(std::move(chunkHeaderReader))
{
    ParseRequestLine();
    ParseHeaders();
}

void TRequest::ParseRequestLine() {
    size_t lineEnd = Header_.find("\r\n");
    if (lineEnd == std::string::npos) {
        throw std::runtime_error("Invalid HTTP request: no request line");
    }
    HeaderStartPos_ = lineEnd + 2;

    std::string_view requestLine(Header_.data(), lineEnd);
    size_t methodEnd = requestLine.find(' ');
    if (methodEnd == std::string_view::npos || methodEnd == 0) {
        throw std::runtime_error("Invalid HTTP request: no method");
    }
    Method_ = requestLine.substr(0, methodEnd);

    size_t uriStart = methodEnd + 1;
    size_t uriEnd = requestLine.find(' ', uriStart);
    if (uriEnd == std::string_view::npos) {
        throw std::runtime_error("Invalid HTTP request: no URI");
    }
    Target_ = requestLine.substr(uriStart, uriEnd - uriStart);
    Uri_ = TUri(std::string(Target_));

    size_t versionStart = uriEnd + 1;
    if (versionStart >= requestLine.size()) {
        throw std::runtime_error("Invalid HTTP request: no version");
    }
    Version_ = requestLine.substr(versionStart);
}

void TRequest::ParseHeaders() {
    size_t pos = HeaderStartPos_;
    while (pos < Header_.size()) {
        size_t lineEnd = std::string_view(Header_.data() + pos, Header_.size() - pos).find("\r\n");
        if (lineEnd == std::string_view::npos || lineEnd == 0) {
            break;
        }
        std::string_view headerLine(Header_.data() + pos, lineEnd);
        size_t colonPos = headerLine.find(':');
        if (colonPos != std::string_view::npos) {
            Headers_[Trim(headerLine.substr(0, colonPos))] = Trim(headerLine.substr(colonPos + 1));
        }
        pos += lineEnd + 2;
    }

    if (auto contentLength = Header("Content-Length")) {
        char* end = nullptr;
        std::string value(*contentLength);
        auto length = std::strtoull(value.c_str(), &end, 10);
        if (value.empty() || *end != '\0') {
            throw std::runtime_error("Invalid HTTP request: bad Content-Length");
        }
        ContentLength_ = static_cast<size_t>(length);
        HasBody_ = ContentLength_ > 0;
    }

    if (auto encoding = Header("Transfer-Encoding")) {
        if (ContainsToken(*encoding, "chunked")) {
            Chunked_ = true;
            HasBody_ = true;
        }
    }
    if (!HasBody_) {
        BodyConsumed_ = true;
    }
}

const std::map<std::string_view, std::string_view, TCaseLess>& TRequest::Headers() const {
    return Headers_;
}

std::optional<std::string_view> TRequest::Header(std::string_view name) const {
    auto it = Headers_.find(name);
    if (it == Headers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool TRequest::RequireConnectionClose() const {
    auto connection = Header("Connection");
    if (connection && ContainsToken(*connection, "close")) {
        return true;
    }
    if (Version_ == "HTTP/1.0") {
        return !connection || !ContainsToken(*connection, "keep-alive");
    }
    return false;
}

bool TRequest::IsUpgrade() const {
    auto connection = Header("Connection");
    auto upgrade = Header("Upgrade");
    return connection && upgrade
        && ContainsToken(*connection, "upgrade")
        && EqualsNoCase(*upgrade, "websocket");
}

std::string_view TRequest::Method() const {
    return Method_;
}

const TUri& TRequest::Uri() const {
    return Uri_;
}

bool TRequest::HasBody() const {
    return HasBody_;
}

bool TRequest::BodyConsumed() const {
    return BodyConsumed_;
}

TFuture<std::string> TRequest::ReadBodyFull() {
    std::string body;
    if (!Chunked_) {
        body.reserve(ContentLength_);
        while (ContentLength_ > 0) {
            char buffer[4096];
            ssize_t bytesRead = co_await ReadBodySomeContentLength(buffer, std::min(sizeof(buffer), ContentLength_));
            if (bytesRead <= 0) {
                throw std::runtime_error("Error reading request body");
            }
            body.append(buffer, bytesRead);
        }
        BodyConsumed_ = true;
    } else {
        while (!BodyConsumed_) {
            char buffer[4096];
            ssize_t bytesRead = co_await ReadBodySomeChunked(buffer, sizeof(buffer));
            if (bytesRead < 0) {
                throw std::runtime_error("Error reading request body");
            }
            if (bytesRead == 0) {
                break;
            }
            body.append(buffer, bytesRead);
        }
    }
    co_return body;
}

TFuture<ssize_t> TRequest::ReadBodySome(char* buffer, size_t size) {
    if (BodyConsumed_) {
        co_return 0;
    }
    if (!Chunked_) {
        co_return co_await ReadBodySomeContentLength(buffer, size);
    } else {
        co_return co_await ReadBodySomeChunked(buffer, size);
    }
}

TFuture<ssize_t> TRequest::ReadBodySomeContentLength(char* buffer, size_t size) {
    if (ContentLength_ == 0) {
        BodyConsumed_ = true;
        co_return 0;
    }
    ssize_t bytesRead = co_await BodyReader_(buffer, std::min(size, ContentLength_));
    if (bytesRead > 0) {
        ContentLength_ -= bytesRead;
    } else {
        throw std::runtime_error("Connection closed inside request body");
    }
    if (ContentLength_ == 0) {
        BodyConsumed_ = true;
    }
    co_return bytesRead;
}

TFuture<ssize_t> TRequest::ReadBodySomeChunked(char* buffer, size_t size) {
    // <hex size>\r\n<data>\r\n ... 0\r\n\r\n
    auto readCrLf = [&]() -> TFuture<void> {
        char crlf[2];
        size_t got = 0;
        while (got < 2) {
            auto n = co_await BodyReader_(crlf + got, 2 - got);
            if (n <= 0) {
                throw std::runtime_error("Invalid chunked encoding");
            }
            got += n;
        }
        if (crlf[0] != '\r' || crlf[1] != '\n') {
            throw std::runtime_error("Invalid chunked encoding");
        }
        co_return;
    };

    if (CurrentChunkSize_ == 0) {
        auto line = co_await ChunkHeaderReader_();
        CurrentChunkSize_ = std::stoul(line, nullptr, 16);
        if (CurrentChunkSize_ == 0) {
            BodyConsumed_ = true;
            co_await readCrLf();
            co_return 0;
        }
    }

    size_t toRead = std::min(size, CurrentChunkSize_);
    ssize_t bytesRead = co_await BodyReader_(buffer, toRead);
    if (bytesRead <= 0) {
        throw std::runtime_error("Connection closed inside request body");
    }
    CurrentChunkSize_ -= bytesRead;
    if (CurrentChunkSize_ == 0) {
        co_await readCrLf();
    }
    co_return bytesRead;
}

void TResponse::SetStatus(int statusCode) {
    StatusCode_ = statusCode;
}

void TResponse::SetHeader(const std::string& name, const std::string& value) {
    Headers_[name] = value;
}

TFuture<void> TResponse::CompleteWrite(const char* data, size_t size) {
    const char* p = data;
    size_t remaining = size;
    while (remaining != 0) {
        ssize_t written = co_await Writer_(p, remaining);
        if (written <= 0) {
            throw std::runtime_error("Error writing response");
        }
        p += written;
        remaining -= written;
    }
    co_return;
}

TFuture<void> TResponse::SendHeaders() {
    if (HeadersSent_) {
        co_return;
    }
    HeadersSent_ = true;

    std::string headerStr = "HTTP/1.1 " + std::to_string(StatusCode_) + " " + ReasonPhrase(StatusCode_) + "\r\n";
    for (const auto& header : Headers_) {
        headerStr += header.first + ": " + header.second + "\r\n";
    }
    headerStr += "\r\n";

    co_await CompleteWrite(headerStr.data(), headerStr.size());

    auto chunked = Headers_.find("Transfer-Encoding");
    if (chunked != Headers_.end() && ContainsToken(chunked->second, "chunked")) {
        Chunked_ = true;
    }
    auto connection = Headers_.find("Connection");
    if (connection != Headers_.end() && ContainsToken(connection->second, "close")) {
        IsClosed_ = true;
    }
    co_return;
}

bool TResponse::IsClosed() const {
    return IsClosed_;
}

TFuture<void> TResponse::WriteBodyChunk(const char* data, size_t size) {
    if (Chunked_) {
        char chunkHeader[32];
        int len = std::snprintf(chunkHeader, sizeof(chunkHeader), "%zx\r\n", size);
        co_await CompleteWrite(chunkHeader, static_cast<size_t>(len));
        co_await CompleteWrite(data, size);
        co_await CompleteWrite("\r\n", 2);
    } else {
        co_await CompleteWrite(data, size);
    }
    BodyBytes_ += size;
}

TFuture<void> TResponse::WriteBodyFull(const std::string& data) {
    if (Chunked_) {
        size_t offset = 0;
        constexpr size_t chunkSize = 8192;
        while (offset < data.size()) {
            size_t toSend = std::min(data.size() - offset, chunkSize);
            co_await WriteBodyChunk(data.data() + offset, toSend);
            offset += toSend;
        }
        co_await CompleteWrite("0\r\n\r\n", 5);
    } else {
        co_await CompleteWrite(data.data(), data.size());
        BodyBytes_ += data.size();
    }
}

TFuture<void> TResponse::Reply(int statusCode, const std::string& contentType, const std::string& body) {
    SetStatus(statusCode);
    if (!contentType.empty()) {
        SetHeader("Content-Type", contentType);
    }
    SetHeader("Content-Length", std::to_string(body.size()));
    co_await SendHeaders();
    if (!body.empty()) {
        co_await WriteBodyFull(body);
    }
}

std::string FormatAccessLine(const TRequest& request, int status, size_t bytes, const std::string& peer) {
    auto host = peer;
    if (auto colon = host.rfind(':'); colon != std::string::npos) {
        host.resize(colon);
    }

    char timeBuf[64];
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    std::strftime(timeBuf, sizeof(timeBuf), "%d/%b/%Y:%H:%M:%S +0000", &tm);

    auto header = [&](std::string_view name) {
        auto value = request.Header(name);
        return value ? std::string(*value) : std::string("-");
    };

    std::string line;
    line.reserve(256);
    line += host;
    line += " - - [";
    line += timeBuf;
    line += "] \"";
    line += request.Method();
    line += ' ';
    line += request.Target();
    line += ' ';
    line += request.Version();
    line += "\" ";
    line += std::to_string(status);
    line += ' ';
    line += std::to_string(bytes);
    line += " \"";
    line += header("Referer");
    line += "\" \"";
    line += header("User-Agent");
    line += '"';
    return line;
}

} // namespace NHttp
} // namespace NOdin
