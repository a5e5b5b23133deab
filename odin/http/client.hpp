#pragma once

#include <odin/address.hpp>
#include <odin/corochain.hpp>
#include <odin/poller.hpp>
#include <odin/ssl.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace NOdin {
namespace NHttp {

/// http(s)://host[:port][/path][?query]
struct TUrl {
    std::string Scheme;
    std::string Host;
    int Port = 0;
    // path plus query, "/" at least
    std::string Target = "/";

    bool Secure() const {
        return Scheme == "https";
    }

    /// @throws std::invalid_argument on anything that is not an absolute http(s) URL
    static TUrl Parse(std::string_view url);
};

using THeaders = std::vector<std::pair<std::string, std::string>>;

struct TClientRequest {
    std::string Method = "GET";
    std::string Url;
    THeaders Headers;
    std::string Body;
};

struct TClientResponse {
    int Status = 0;
    std::string Reason;
    THeaders Headers;
    std::string Body;

    std::optional<std::string_view> Header(std::string_view name) const;
};

/**
 * @class THttpClient
 * @brief One-shot HTTP/1.1 client (a fresh connection per request).
 *
 * Host names go through the supplied resolver, which is expected to run
 * the blocking lookup off the event loop. https URLs need an SSL context.
 * Failures are reported as exceptions (std::system_error for socket
 * errors, std::runtime_error for protocol errors).
 */
class THttpClient {
public:
    using TResolver = std::function<TFuture<std::vector<TAddress>>(const std::string& host, int port)>;

    THttpClient(TPollerBase& poller, TResolver resolver, TSslContext* ssl = nullptr,
                std::chrono::milliseconds connectTimeout = std::chrono::seconds(10))
        : Poller_(poller)
        , Resolver_(std::move(resolver))
        , Ssl_(ssl)
        , ConnectTimeout_(connectTimeout)
    { }

    TFuture<TClientResponse> Fetch(TClientRequest request);

    static constexpr size_t MaxResponseSize = 64 * 1024 * 1024;

private:
    TPollerBase& Poller_;
    TResolver Resolver_;
    TSslContext* Ssl_;
    std::chrono::milliseconds ConnectTimeout_;
};

/// Serialized request head and body as sent on the wire.
std::string FormatClientRequest(const TUrl& url, const TClientRequest& request);

} // namespace NHttp
} // namespace NOdin
