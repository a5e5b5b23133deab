#include "router.hpp"

#include <odin/actors/actorsystem.hpp>
#include <odin/log.hpp>

namespace NOdin {
namespace NSpa {

namespace {

using NHttp::TRequest;
using NHttp::TResponse;

// "svc/rest/of/path" -> {"svc", "rest/of/path"}
std::pair<std::string, std::string> SplitScope(std::string_view path) {
    auto slash = path.find('/');
    if (slash == std::string_view::npos) {
        return {std::string(path), {}};
    }
    return {std::string(path.substr(0, slash)), std::string(path.substr(slash + 1))};
}

const char* PassedResponseHeaders[] = {
    "Content-Type",
    "Cache-Control",
    "ETag",
    "Last-Modified",
    "Expires",
    "Content-Encoding",
};

} // namespace

std::string ProxyTarget(const TProxySpec& spec, const std::string& rest, const std::string& rawQuery) {
    std::string url = spec.Upstream;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    if (!rest.empty()) {
        url += "/";
        url += rest;
    }

    std::string query;
    if (spec.CopyQuery) {
        query = rawQuery;
    }
    for (const auto& [name, value] : spec.AddQuery) {
        if (!query.empty()) {
            query += "&";
        }
        query += NHttp::UrlEncode(name) + "=" + NHttp::UrlEncode(value);
    }
    if (!query.empty()) {
        url += (url.find('?') == std::string::npos ? "?" : "&") + query;
    }
    return url;
}

bool ETagMatches(std::string_view ifNoneMatch, std::string_view etag) {
    while (!ifNoneMatch.empty()) {
        auto comma = ifNoneMatch.find(',');
        auto item = ifNoneMatch.substr(0, comma);
        while (!item.empty() && item.front() == ' ') {
            item.remove_prefix(1);
        }
        while (!item.empty() && item.back() == ' ') {
            item.remove_suffix(1);
        }
        if (item.starts_with("W/")) {
            item.remove_prefix(2);
        }
        if (item == "*" || item == etag) {
            return true;
        }
        if (comma == std::string_view::npos) {
            break;
        }
        ifNoneMatch.remove_prefix(comma + 1);
    }
    return false;
}

TSpaRouter::TSpaRouter(std::shared_ptr<const TComposition> composition, NActors::TActorSystem& system)
    : Composition_(std::move(composition))
    , System_(system)
    , ClientSsl_(std::make_unique<TSslContext>(TSslContext::Client()))
{
    auto* sys = &System_;
    auto resolver = [sys](const std::string& host, int port) -> TFuture<std::vector<TAddress>> {
        auto resolve = [host, port]() {
            return TAddress::Resolve(host, port);
        };
        co_return co_await sys->Offload(std::move(resolve));
    };
    Client_ = std::make_unique<NHttp::THttpClient>(*System_.Poller(), std::move(resolver), ClientSsl_.get());
}

TFuture<void> TSpaRouter::HandleRequest(TRequest& request, TResponse& response) {
    if (System_.ShutdownRequested()) {
        response.SetHeader("Connection", "close");
        co_await response.Reply(503, "text/plain", "shutting down\n");
        co_return;
    }
    if (request.Method() != "GET") {
        response.SetHeader("Allow", "GET");
        co_await response.Reply(405, "text/plain", "method not allowed\n");
        co_return;
    }

    const auto& path = request.Uri().Path();
    if (path == "/" || path == "/index.html") {
        response.SetHeader("ETag", Composition_->HtmlETag());
        response.SetHeader("Cache-Control", "no-cache");
        co_await response.Reply(200, "text/html; charset=utf-8", Composition_->Html());
        co_return;
    }

    if (path.starts_with("/asset/")) {
        auto [service, rest] = SplitScope(std::string_view(path).substr(7));
        if (const auto* asset = Composition_->FindAsset(service, rest)) {
            co_await ServeAsset(*asset, request, response);
            co_return;
        }
    } else if (path.starts_with("/proxy/")) {
        auto [service, rest] = SplitScope(std::string_view(path).substr(7));
        if (auto proxy = Composition_->FindProxy(service, rest)) {
            co_await ServeProxy(*proxy->first, proxy->second, request, response);
            co_return;
        }
    } else if (path == "/ws") {
        response.SetHeader("Upgrade", "websocket");
        co_await response.Reply(426, "text/plain", "websocket upgrade required\n");
        co_return;
    }

    co_await response.Reply(404, "text/plain", "not found\n");
}

TFuture<void> TSpaRouter::ServeAsset(const TAsset& asset, TRequest& request, TResponse& response) {
    response.SetHeader("ETag", asset.ETag);
    response.SetHeader("Cache-Control", "no-cache");
    if (auto ifNoneMatch = request.Header("If-None-Match"); ifNoneMatch && ETagMatches(*ifNoneMatch, asset.ETag)) {
        co_await response.Reply(304, "", "");
        co_return;
    }
    co_await response.Reply(200, asset.ContentType, asset.Content);
}

TFuture<void> TSpaRouter::ServeProxy(const TProxySpec& spec, const std::string& rest, TRequest& request, TResponse& response) {
    NHttp::TClientRequest upstream;
    upstream.Url = ProxyTarget(spec, rest, request.Uri().RawQuery());
    for (const auto& name : spec.CopyHeaders) {
        if (auto value = request.Header(name)) {
            upstream.Headers.emplace_back(name, std::string(*value));
        }
    }
    for (const auto& header : spec.AddHeaders) {
        upstream.Headers.push_back(header);
    }

    std::optional<NHttp::TClientResponse> result;
    std::string failure;
    try {
        result = co_await Client_->Fetch(std::move(upstream));
    } catch (const std::exception& ex) {
        failure = ex.what();
    }
    if (!result) {
        ODIN_WARN << "proxy " << request.Uri().Path() << " -> " << spec.Upstream << " failed: " << failure;
        co_await response.Reply(502, "text/plain", "upstream request failed\n");
        co_return;
    }

    for (const char* name : PassedResponseHeaders) {
        if (auto value = result->Header(name)) {
            response.SetHeader(name, std::string(*value));
        }
    }
    response.SetStatus(result->Status);
    response.SetHeader("Content-Length", std::to_string(result->Body.size()));
    co_await response.SendHeaders();
    if (!result->Body.empty()) {
        co_await response.WriteBodyFull(result->Body);
    }
}

} // namespace NSpa
} // namespace NOdin
