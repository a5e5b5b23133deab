#pragma once

#include <memory>
#include <string>

#include <odin/http/client.hpp>
#include <odin/http/httpd.hpp>
#include <odin/ssl.hpp>

#include "composition.hpp"

namespace NOdin {
namespace NActors {
class TActorSystem;
} // namespace NActors

namespace NSpa {

/// Upstream URL for a proxied request, see TProxySpec.
std::string ProxyTarget(const TProxySpec& spec, const std::string& rest, const std::string& rawQuery);

/// True if an If-None-Match header value matches @p etag.
bool ETagMatches(std::string_view ifNoneMatch, std::string_view etag);

/**
 * @class TSpaRouter
 * @brief HTTP routes of the SPA server.
 *
 *   GET /                          assembled HTML
 *   GET /asset/<service>/<path>    static asset, 304 on a matching If-None-Match
 *   GET /proxy/<service>/<path>    upstream fetch, 502 when it fails
 *   GET /ws                        426 unless it is an upgrade
 *
 * Anything else is 404, methods other than GET are 405 and every request
 * gets 503 once the actor system is shutting down.
 */
class TSpaRouter: public NHttp::IRouter {
public:
    TSpaRouter(std::shared_ptr<const TComposition> composition, NActors::TActorSystem& system);

    TFuture<void> HandleRequest(NHttp::TRequest& request, NHttp::TResponse& response) override;

private:
    TFuture<void> ServeAsset(const TAsset& asset, NHttp::TRequest& request, NHttp::TResponse& response);
    TFuture<void> ServeProxy(const TProxySpec& spec, const std::string& rest, NHttp::TRequest& request, NHttp::TResponse& response);

    std::shared_ptr<const TComposition> Composition_;
    NActors::TActorSystem& System_;
    std::unique_ptr<TSslContext> ClientSsl_;
    std::unique_ptr<NHttp::THttpClient> Client_;
};

} // namespace NSpa
} // namespace NOdin
