#include <algorithm>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <stdarg.h>
#include <stddef.h>
#include <setjmp.h>
#include <string>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

#include <odin/all.hpp>
#include <odin/actors/actorsystem.hpp>
#include <odin/http/client.hpp>
#include <odin/http/httpd.hpp>
#include <odin/spa/composition.hpp>
#include <odin/spa/router.hpp>
#include <odin/spa/server.hpp>
#include <odin/spa/share_service.hpp>
#include <odin/store/store_actor.hpp>

#include "testlib.h"

extern "C" {
#include <cmocka.h>
}

using namespace NOdin;
using namespace NOdin::NSpa;
using json = nlohmann::json;

namespace {

struct TInitLog {
    std::vector<std::string> Events;

    bool Has(const std::string& event) const {
        return Index(event) >= 0;
    }

    ptrdiff_t Index(const std::string& event) const {
        auto it = std::find(Events.begin(), Events.end(), event);
        return it == Events.end() ? -1 : it - Events.begin();
    }
};

class TTestService: public IService {
public:
    explicit TTestService(std::string name, std::vector<std::string> deps = {})
        : Name_(std::move(name))
        , Deps_(std::move(deps))
    { }

    std::string Name() const override {
        return Name_;
    }

    std::vector<std::string> Deps() const override {
        return Deps_;
    }

    void AddComponents(TComponentsBuilder& builder) override {
        builder.AddAsset(Name_ + ".js", "export function postInitialize() { console.log(\"" + Name_ + "\"); }\n");
        builder.AddModule(Name_ + ".js");
        builder.AddBodyFragment("<div id=\"" + Name_ + "\"></div>");
        if (Components) {
            Components(builder);
        }
    }

    TFuture<TResult<bool>> InitConnection(TSpaConnection& conn) override {
        auto id = std::to_string(conn.Id());
        if (Log) {
            Log->Events.push_back(Name_ + ":start:" + id);
        }
        if (Poller && InitDelay.count() > 0) {
            co_await Poller->Sleep(InitDelay);
        }
        if (Gate && !Gate(conn)) {
            co_return false;
        }
        conn.Send(Name_, "init", {{"conn", conn.Id()}});
        if (Log) {
            Log->Events.push_back(Name_ + ":done:" + id);
        }
        co_return true;
    }

    TFuture<TResult<TWsReaction>> HandleWsMessage(TSpaConnection& conn, const std::string& type, const json& payload) override {
        if (type == "echo") {
            co_return TWsReaction::Reply("echo", payload);
        }
        if (type == "shout") {
            co_return TWsReaction::Broadcast("shout", payload);
        }
        co_return co_await IService::HandleWsMessage(conn, type, payload);
    }

    std::optional<TWsReaction> DataAvailable(const std::string& kind) override {
        return TWsReaction::Broadcast("refresh", {{"kind", kind}});
    }

    void RemoveConnection(const TSpaConnection& conn) override {
        Removed.push_back(conn.Id());
    }

    std::function<void(TComponentsBuilder&)> Components;
    std::function<bool(const TSpaConnection&)> Gate;
    TPollerBase* Poller = nullptr;
    std::chrono::milliseconds InitDelay{0};
    TInitLog* Log = nullptr;
    std::vector<uint64_t> Removed;

private:
    std::string Name_;
    std::vector<std::string> Deps_;
};

std::shared_ptr<TTestService> make_service(std::string name, std::vector<std::string> deps = {}) {
    return std::make_shared<TTestService>(std::move(name), std::move(deps));
}

std::vector<std::string> names_of(const std::vector<std::shared_ptr<IService>>& services) {
    std::vector<std::string> names;
    for (const auto& service : services) {
        names.push_back(service->Name());
    }
    return names;
}

template<typename TFn>
std::optional<EErrorKind> build_error(TFn&& fn) {
    try {
        fn();
    } catch (const TOdinError& ex) {
        return ex.Kind();
    }
    return std::nullopt;
}

NHttp::THttpClient::TResolver literal_resolver() {
    return [](const std::string& host, int port) -> TFuture<std::vector<TAddress>> {
        co_return std::vector<TAddress>{TAddress(host, port)};
    };
}

NHttp::TClientResponse fetch(TLoop<TDefaultPoller>& loop, NHttp::THttpClient& client, NHttp::TClientRequest request) {
    NHttp::TClientResponse response;
    std::string error;
    TFuture<void> h = [](NHttp::THttpClient* client, NHttp::TClientRequest request, NHttp::TClientResponse* response, std::string* error) -> TFuture<void> {
        try {
            *response = co_await client->Fetch(std::move(request));
        } catch (const std::exception& ex) {
            *error = ex.what();
        }
    }(&client, std::move(request), &response, &error);
    assert_true(step_until(loop, [&]() { return h.done(); }));
    if (!error.empty()) {
        std::cerr << "fetch failed: " << error << "\n";
    }
    assert_true(error.empty());
    return response;
}

// Runs one request head through the router and returns the raw response.
TFuture<void> route_async(TSpaRouter* router, std::string head, std::string* out) {
    NHttp::TRequest request(std::move(head), [](char*, size_t) -> TFuture<ssize_t> { co_return 0; });
    NHttp::TResponse response([out](const void* data, size_t size) -> TFuture<ssize_t> {
        out->append(static_cast<const char*>(data), size);
        co_return size;
    });
    co_await router->HandleRequest(request, response);
}

std::string route(TLoop<TDefaultPoller>& loop, TSpaRouter& router, const std::string& head) {
    std::string out;
    TFuture<void> h = route_async(&router, head, &out);
    assert_true(step_until(loop, [&]() { return h.done(); }));
    return out;
}

int status_of(const std::string& raw) {
    assert_true(raw.size() > 12);
    return std::stoi(raw.substr(9, 3));
}

std::string body_of(const std::string& raw) {
    auto pos = raw.find("\r\n\r\n");
    return pos == std::string::npos ? std::string() : raw.substr(pos + 4);
}

/// Websocket client collecting every envelope it receives.
class TTestClient {
public:
    explicit TTestClient(TPollerBase& poller)
        : Socket_(poller, AF_INET)
        , Ws_(Socket_)
    { }

    void Start(int port, std::vector<std::pair<std::string, std::string>> headers = {}) {
        Headers_ = std::move(headers);
        Reader_ = Run(TAddress{"127.0.0.1", port});
    }

    TFuture<void> Send(std::string text) {
        co_await Ws_.SendText(text);
    }

    size_t Count(const std::string& service, const std::string& type) const {
        return std::count_if(Inbox.begin(), Inbox.end(), [&](const TWsEnvelope& e) {
            return e.Service == service && e.Type == type;
        });
    }

    const TWsEnvelope* Find(const std::string& service, const std::string& type) const {
        for (const auto& e : Inbox) {
            if (e.Service == service && e.Type == type) {
                return &e;
            }
        }
        return nullptr;
    }

    std::vector<TWsEnvelope> Inbox;
    bool Closed = false;
    std::optional<uint16_t> CloseCode;
    std::string Error;

private:
    TFuture<void> Run(TAddress address) {
        try {
            co_await Socket_.Connect(address, TClock::now() + std::chrono::seconds(5));
            co_await Ws_.Connect("127.0.0.1", "/ws", Headers_);
            while (auto message = co_await Ws_.Receive()) {
                if (auto envelope = ParseWsMessage(message->Data)) {
                    Inbox.push_back(std::move(*envelope));
                }
            }
            CloseCode = Ws_.CloseCode();
        } catch (const std::exception& ex) {
            Error = ex.what();
        }
        Closed = true;
    }

    TSocket Socket_;
    TWebSocket<TSocket> Ws_;
    std::vector<std::pair<std::string, std::string>> Headers_;
    TFuture<void> Reader_;
};

void send(TLoop<TDefaultPoller>& loop, TTestClient& client, const std::string& service, const std::string& type, const json& payload) {
    TFuture<void> h = client.Send(FormatWsMessage(service, type, payload));
    assert_true(step_until(loop, [&]() { return h.done(); }));
}

void send_raw(TLoop<TDefaultPoller>& loop, TTestClient& client, const std::string& text) {
    TFuture<void> h = client.Send(text);
    assert_true(step_until(loop, [&]() { return h.done(); }));
}

TSpaStatus spa_status(TLoop<TDefaultPoller>& loop, const TSpaServerHandle& spa) {
    TResult<TSpaStatus> result = MakeError(EErrorKind::Internal, "not answered");
    TFuture<void> h = [](TSpaServerHandle spa, TResult<TSpaStatus>* result) -> TFuture<void> {
        *result = co_await spa.Ask<TSpaStatus>(TGetSpaStatus{}, std::chrono::seconds(5));
    }(spa, &result);
    assert_true(step_until(loop, [&]() { return h.done(); }));
    assert_true(result.has_value());
    return *result;
}

TSocket listen_loopback(TPollerBase& poller) {
    TSocket listener(poller, AF_INET);
    listener.Bind(TAddress{"127.0.0.1", 0});
    listener.Listen();
    return listener;
}

class TUpstreamRouter: public NHttp::IRouter {
public:
    TFuture<void> HandleRequest(NHttp::TRequest& request, NHttp::TResponse& response) override {
        ++Requests;
        std::string body = std::string(request.Target())
            + " token=" + std::string(request.Header("X-Token").value_or("-"))
            + " added=" + std::string(request.Header("X-Added").value_or("-"))
            + " cookie=" + std::string(request.Header("Cookie").value_or("-"));
        response.SetHeader("X-Secret", "upstream");
        response.SetHeader("Cache-Control", "max-age=60");
        co_await response.Reply(200, "application/json", body);
    }

    int Requests = 0;
};

} // namespace

void test_service_names(void**) {
    assert_true(IsValidServiceName("share"));
    assert_true(IsValidServiceName("map.layers-2_x"));
    assert_false(IsValidServiceName(""));
    assert_false(IsValidServiceName("."));
    assert_false(IsValidServiceName(".."));
    assert_false(IsValidServiceName("a/b"));
    assert_false(IsValidServiceName("a b"));
}

void test_sort_services(void**) {
    auto a = make_service("a");
    auto b = make_service("b", {"a"});
    auto c = make_service("c", {"b"});
    auto d = make_service("d");

    auto sorted = names_of(SortServices({c, b, a}));
    assert_true((sorted == std::vector<std::string>{"a", "b", "c"}));

    // independent services keep their input order
    sorted = names_of(SortServices({d, c, a, b}));
    assert_true((sorted == std::vector<std::string>{"d", "a", "b", "c"}));

    auto unknown = build_error([&]() { SortServices({make_service("x", {"nowhere"})}); });
    assert_true(unknown == EErrorKind::ConfigError);

    auto p = make_service("p", {"q"});
    auto q = make_service("q", {"p"});
    bool cycle = false;
    try {
        SortServices({a, p, q});
    } catch (const TOdinError& ex) {
        cycle = ex.Kind() == EErrorKind::ConfigError && std::string(ex.what()).find("cycle") != std::string::npos;
    }
    assert_true(cycle);
}

void test_composition_order(void**) {
    auto first = TComposition::Build({make_service("a"), make_service("b", {"a"})}, "demo");
    auto second = TComposition::Build({make_service("b", {"a"}), make_service("a")}, "demo");

    auto names = names_of(first->Services());
    assert_true((names == std::vector<std::string>{"odin", "a", "b"}));
    assert_true(names_of(second->Services()) == names);

    std::vector<std::string> modules = {"/asset/odin/ws.js", "/asset/odin/main.js", "/asset/a/a.js", "/asset/b/b.js"};
    assert_true(first->Modules() == modules);
    assert_true(second->Modules() == modules);

    const auto& html = first->Html();
    auto posA = html.find("/asset/a/a.js");
    auto posB = html.find("/asset/b/b.js");
    assert_true(posA != std::string::npos);
    assert_true(posB != std::string::npos);
    assert_true(posA < posB);
    assert_true(html == second->Html());
    assert_true(first->HtmlETag() == second->HtmlETag());

    assert_true(first->DepsOf("b") == std::vector<std::string>{"a"});
    assert_true(first->DepsOf("nothing").empty());
    assert_non_null(first->Find("odin").get());
    assert_null(first->Find("missing").get());
    assert_int_equal(first->AssetsSize(), 4);
}

void test_composition_conflicts(void**) {
    auto dup = build_error([]() { TComposition::Build({make_service("a"), make_service("a")}, "t"); });
    assert_true(dup == EErrorKind::NameConflict);

    auto odin = build_error([]() { TComposition::Build({make_service("odin")}, "t"); });
    assert_true(odin == EErrorKind::NameConflict);

    auto invalid = build_error([]() { TComposition::Build({make_service("bad name")}, "t"); });
    assert_true(invalid == EErrorKind::ConfigError);

    auto twice = make_service("twice");
    twice->Components = [](TComponentsBuilder& builder) {
        builder.AddAsset("twice.js", "again");
    };
    auto asset = build_error([&]() { TComposition::Build({twice}, "t"); });
    assert_true(asset == EErrorKind::NameConflict);

    auto shadow = make_service("shadow");
    shadow->Components = [](TComponentsBuilder& builder) {
        builder.AddAsset("lib/x.js", "x");
        builder.AddProxy(TProxySpec{.Path = "lib", .Upstream = "http://127.0.0.1:1"});
    };
    auto shadowed = build_error([&]() { TComposition::Build({shadow}, "t"); });
    assert_true(shadowed == EErrorKind::NameConflict);

    auto proxies = make_service("proxies");
    proxies->Components = [](TComponentsBuilder& builder) {
        builder.AddProxy(TProxySpec{.Path = "api", .Upstream = "http://127.0.0.1:1"});
        builder.AddProxy(TProxySpec{.Path = "/api/", .Upstream = "http://127.0.0.1:2"});
    };
    auto dupProxy = build_error([&]() { TComposition::Build({proxies}, "t"); });
    assert_true(dupProxy == EErrorKind::NameConflict);

    auto unknownDep = build_error([]() { TComposition::Build({make_service("a", {"zzz"})}, "t"); });
    assert_true(unknownDep == EErrorKind::ConfigError);

    // an asset path may appear only once in the whole list
    auto left = make_service("left");
    auto right = make_service("right");
    left->Components = right->Components = [](TComponentsBuilder& builder) {
        builder.AddAsset("common.css", "body {}");
    };
    auto sharedPath = build_error([&]() { TComposition::Build({left, right}, "t"); });
    assert_true(sharedPath == EErrorKind::NameConflict);

    right->Components = [](TComponentsBuilder& builder) {
        builder.AddAsset("right.css", "body {}");
    };
    auto composition = TComposition::Build({left, right}, "t");
    assert_non_null(composition->FindAsset("left", "common.css"));
    assert_null(composition->FindAsset("right", "common.css"));
    assert_non_null(composition->FindAsset("right", "right.css"));
}

void test_html_document(void**) {
    auto a = make_service("a");
    auto b = make_service("b", {"a"});
    a->Components = [](TComponentsBuilder& builder) {
        builder.AddCss("/shared.css");
        builder.AddScript("https://cdn.example.com/lib.js");
        builder.AddModule("https://cdn.example.com/mod.js");
    };
    b->Components = [](TComponentsBuilder& builder) {
        builder.AddCss("/shared.css");
        builder.AddModule("https://cdn.example.com/mod.js");
        builder.AddBodyFragment("<p>second</p>");
    };
    auto composition = TComposition::Build({b, a}, "<Demo & co>");
    const auto& html = composition->Html();

    assert_true(html.starts_with("<!DOCTYPE html>\n"));
    assert_true(html.find("<title>&lt;Demo &amp; co&gt;</title>") != std::string::npos);

    auto css = std::string("<link rel=\"stylesheet\" href=\"/shared.css\">");
    auto firstCss = html.find(css);
    assert_true(firstCss != std::string::npos);
    assert_true(html.find(css, firstCss + 1) == std::string::npos);
    assert_true(html.find("<script src=\"https://cdn.example.com/lib.js\"></script>") != std::string::npos);
    assert_int_equal(composition->HeaderItems().size(), 2);

    auto divA = html.find("<div id=\"a\"></div>");
    auto divB = html.find("<div id=\"b\"></div>");
    auto second = html.find("<p>second</p>");
    assert_true(divA < divB);
    assert_true(divB < second);

    // odin (2), a.js, the cdn module once, b.js
    assert_int_equal(composition->Modules().size(), 5);
    assert_true(composition->Modules()[3] == "https://cdn.example.com/mod.js");
    assert_true(html.find("import * as m0 from \"/asset/odin/ws.js\";") != std::string::npos);
    assert_true(html.find("import * as m4 from \"/asset/b/b.js\";") != std::string::npos);
    assert_true(html.find("for (const m of [m0, m1, m2, m3, m4])") != std::string::npos);
    assert_true(html.find("m.postInitialize()") != std::string::npos);
    assert_true(html.ends_with("</html>\n"));

    const auto& etag = composition->HtmlETag();
    assert_int_equal(etag.size(), 18);
    assert_true(etag.front() == '"' && etag.back() == '"');
    assert_string_equal(HtmlEscape("a'b\"c").c_str(), "a&#39;b&quot;c");

    auto longUrl = "https://tiles.example.com/" + std::string(3000, 'x') + ".css";
    auto tiles = make_service("tiles");
    tiles->Components = [&](TComponentsBuilder& builder) {
        builder.AddCss(longUrl);
    };
    auto wide = TComposition::Build({tiles}, "t");
    assert_true(wide->Html().find("<link rel=\"stylesheet\" href=\"" + longUrl + "\">\n") != std::string::npos);
}

void test_components(void**) {
    assert_true(Fnv1a64("") == 0xcbf29ce484222325ULL);
    assert_true(Fnv1a64("a") == 0xaf63dc4c8601ec8cULL);

    assert_string_equal(ContentTypeFor("app.js").c_str(), "text/javascript; charset=utf-8");
    assert_string_equal(ContentTypeFor("img/Logo.PNG").c_str(), "image/png");
    assert_string_equal(ContentTypeFor("data.json").c_str(), "application/json");
    assert_string_equal(ContentTypeFor("noext").c_str(), "application/octet-stream");
    assert_string_equal(ContentTypeFor("dir.d/file").c_str(), "application/octet-stream");

    TComponentsBuilder builder("maps");
    builder.AddAsset("/lib/x.css", "body {}")
        .AddAsset("blob", "raw", "application/x-custom")
        .AddModule("lib/x.js")
        .AddModule("/absolute.js")
        .AddProxy(TProxySpec{.Path = "/tiles/", .Upstream = "https://tiles.example.com"});

    assert_int_equal(builder.Assets().size(), 2);
    assert_string_equal(builder.Assets()[0].Path.c_str(), "lib/x.css");
    assert_string_equal(builder.Assets()[0].ContentType.c_str(), "text/css; charset=utf-8");
    assert_string_equal(builder.Assets()[1].ContentType.c_str(), "application/x-custom");
    assert_int_equal(builder.Assets()[0].ETag.size(), 18);
    assert_true(builder.Modules()[0] == "/asset/maps/lib/x.js");
    assert_true(builder.Modules()[1] == "/absolute.js");
    assert_string_equal(builder.Proxies()[0].Service.c_str(), "maps");
    assert_string_equal(builder.Proxies()[0].Path.c_str(), "tiles");
    assert_string_equal(builder.AssetUrl("/a/b.png").c_str(), "/asset/maps/a/b.png");
}

void test_find_proxy(void**) {
    auto svc = std::make_shared<TTestService>("svc");
    svc->Components = [](TComponentsBuilder& builder) {
        builder.AddProxy(TProxySpec{.Path = "api", .Upstream = "http://127.0.0.1:1/v1"});
        builder.AddProxy(TProxySpec{.Path = "api/v2", .Upstream = "http://127.0.0.1:1/v2"});
    };
    auto composition = TComposition::Build({svc}, "t");

    auto v2 = composition->FindProxy("svc", "api/v2/items");
    assert_true(v2.has_value());
    assert_string_equal(v2->first->Upstream.c_str(), "http://127.0.0.1:1/v2");
    assert_string_equal(v2->second.c_str(), "items");

    auto v1 = composition->FindProxy("svc", "api/things/1");
    assert_string_equal(v1->first->Upstream.c_str(), "http://127.0.0.1:1/v1");
    assert_string_equal(v1->second.c_str(), "things/1");

    auto bare = composition->FindProxy("svc", "api");
    assert_true(bare.has_value());
    assert_string_equal(bare->second.c_str(), "");

    assert_false(composition->FindProxy("svc", "apix").has_value());
    assert_false(composition->FindProxy("other", "api").has_value());
}

void test_proxy_target(void**) {
    TProxySpec spec{.Upstream = "http://up:81/base/"};
    assert_string_equal(ProxyTarget(spec, "a/b", "x=1").c_str(), "http://up:81/base/a/b?x=1");
    assert_string_equal(ProxyTarget(spec, "", "").c_str(), "http://up:81/base");

    spec.CopyQuery = false;
    spec.AddQuery = {{"key", "v w"}, {"n", "1"}};
    assert_string_equal(ProxyTarget(spec, "a", "x=1").c_str(), "http://up:81/base/a?key=v%20w&n=1");

    TProxySpec fixed{.Upstream = "http://up/q?fixed=1"};
    assert_string_equal(ProxyTarget(fixed, "", "x=1").c_str(), "http://up/q?fixed=1&x=1");
}

void test_etag_matches(void**) {
    assert_true(ETagMatches("\"abc\"", "\"abc\""));
    assert_true(ETagMatches("W/\"abc\"", "\"abc\""));
    assert_true(ETagMatches("\"x\", \"abc\"", "\"abc\""));
    assert_true(ETagMatches("*", "\"abc\""));
    assert_false(ETagMatches("\"x\"", "\"abc\""));
    assert_false(ETagMatches("", "\"abc\""));
    assert_false(ETagMatches("abc", "\"abc\""));
}

void test_ws_envelope(void**) {
    json payload = {{"list", {1, 2, 3}}, {"name", "x"}};
    auto text = FormatWsMessage("svc", "update", payload);
    auto parsed = ParseWsMessage(text);
    assert_true(parsed.has_value());
    assert_string_equal(parsed->Service.c_str(), "svc");
    assert_string_equal(parsed->Type.c_str(), "update");
    assert_true(parsed->Payload == payload);

    auto noPayload = ParseWsMessage(R"({"service":"a","type":"b"})");
    assert_true(noPayload.has_value());
    assert_true(noPayload->Payload.is_null());

    for (const char* bad : {"not json", "[1,2]", R"({"service":1,"type":"x"})", R"({"service":"a"})"}) {
        auto res = ParseWsMessage(bad);
        assert_false(res.has_value());
        assert_true(res.error().Kind == EErrorKind::ProtocolError);
    }
}

void test_router(void**) {
    TLoop<TDefaultPoller> loop;
    NActors::TActorSystem system(&loop.Poller());
    auto composition = TComposition::Build({make_service("a")}, "router");
    TSpaRouter router(composition, system);

    auto index = route(loop, router, "GET / HTTP/1.1\r\nHost: x\r\n\r\n");
    assert_int_equal(status_of(index), 200);
    assert_true(body_of(index) == composition->Html());
    assert_true(index.find("ETag: " + composition->HtmlETag()) != std::string::npos);
    assert_true(index.find("text/html") != std::string::npos);

    const auto* asset = composition->FindAsset("a", "a.js");
    assert_non_null(asset);
    auto js = route(loop, router, "GET /asset/a/a.js HTTP/1.1\r\nHost: x\r\n\r\n");
    assert_int_equal(status_of(js), 200);
    assert_true(body_of(js) == asset->Content);
    assert_true(js.find("text/javascript") != std::string::npos);

    auto cached = route(loop, router, "GET /asset/a/a.js HTTP/1.1\r\nHost: x\r\nIf-None-Match: " + asset->ETag + "\r\n\r\n");
    assert_int_equal(status_of(cached), 304);
    assert_true(body_of(cached).empty());

    auto stale = route(loop, router, "GET /asset/a/a.js HTTP/1.1\r\nHost: x\r\nIf-None-Match: \"old\"\r\n\r\n");
    assert_int_equal(status_of(stale), 200);

    assert_int_equal(status_of(route(loop, router, "GET /asset/a/missing.js HTTP/1.1\r\n\r\n")), 404);
    assert_int_equal(status_of(route(loop, router, "GET /asset/a HTTP/1.1\r\n\r\n")), 404);
    assert_int_equal(status_of(route(loop, router, "GET /proxy/a/x HTTP/1.1\r\n\r\n")), 404);
    assert_int_equal(status_of(route(loop, router, "GET /elsewhere HTTP/1.1\r\n\r\n")), 404);
    assert_int_equal(status_of(route(loop, router, "GET /ws HTTP/1.1\r\n\r\n")), 426);

    auto post = route(loop, router, "POST / HTTP/1.1\r\nContent-Length: 0\r\n\r\n");
    assert_int_equal(status_of(post), 405);
    assert_true(post.find("Allow: GET") != std::string::npos);

    system.Shutdown();
    assert_int_equal(status_of(route(loop, router, "GET / HTTP/1.1\r\n\r\n")), 503);
    assert_int_equal(status_of(route(loop, router, "GET /asset/a/a.js HTTP/1.1\r\n\r\n")), 503);
    system.ProcessRequests(loop);
}

void test_spa_server(void**) {
    TLoop<TDefaultPoller> loop;
    NActors::TActorSystem system(&loop.Poller());
    TInitLog log;
    bool xReady = false;

    auto a = make_service("a");
    a->Poller = &loop.Poller();
    a->InitDelay = std::chrono::milliseconds(20);
    a->Log = &log;
    auto b = make_service("b", {"a"});
    b->Log = &log;
    auto x = make_service("x");
    x->Log = &log;
    x->Gate = [&xReady](const TSpaConnection& conn) {
        return xReady || conn.Id() == 1;
    };

    auto composition = TComposition::Build({x, b, a}, "spa test");
    auto spa = system.Spawn<TSpaServer<TSocket>>("spa", {}, TSpaServerOptions{.Port = 0}, composition);
    auto status = spa_status(loop, spa);
    assert_true(status.Port > 0);
    assert_int_equal(status.Connections, 0);

    NHttp::THttpClient http(loop.Poller(), literal_resolver());
    auto page = fetch(loop, http, {"GET", "http://127.0.0.1:" + std::to_string(status.Port) + "/", {}, ""});
    assert_int_equal(page.Status, 200);
    assert_true(page.Body == composition->Html());

    // C1 completes init for every service
    TTestClient c1(loop.Poller());
    c1.Start(status.Port);
    assert_true(step_until(loop, [&]() { return c1.Inbox.size() == 3; }));
    assert_string_equal(c1.Inbox[0].Service.c_str(), "x");
    assert_string_equal(c1.Inbox[1].Service.c_str(), "a");
    assert_string_equal(c1.Inbox[2].Service.c_str(), "b");
    assert_true(c1.Inbox[1].Payload["conn"] == 1);

    // C2 is held back by x
    TTestClient c2(loop.Poller());
    c2.Start(status.Port);
    assert_true(step_until(loop, [&]() { return c2.Inbox.size() == 2 && log.Has("x:start:2"); }));
    assert_false(log.Has("x:done:2"));
    assert_int_equal(c2.Count("x", "init"), 0);

    // dependencies acknowledge before dependents start
    for (const auto* id : {"1", "2"}) {
        auto aDone = log.Index(std::string("a:done:") + id);
        auto bStart = log.Index(std::string("b:start:") + id);
        assert_true(aDone >= 0);
        assert_true(bStart > aDone);
    }
    assert_int_equal(spa_status(loop, spa).Connections, 2);

    // broadcasts skip connections not initialized for the service
    assert_true(spa.TrySend(TBroadcastWsMsg{"x", "news", {{"n", 1}}}).has_value());
    send(loop, c2, "odin", "ping", "c2");
    assert_true(step_until(loop, [&]() { return c1.Count("x", "news") == 1 && c2.Count("odin", "pong") == 1; }));
    assert_int_equal(c2.Count("x", "news"), 0);

    // unicast ignores the init state
    assert_true(spa.TrySend(TSendWsMsg{2, "x", "direct", {{"to", 2}}}).has_value());
    assert_true(step_until(loop, [&]() { return c2.Count("x", "direct") == 1; }));
    assert_int_equal(c1.Count("x", "direct"), 0);

    // payloads survive the trip unchanged
    auto payload = json::parse(R"({"nested":{"list":[1,2.5,"three",null,true]},"unicode":"é中","quote":"\"q\"","empty":{}})");
    send(loop, c1, "odin", "ping", payload);
    assert_true(step_until(loop, [&]() { return c1.Count("odin", "pong") == 1; }));
    assert_true(c1.Find("odin", "pong")->Payload == payload);

    // replies go back to the sender, broadcasts to everyone initialized for the service
    send(loop, c1, "a", "echo", {{"v", 7}});
    send(loop, c1, "a", "shout", {{"v", 8}});
    assert_true(step_until(loop, [&]() { return c1.Count("a", "echo") == 1 && c1.Count("a", "shout") == 1 && c2.Count("a", "shout") == 1; }));
    assert_int_equal(c2.Count("a", "echo"), 0);

    // unknown services are dropped without closing
    send(loop, c1, "ghost", "boo", nullptr);

    // new data: the reaction goes out first, then pending inits run
    xReady = true;
    assert_true(spa.TrySend(TDataAvailable{"x", "fresh"}).has_value());
    assert_true(step_until(loop, [&]() { return c1.Count("x", "refresh") == 1 && c2.Count("x", "init") == 1; }));
    assert_int_equal(c2.Count("x", "refresh"), 0);
    assert_true(c1.Find("x", "refresh")->Payload["kind"] == "fresh");

    assert_true(spa.TrySend(TBroadcastWsMsg{"x", "news", {{"n", 2}}}).has_value());
    assert_true(step_until(loop, [&]() { return c1.Count("x", "news") == 2 && c2.Count("x", "news") == 1; }));
    assert_false(c1.Closed);

    // malformed messages close the connection with 1003
    send_raw(loop, c2, "definitely not json");
    assert_true(step_until(loop, [&]() { return c2.Closed; }));
    assert_int_equal(*c2.CloseCode, WsCloseUnsupported);
    assert_true(step_until(loop, [&]() { return spa_status(loop, spa).Connections == 1; }));
    assert_true(std::find(a->Removed.begin(), a->Removed.end(), 2) != a->Removed.end());

    // a message type the service does not know is a protocol error too
    TTestClient c3(loop.Poller());
    c3.Start(status.Port);
    assert_true(step_until(loop, [&]() { return c3.Count("b", "init") == 1; }));
    send(loop, c3, "b", "bogus", nullptr);
    assert_true(step_until(loop, [&]() { return c3.Closed; }));
    assert_int_equal(*c3.CloseCode, WsCloseUnsupported);

    system.Shutdown();
    system.ProcessRequests(loop);
    assert_true(step_until(loop, [&]() { return c1.Closed; }));
    assert_int_equal(*c1.CloseCode, WsCloseGoingAway);
    assert_true(std::find(a->Removed.begin(), a->Removed.end(), 1) != a->Removed.end());
}

void test_share_service(void**) {
    using TJsonStoreActor = NStore::TSharedStoreActor<json>;

    TLoop<TDefaultPoller> loop;
    NActors::TActorSystem system(&loop.Poller());
    auto store = system.Spawn<TJsonStoreActor>("store", {}, NStore::TSharedStoreOptions{});
    assert_true(store.TrySend(NStore::TSetShared<json>{"greeting", "hi", "admin", "seed"}).has_value());

    auto share = std::make_shared<TShareService>(store);
    auto composition = TComposition::Build({share}, "share");
    assert_non_null(composition->FindAsset("share", "share.js"));
    assert_true(composition->Modules().back() == "/asset/share/share.js");

    auto spa = system.Spawn<TSpaServer<TSocket>>("spa", {}, TSpaServerOptions{.Port = 0, .PrincipalHeader = "X-Odin-User"}, composition);
    auto port = spa_status(loop, spa).Port;

    TTestClient client(loop.Poller());
    client.Start(port);
    assert_true(step_until(loop, [&]() { return client.Count("share", "initSharedItems") == 1; }));
    const auto& items = client.Find("share", "initSharedItems")->Payload["items"];
    assert_int_equal(items.size(), 1);
    assert_true(items[0]["key"] == "greeting");
    assert_true(items[0]["value"] == "hi");
    assert_true(items[0]["owner"] == "admin");
    assert_true(items[0]["comment"] == "seed");

    send(loop, client, "share", "setShared", {{"key", "color"}, {"value", {{"r", 255}}}, {"comment", "pick"}});
    assert_true(step_until(loop, [&]() { return client.Count("share", "sharedItemChanged") == 1; }));
    const auto& changed = client.Find("share", "sharedItemChanged")->Payload;
    assert_true(changed["key"] == "color");
    assert_true(changed["item"]["value"] == json({{"r", 255}}));
    assert_true(changed["item"]["comment"] == "pick");
    // no principal header: the owner is the peer address
    assert_true(changed["item"]["owner"].get<std::string>().starts_with("127.0.0.1"));
    assert_true(changed["item"]["timestamp"].get<int64_t>() > 0);

    TTestClient alice(loop.Poller());
    alice.Start(port, {{"X-Odin-User", "alice"}});
    assert_true(step_until(loop, [&]() { return alice.Count("share", "initSharedItems") == 1; }));
    send(loop, alice, "share", "setShared", {{"key", "mood"}, {"value", "calm"}});
    assert_true(step_until(loop, [&]() { return client.Count("share", "sharedItemChanged") == 2; }));
    assert_true(client.Inbox.back().Payload["key"] == "mood");
    assert_true(client.Inbox.back().Payload["item"]["owner"] == "alice");

    send(loop, client, "share", "removeShared", {{"key", "color"}});
    assert_true(step_until(loop, [&]() { return client.Count("share", "sharedItemChanged") == 3; }));
    assert_true(client.Inbox.back().Payload["key"] == "color");
    assert_true(client.Inbox.back().Payload["item"].is_null());

    send(loop, client, "share", "setShared", {{"value", 1}});
    assert_true(step_until(loop, [&]() { return client.Closed; }));
    assert_int_equal(*client.CloseCode, WsCloseUnsupported);

    system.Shutdown();
    system.ProcessRequests(loop);
}

void test_spa_proxy(void**) {
    TLoop<TDefaultPoller> loop;
    NActors::TActorSystem system(&loop.Poller());

    TUpstreamRouter upstreamRouter;
    auto upstreamListener = listen_loopback(loop.Poller());
    auto upstreamPort = upstreamListener.LocalAddr()->Port();
    NHttp::TWebServer<TSocket> upstream(std::move(upstreamListener), upstreamRouter);
    upstream.Start();

    int deadPort = 0;
    {
        auto closed = listen_loopback(loop.Poller());
        deadPort = closed.LocalAddr()->Port();
    }

    auto api = make_service("api");
    api->Components = [upstreamPort, deadPort](TComponentsBuilder& builder) {
        builder.AddProxy(TProxySpec{
            .Path = "v1",
            .Upstream = "http://127.0.0.1:" + std::to_string(upstreamPort) + "/base",
            .CopyHeaders = {"X-Token"},
            .AddHeaders = {{"X-Added", "yes"}},
            .AddQuery = {{"key", "k1"}},
        });
        builder.AddProxy(TProxySpec{.Path = "dead", .Upstream = "http://127.0.0.1:" + std::to_string(deadPort)});
    };
    auto composition = TComposition::Build({api}, "proxy");
    auto spa = system.Spawn<TSpaServer<TSocket>>("spa", {}, TSpaServerOptions{.Port = 0}, composition);
    auto base = "http://127.0.0.1:" + std::to_string(spa_status(loop, spa).Port);

    NHttp::THttpClient http(loop.Poller(), literal_resolver());
    auto response = fetch(loop, http, {"GET", base + "/proxy/api/v1/items/7?q=1", {{"X-Token", "abc"}, {"Cookie", "secret"}}, ""});
    assert_int_equal(response.Status, 200);
    assert_string_equal(response.Body.c_str(), "/base/items/7?q=1&key=k1 token=abc added=yes cookie=-");
    assert_true(response.Header("Content-Type") == "application/json");
    assert_true(response.Header("Cache-Control") == "max-age=60");
    assert_false(response.Header("X-Secret").has_value());
    assert_int_equal(upstreamRouter.Requests, 1);

    auto failed = fetch(loop, http, {"GET", base + "/proxy/api/dead/x", {}, ""});
    assert_int_equal(failed.Status, 502);

    auto missing = fetch(loop, http, {"GET", base + "/proxy/api/elsewhere", {}, ""});
    assert_int_equal(missing.Status, 404);

    system.Shutdown();
    system.ProcessRequests(loop);
    upstream.Stop();
}

int main(int argc, char** argv) {
    TInitializer init;

    std::vector<CMUnitTest> tests;
    std::unordered_set<std::string> filters;
    tests.reserve(100);

    parse_filters(argc, argv, filters);

    ADD_TEST(cmocka_unit_test, test_service_names);
    ADD_TEST(cmocka_unit_test, test_sort_services);
    ADD_TEST(cmocka_unit_test, test_composition_order);
    ADD_TEST(cmocka_unit_test, test_composition_conflicts);
    ADD_TEST(cmocka_unit_test, test_html_document);
    ADD_TEST(cmocka_unit_test, test_components);
    ADD_TEST(cmocka_unit_test, test_find_proxy);
    ADD_TEST(cmocka_unit_test, test_proxy_target);
    ADD_TEST(cmocka_unit_test, test_etag_matches);
    ADD_TEST(cmocka_unit_test, test_ws_envelope);
    ADD_TEST(cmocka_unit_test, test_router);
    ADD_TEST(cmocka_unit_test, test_spa_server);
    ADD_TEST(cmocka_unit_test, test_share_service);
    ADD_TEST(cmocka_unit_test, test_spa_proxy);

    return _cmocka_run_group_tests("test_spa", tests.data(), tests.size(), NULL, NULL);
}
