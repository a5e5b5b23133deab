#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace NOdin {
namespace NSpa {

/// 64-bit FNV-1a.
uint64_t Fnv1a64(std::string_view data);

/// MIME type guessed from the extension of @p path, application/octet-stream if unknown.
std::string ContentTypeFor(std::string_view path);

/// Static resource served under /asset/<service>/<path>.
struct TAsset {
    std::string Service;
    std::string Path;
    std::string Content;
    std::string ContentType;
    // strong validator, quoted
    std::string ETag;
};

/**
 * @brief Upstream resource served under /proxy/<service>/<path>/<rest>.
 *
 * The upstream request goes to Upstream + "/" + rest, followed by the
 * client's query string when CopyQuery is set and by AddQuery.
 */
struct TProxySpec {
    std::string Service;
    // public prefix inside the service, empty for the whole service scope
    std::string Path;
    // http(s)://host[:port][/base]
    std::string Upstream;
    std::vector<std::string> CopyHeaders;
    std::vector<std::pair<std::string, std::string>> AddHeaders;
    bool CopyQuery = true;
    std::vector<std::pair<std::string, std::string>> AddQuery;
};

enum class EHeaderItem {
    Css,
    Script,
    Module,
};

struct THeaderItem {
    EHeaderItem Kind = EHeaderItem::Script;
    std::string Url;

    bool operator==(const THeaderItem&) const = default;
};

/**
 * @class TComponentsBuilder
 * @brief Collects what one service contributes to the SPA.
 *
 * @code{.cpp}
 * void AddComponents(TComponentsBuilder& builder) override {
 *     builder.AddAsset("tracks.js", TracksJs);
 *     builder.AddModule("tracks.js");
 *     builder.AddBodyFragment("<div id=\"tracks\"></div>");
 * }
 * @endcode
 */
class TComponentsBuilder {
public:
    explicit TComponentsBuilder(std::string service)
        : Service_(std::move(service))
    { }

    const std::string& Service() const {
        return Service_;
    }

    /// @p contentType is derived from the extension when empty.
    TComponentsBuilder& AddAsset(std::string path, std::string content, std::string contentType = {});
    /// @p spec.Service is filled in.
    TComponentsBuilder& AddProxy(TProxySpec spec);
    TComponentsBuilder& AddCss(std::string url);
    TComponentsBuilder& AddScript(std::string url);
    TComponentsBuilder& AddHeaderItem(EHeaderItem kind, std::string url);
    TComponentsBuilder& AddBodyFragment(std::string html);
    /// Client module: an asset path of this service or an absolute URL.
    TComponentsBuilder& AddModule(std::string pathOrUrl);

    /// "/asset/<service>/<path>"
    std::string AssetUrl(std::string_view path) const;

    const std::vector<TAsset>& Assets() const {
        return Assets_;
    }

    const std::vector<TProxySpec>& Proxies() const {
        return Proxies_;
    }

    const std::vector<THeaderItem>& HeaderItems() const {
        return HeaderItems_;
    }

    const std::vector<std::string>& BodyFragments() const {
        return BodyFragments_;
    }

    const std::vector<std::string>& Modules() const {
        return Modules_;
    }

private:
    std::string Service_;
    std::vector<TAsset> Assets_;
    std::vector<TProxySpec> Proxies_;
    std::vector<THeaderItem> HeaderItems_;
    std::vector<std::string> BodyFragments_;
    std::vector<std::string> Modules_;
};

} // namespace NSpa
} // namespace NOdin
