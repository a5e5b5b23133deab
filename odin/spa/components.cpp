#include "components.hpp"

#include <cctype>
#include <cstdio>
#include <unordered_map>

namespace NOdin {
namespace NSpa {

uint64_t Fnv1a64(std::string_view data) {
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (char c : data) {
        hash ^= static_cast<uint8_t>(c);
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

std::string ContentTypeFor(std::string_view path) {
    static const std::unordered_map<std::string, std::string> types = {
        {"html", "text/html; charset=utf-8"},
        {"htm", "text/html; charset=utf-8"},
        {"css", "text/css; charset=utf-8"},
        {"js", "text/javascript; charset=utf-8"},
        {"mjs", "text/javascript; charset=utf-8"},
        {"json", "application/json"},
        {"geojson", "application/geo+json"},
        {"txt", "text/plain; charset=utf-8"},
        {"csv", "text/csv; charset=utf-8"},
        {"svg", "image/svg+xml"},
        {"png", "image/png"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"gif", "image/gif"},
        {"webp", "image/webp"},
        {"ico", "image/x-icon"},
        {"wasm", "application/wasm"},
        {"glb", "model/gltf-binary"},
        {"gltf", "model/gltf+json"},
        {"woff", "font/woff"},
        {"woff2", "font/woff2"},
    };

    auto slash = path.rfind('/');
    auto dot = path.rfind('.');
    if (dot == std::string_view::npos || (slash != std::string_view::npos && dot < slash)) {
        return "application/octet-stream";
    }
    std::string ext(path.substr(dot + 1));
    for (auto& c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    auto it = types.find(ext);
    return it == types.end() ? "application/octet-stream" : it->second;
}

TComponentsBuilder& TComponentsBuilder::AddAsset(std::string path, std::string content, std::string contentType) {
    while (!path.empty() && path.front() == '/') {
        path.erase(path.begin());
    }
    if (contentType.empty()) {
        contentType = ContentTypeFor(path);
    }
    char etag[24];
    std::snprintf(etag, sizeof(etag), "\"%016llx\"", static_cast<unsigned long long>(Fnv1a64(content)));
    Assets_.emplace_back(TAsset{Service_, std::move(path), std::move(content), std::move(contentType), etag});
    return *this;
}

TComponentsBuilder& TComponentsBuilder::AddProxy(TProxySpec spec) {
    spec.Service = Service_;
    while (!spec.Path.empty() && spec.Path.front() == '/') {
        spec.Path.erase(spec.Path.begin());
    }
    while (!spec.Path.empty() && spec.Path.back() == '/') {
        spec.Path.pop_back();
    }
    Proxies_.emplace_back(std::move(spec));
    return *this;
}

TComponentsBuilder& TComponentsBuilder::AddCss(std::string url) {
    return AddHeaderItem(EHeaderItem::Css, std::move(url));
}

TComponentsBuilder& TComponentsBuilder::AddScript(std::string url) {
    return AddHeaderItem(EHeaderItem::Script, std::move(url));
}

TComponentsBuilder& TComponentsBuilder::AddHeaderItem(EHeaderItem kind, std::string url) {
    HeaderItems_.emplace_back(THeaderItem{kind, std::move(url)});
    return *this;
}

TComponentsBuilder& TComponentsBuilder::AddBodyFragment(std::string html) {
    BodyFragments_.emplace_back(std::move(html));
    return *this;
}

TComponentsBuilder& TComponentsBuilder::AddModule(std::string pathOrUrl) {
    bool absolute = pathOrUrl.starts_with("/") || pathOrUrl.find("://") != std::string::npos;
    Modules_.emplace_back(absolute ? std::move(pathOrUrl) : AssetUrl(pathOrUrl));
    return *this;
}

std::string TComponentsBuilder::AssetUrl(std::string_view path) const {
    while (!path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    }
    return "/asset/" + Service_ + "/" + std::string(path);
}

} // namespace NSpa
} // namespace NOdin
