#include "composition.hpp"
#include "odin_service.hpp"

#include <odin/log.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <set>
#include <utility>

namespace NOdin {
namespace NSpa {

namespace {

template<typename T>
void AppendUnique(std::vector<T>& to, const std::vector<T>& from) {
    for (const auto& item : from) {
        if (std::find(to.begin(), to.end(), item) == to.end()) {
            to.push_back(item);
        }
    }
}

// markup before and after the escaped url
std::pair<const char*, const char*> HeaderTemplate(EHeaderItem kind) {
    switch (kind) {
    case EHeaderItem::Css:
        return {"<link rel=\"stylesheet\" href=\"", "\">\n"};
    case EHeaderItem::Script:
        return {"<script src=\"", "\"></script>\n"};
    case EHeaderItem::Module:
        return {"<script type=\"module\" src=\"", "\"></script>\n"};
    }
    return {"", ""};
}

} // namespace

bool IsValidServiceName(std::string_view name) {
    return !name.empty() && name != "." && name != ".." && std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-';
    });
}

std::string HtmlEscape(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&': result += "&amp;"; break;
        case '<': result += "&lt;"; break;
        case '>': result += "&gt;"; break;
        case '"': result += "&quot;"; break;
        case '\'': result += "&#39;"; break;
        default: result += c;
        }
    }
    return result;
}

std::vector<std::shared_ptr<IService>> SortServices(const std::vector<std::shared_ptr<IService>>& services) {
    std::set<std::string> known;
    for (const auto& service : services) {
        known.insert(service->Name());
    }
    std::vector<std::vector<std::string>> deps;
    for (const auto& service : services) {
        deps.push_back(service->Deps());
        for (const auto& dep : deps.back()) {
            if (!known.contains(dep)) {
                throw TOdinError(EErrorKind::ConfigError, "service '" + service->Name() + "' depends on unknown service '" + dep + "'");
            }
        }
    }

    std::vector<std::shared_ptr<IService>> sorted;
    std::set<std::string> placed;
    std::vector<bool> done(services.size(), false);
    while (sorted.size() < services.size()) {
        bool progress = false;
        for (size_t i = 0; i < services.size(); ++i) {
            if (done[i]) {
                continue;
            }
            bool ready = std::all_of(deps[i].begin(), deps[i].end(), [&](const std::string& dep) {
                return placed.contains(dep);
            });
            if (ready) {
                done[i] = true;
                placed.insert(services[i]->Name());
                sorted.push_back(services[i]);
                progress = true;
                break;
            }
        }
        if (!progress) {
            std::string cycle;
            for (size_t i = 0; i < services.size(); ++i) {
                if (!done[i]) {
                    cycle += (cycle.empty() ? "" : ", ") + services[i]->Name();
                }
            }
            throw TOdinError(EErrorKind::ConfigError, "dependency cycle among services: " + cycle);
        }
    }
    return sorted;
}

std::shared_ptr<const TComposition> TComposition::Build(std::vector<std::shared_ptr<IService>> services, std::string title) {
    auto composition = std::make_shared<TComposition>();
    composition->Title_ = std::move(title);

    std::set<std::string> names = {OdinServiceName};
    for (const auto& service : services) {
        if (!service) {
            throw TOdinError(EErrorKind::ConfigError, "null service in the service list");
        }
        auto name = service->Name();
        if (!IsValidServiceName(name)) {
            throw TOdinError(EErrorKind::ConfigError, "invalid service name '" + name + "'");
        }
        if (!names.insert(name).second) {
            throw TOdinError(EErrorKind::NameConflict, "duplicate service '" + name + "'");
        }
    }

    services.insert(services.begin(), MakeOdinService());
    composition->Services_ = SortServices(services);
    composition->Assemble();
    return composition;
}

void TComposition::Assemble() {
    // asset paths are unique across the whole list, not just per service
    std::set<std::string> assetPaths;
    for (const auto& service : Services_) {
        auto name = service->Name();
        Deps_[name] = service->Deps();

        TComponentsBuilder builder(name);
        service->AddComponents(builder);

        for (const auto& asset : builder.Assets()) {
            auto key = name + "/" + asset.Path;
            if (!assetPaths.insert(asset.Path).second || !Assets_.emplace(key, asset).second) {
                throw TOdinError(EErrorKind::NameConflict, "duplicate asset path '" + asset.Path + "' in service " + name);
            }
        }
        for (const auto& proxy : builder.Proxies()) {
            for (const auto& other : Proxies_) {
                if (other.Service == proxy.Service && other.Path == proxy.Path) {
                    throw TOdinError(EErrorKind::NameConflict, "duplicate proxy /proxy/" + name + "/" + proxy.Path);
                }
            }
            Proxies_.push_back(proxy);
        }
        AppendUnique(HeaderItems_, builder.HeaderItems());
        BodyFragments_.insert(BodyFragments_.end(), builder.BodyFragments().begin(), builder.BodyFragments().end());
        AppendUnique(Modules_, builder.Modules());
    }

    // a proxy must not take over a path that is also an asset of its service
    for (const auto& proxy : Proxies_) {
        auto prefix = proxy.Service + "/" + proxy.Path;
        for (const auto& [key, asset] : Assets_) {
            if (asset.Service != proxy.Service) {
                continue;
            }
            bool shadowed = proxy.Path.empty()
                || key == prefix
                || (key.size() > prefix.size() && key.starts_with(prefix) && key[prefix.size()] == '/');
            if (shadowed) {
                throw TOdinError(EErrorKind::NameConflict, "proxy /proxy/" + prefix + " shadows asset " + key);
            }
        }
    }

    std::string html;
    html += "<!DOCTYPE html>\n<html>\n<head>\n<meta charset=\"utf-8\">\n";
    html += "<title>" + HtmlEscape(Title_) + "</title>\n";
    for (const auto& item : HeaderItems_) {
        auto [before, after] = HeaderTemplate(item.Kind);
        html += before;
        html += HtmlEscape(item.Url);
        html += after;
    }
    html += "</head>\n<body>\n";
    for (const auto& fragment : BodyFragments_) {
        html += fragment;
        html += "\n";
    }
    html += "<script type=\"module\">\n";
    for (size_t i = 0; i < Modules_.size(); ++i) {
        html += "import * as m" + std::to_string(i) + " from \"" + Modules_[i] + "\";\n";
    }
    html += "for (const m of [";
    for (size_t i = 0; i < Modules_.size(); ++i) {
        html += (i ? ", m" : "m") + std::to_string(i);
    }
    html += "]) {\n  if (typeof m.postInitialize === \"function\") { m.postInitialize(); }\n}\n";
    html += "</script>\n</body>\n</html>\n";

    char etag[24];
    std::snprintf(etag, sizeof(etag), "\"%016llx\"", static_cast<unsigned long long>(Fnv1a64(html)));
    Html_ = std::move(html);
    HtmlETag_ = etag;

    ODIN_DEBUG << "composed " << Services_.size() << " services, " << Assets_.size() << " assets, "
        << Proxies_.size() << " proxies, " << Modules_.size() << " modules";
}

std::shared_ptr<IService> TComposition::Find(const std::string& name) const {
    for (const auto& service : Services_) {
        if (service->Name() == name) {
            return service;
        }
    }
    return nullptr;
}

const std::vector<std::string>& TComposition::DepsOf(const std::string& name) const {
    static const std::vector<std::string> none;
    auto it = Deps_.find(name);
    return it == Deps_.end() ? none : it->second;
}

const TAsset* TComposition::FindAsset(const std::string& service, const std::string& path) const {
    auto it = Assets_.find(service + "/" + path);
    return it == Assets_.end() ? nullptr : &it->second;
}

std::optional<std::pair<const TProxySpec*, std::string>> TComposition::FindProxy(const std::string& service, const std::string& path) const {
    const TProxySpec* best = nullptr;
    for (const auto& proxy : Proxies_) {
        if (proxy.Service != service) {
            continue;
        }
        bool matches = proxy.Path.empty()
            || path == proxy.Path
            || (path.size() > proxy.Path.size() && path.starts_with(proxy.Path) && path[proxy.Path.size()] == '/');
        if (matches && (!best || proxy.Path.size() > best->Path.size())) {
            best = &proxy;
        }
    }
    if (!best) {
        return std::nullopt;
    }
    auto rest = best->Path.empty() ? path : path.substr(std::min(path.size(), best->Path.size() + 1));
    return std::make_pair(best, rest);
}

} // namespace NSpa
} // namespace NOdin
