#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "components.hpp"
#include "service.hpp"

namespace NOdin {
namespace NSpa {

/// True for non-empty names made of [A-Za-z0-9._-].
bool IsValidServiceName(std::string_view name);

/**
 * @brief Dependency order of @p services.
 *
 * Stable: among services whose dependencies are satisfied the earliest in
 * the input goes first.
 * @throws TOdinError ConfigError on unknown dependencies and cycles
 */
std::vector<std::shared_ptr<IService>> SortServices(const std::vector<std::shared_ptr<IService>>& services);

/**
 * @class TComposition
 * @brief Everything the SPA server derives from its service list, computed once.
 *
 * Build() prepends the intrinsic `odin` service, orders the list by
 * dependencies, collects the components and assembles the HTML document.
 *
 * @code{.cpp}
 * auto composition = TComposition::Build({tracks, share}, "odin");
 * system.Spawn<TSpaServer<TSocket>>("spa", {}, options, composition);
 * @endcode
 */
class TComposition {
public:
    /**
     * @throws TOdinError ConfigError for invalid names, unknown dependencies
     * and cycles; NameConflict for duplicate services, duplicate asset paths
     * and proxies shadowing assets
     */
    static std::shared_ptr<const TComposition> Build(std::vector<std::shared_ptr<IService>> services, std::string title);

    /// In dependency order, `odin` first.
    const std::vector<std::shared_ptr<IService>>& Services() const {
        return Services_;
    }

    std::shared_ptr<IService> Find(const std::string& name) const;
    const std::vector<std::string>& DepsOf(const std::string& name) const;

    const TAsset* FindAsset(const std::string& service, const std::string& path) const;

    /// Longest proxy prefix of @p path within @p service and the remainder after it.
    std::optional<std::pair<const TProxySpec*, std::string>> FindProxy(const std::string& service, const std::string& path) const;

    const std::string& Html() const {
        return Html_;
    }

    const std::string& HtmlETag() const {
        return HtmlETag_;
    }

    const std::vector<std::string>& Modules() const {
        return Modules_;
    }

    const std::vector<THeaderItem>& HeaderItems() const {
        return HeaderItems_;
    }

    const std::string& Title() const {
        return Title_;
    }

    size_t AssetsSize() const {
        return Assets_.size();
    }

private:
    void Assemble();

    std::string Title_;
    std::vector<std::shared_ptr<IService>> Services_;
    std::map<std::string, std::vector<std::string>> Deps_;
    // "<service>/<path>"
    std::map<std::string, TAsset> Assets_;
    std::vector<TProxySpec> Proxies_;
    std::vector<THeaderItem> HeaderItems_;
    std::vector<std::string> BodyFragments_;
    std::vector<std::string> Modules_;
    std::string Html_;
    std::string HtmlETag_;
};

std::string HtmlEscape(std::string_view text);

} // namespace NSpa
} // namespace NOdin
