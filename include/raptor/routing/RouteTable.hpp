#pragma once

#include "raptor/routing/ResourceDescriptor.hpp"
#include "raptor/routing/Router.hpp"
#include "raptor/view/TemplateEngine.hpp"

#include <array>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace raptor::routing {

struct RouteConvention {
    std::string_view kind;
    std::string_view pathSuffix;  // appended to "/<resource>"
    std::string_view defaultHandler;
};

inline constexpr std::array<RouteConvention, 3> kRouteConventions{{
    {"show", "/:id", "Record.find_by_id"},
    {"new", "/new", "Record.initialize"},
    {"index", "", "Record.all"},
}};

// Collects the routes of one resource. Handler names are checked against the
// record's handler table as each route is added.
class RouteTableBuilder {
public:
    RouteTableBuilder(std::shared_ptr<const ResourceDescriptor> resource,
                      std::shared_ptr<const view::TemplateEngine> engine);

    RouteTableBuilder& show(std::string handler = {});
    RouteTableBuilder& newRecord(std::string handler = {});
    RouteTableBuilder& index(std::string handler = {});

    // Throws UnknownRouteKind for anything but show, new and index.
    RouteTableBuilder& conventional(std::string_view kind, std::string handler = {});

    RouteTableBuilder& route(std::string path, std::string handler, std::string kind);

    std::shared_ptr<const Router> build();

private:
    std::shared_ptr<const ResourceDescriptor> resource_;
    std::shared_ptr<const view::TemplateEngine> engine_;
    std::shared_ptr<Router> router_;
};

template <Resource R, typename Block>
std::shared_ptr<const Router> routes(std::shared_ptr<const view::TemplateEngine> engine, Block&& block) {
    RouteTableBuilder builder(ResourceDescriptor::wrap<R>(), std::move(engine));
    std::forward<Block>(block)(builder);
    return builder.build();
}

} // namespace raptor::routing
