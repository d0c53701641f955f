#pragma once

#include "raptor/core/Request.hpp"
#include "raptor/routing/ResourceDescriptor.hpp"
#include "raptor/routing/Route.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace raptor::routing {

// Routes of one resource in declaration order. The first route whose path
// matches handles the request.
class Router {
public:
    explicit Router(std::shared_ptr<const ResourceDescriptor> resource);

    void addRoute(Route route);

    // Throws NoRouteMatches when no route accepts request.path.
    std::string call(const Request& request) const;

    bool matches(std::string_view path) const;
    const Route& routeForPath(std::string_view path) const;

    const ResourceDescriptor& resource() const noexcept { return *resource_; }
    const std::vector<Route>& routes() const noexcept { return routes_; }

private:
    std::shared_ptr<const ResourceDescriptor> resource_;
    std::vector<Route> routes_;
};

} // namespace raptor::routing
