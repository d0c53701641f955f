#include "raptor/routing/Router.hpp"
#include "raptor/core/Errors.hpp"

#include <algorithm>
#include <utility>

namespace raptor::routing {

Router::Router(std::shared_ptr<const ResourceDescriptor> resource)
    : resource_(std::move(resource)) {
    if (!resource_) {
        throw MissingResourceConvention("router needs a resource");
    }
}

void Router::addRoute(Route route) {
    routes_.push_back(std::move(route));
}

std::string Router::call(const Request& request) const {
    return routeForPath(request.path).call(request);
}

bool Router::matches(std::string_view path) const {
    return std::any_of(routes_.begin(), routes_.end(), [path](const Route& route) {
        return route.matches(path);
    });
}

const Route& Router::routeForPath(std::string_view path) const {
    for (const auto& route : routes_) {
        if (route.matches(path)) {
            return route;
        }
    }
    throw NoRouteMatches(std::string(path));
}

} // namespace raptor::routing
