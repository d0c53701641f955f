#include "raptor/routing/Application.hpp"
#include "raptor/core/Errors.hpp"
#include "raptor/util/Logging.hpp"

#include <algorithm>
#include <utility>

namespace raptor::routing {

Application::Application(std::vector<std::shared_ptr<const Router>> routers)
    : routers_(std::move(routers)) {
    if (std::any_of(routers_.begin(), routers_.end(), [](const auto& router) { return !router; })) {
        throw MissingResourceConvention("application was given an empty router");
    }
}

std::string Application::call(const Request& request) const {
    if (routers_.empty()) {
        throw NoRouteMatches(request.path);
    }
    for (std::size_t i = 0; i < routers_.size(); ++i) {
        try {
            return routers_[i]->call(request);
        } catch (const NoRouteMatches&) {
            if (i + 1 == routers_.size()) {
                throw;
            }
            if (util::shouldLog(util::LogLevel::trace)) {
                util::log(util::LogLevel::trace,
                          request.path + " not routed by " + routers_[i]->resource().resourceName());
            }
        }
    }
    throw NoRouteMatches(request.path);
}

} // namespace raptor::routing
