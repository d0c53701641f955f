#pragma once

#include "raptor/core/Request.hpp"
#include "raptor/routing/Router.hpp"

#include <memory>
#include <string>
#include <vector>

namespace raptor::routing {

// Tries each resource's router in registration order. NoRouteMatches from any
// router but the last moves on to the next one.
class Application {
public:
    explicit Application(std::vector<std::shared_ptr<const Router>> routers);

    std::string call(const Request& request) const;

    const std::vector<std::shared_ptr<const Router>>& routers() const noexcept { return routers_; }

private:
    std::vector<std::shared_ptr<const Router>> routers_;
};

} // namespace raptor::routing
