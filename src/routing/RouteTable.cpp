#include "raptor/routing/RouteTable.hpp"
#include "raptor/core/Errors.hpp"
#include "raptor/util/Logging.hpp"

#include <algorithm>

namespace raptor::routing {

RouteTableBuilder::RouteTableBuilder(std::shared_ptr<const ResourceDescriptor> resource,
                                     std::shared_ptr<const view::TemplateEngine> engine)
    : resource_(std::move(resource))
    , engine_(std::move(engine))
    , router_(std::make_shared<Router>(resource_)) {}

RouteTableBuilder& RouteTableBuilder::show(std::string handler) {
    return conventional("show", std::move(handler));
}

RouteTableBuilder& RouteTableBuilder::newRecord(std::string handler) {
    return conventional("new", std::move(handler));
}

RouteTableBuilder& RouteTableBuilder::index(std::string handler) {
    return conventional("index", std::move(handler));
}

RouteTableBuilder& RouteTableBuilder::conventional(std::string_view kind, std::string handler) {
    auto it = std::find_if(kRouteConventions.begin(), kRouteConventions.end(),
                           [kind](const RouteConvention& convention) { return convention.kind == kind; });
    if (it == kRouteConventions.end()) {
        throw UnknownRouteKind(std::string(kind));
    }
    if (handler.empty()) {
        handler = std::string(it->defaultHandler);
    }
    auto path = "/" + resource_->resourceName() + std::string(it->pathSuffix);
    return route(std::move(path), std::move(handler), std::string(it->kind));
}

RouteTableBuilder& RouteTableBuilder::route(std::string path, std::string handler, std::string kind) {
    if (!router_) {
        throw RoutingError("route table for " + resource_->resourceName() + " was already built");
    }
    util::log(util::LogLevel::debug,
              "route " + path + " -> " + resource_->typeName() + "::" + handler + " [" + kind + "]");
    router_->addRoute(Route(std::move(path), std::move(handler), std::move(kind), resource_, engine_));
    return *this;
}

std::shared_ptr<const Router> RouteTableBuilder::build() {
    if (!router_) {
        throw RoutingError("route table for " + resource_->resourceName() + " was already built");
    }
    return std::exchange(router_, nullptr);
}

} // namespace raptor::routing
