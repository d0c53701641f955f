#include "raptor/core/Errors.hpp"

namespace raptor {

NoRouteMatches::NoRouteMatches(const std::string& path)
    : RoutingError("no route matches " + path)
    , path_(path) {}

MissingArgument::MissingArgument(const std::string& name)
    : RoutingError("missing argument: " + name)
    , name_(name) {}

InvalidPathArgument::InvalidPathArgument(const std::string& name, const std::string& segment)
    : RoutingError("path argument '" + name + "' is not an integer in range: '" + segment + "'")
    , name_(name)
    , segment_(segment) {}

InvalidArgumentType::InvalidArgumentType(const std::string& handler, std::size_t position)
    : RoutingError("argument " + std::to_string(position) + " of handler '" + handler +
                   "' has the wrong type") {}

UnknownRouteKind::UnknownRouteKind(const std::string& kind)
    : RoutingError("unknown route kind: " + kind) {}

TemplateNotFound::TemplateNotFound(const std::string& path)
    : RoutingError("template not found: " + path) {}

} // namespace raptor
