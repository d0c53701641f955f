#pragma once

#include "raptor/routing/Application.hpp"
#include "raptor/server/RequestContext.hpp"

namespace raptor::server {

// Routes ctx.request through the application and fills ctx.response. Routing
// errors and handler failures become JSON error responses.
void handleRequest(const routing::Application& app, RequestContext& ctx);

} // namespace raptor::server
