#pragma once

#include "raptor/core/Request.hpp"

#include <string>
#include <string_view>

namespace raptor::server {

std::string urlDecode(std::string_view value);

// Adds key=value pairs from an application/x-www-form-urlencoded string.
// Keys already present are kept.
void parseUrlEncoded(std::string_view encoded, ParamMap& params);

// Splits target into path and query, then merges a form-encoded body.
Request buildRequest(std::string_view target, std::string_view body, std::string_view contentType);

} // namespace raptor::server
