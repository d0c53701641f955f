#pragma once

#include "raptor/core/Request.hpp"
#include "raptor/routing/Handler.hpp"
#include "raptor/routing/RoutePath.hpp"

#include <cstdint>
#include <map>
#include <string>

namespace raptor::routing {

class ArgumentResolver {
public:
    // Name of the parameter that receives the whole request parameter map.
    static constexpr const char* kParamsArgument = "params";

    static ArgumentList resolve(const HandlerSignature& signature,
                                const std::map<std::string, std::int64_t>& pathArgs,
                                const ParamMap& params);

    static ArgumentList resolve(const HandlerSignature& signature,
                                const RoutePath& path,
                                const Request& request);
};

} // namespace raptor::routing
