#include "raptor/routing/ArgumentResolver.hpp"
#include "raptor/core/Errors.hpp"

namespace raptor::routing {

ArgumentList ArgumentResolver::resolve(const HandlerSignature& signature,
                                       const std::map<std::string, std::int64_t>& pathArgs,
                                       const ParamMap& params) {
    ArgumentList args;
    if (signature.acceptsAnything()) {
        return args;
    }

    args.reserve(signature.parameters.size());
    for (const auto& name : signature.parameters) {
        // "params" always names the request map, even over a ":params" segment.
        if (name == kParamsArgument) {
            args.emplace_back(params);
            continue;
        }
        auto it = pathArgs.find(name);
        if (it == pathArgs.end()) {
            throw MissingArgument(name);
        }
        args.emplace_back(it->second);
    }
    return args;
}

ArgumentList ArgumentResolver::resolve(const HandlerSignature& signature,
                                       const RoutePath& path,
                                       const Request& request) {
    if (signature.acceptsAnything()) {
        return {};
    }
    return resolve(signature, path.extractArgs(request.path), request.params);
}

} // namespace raptor::routing
