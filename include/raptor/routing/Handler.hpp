#pragma once

#include "raptor/core/Errors.hpp"
#include "raptor/core/Request.hpp"

#include <any>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace raptor::routing {

// Declared parameter names of a handler, in call order. A variadic signature
// with no names accepts anything and is invoked without arguments.
struct HandlerSignature {
    std::vector<std::string> parameters;
    bool variadic{false};

    static HandlerSignature rest() { return HandlerSignature{{}, true}; }
    static HandlerSignature named(std::vector<std::string> names) {
        return HandlerSignature{std::move(names), false};
    }

    bool acceptsAnything() const noexcept { return variadic && parameters.empty(); }
};

struct Handler {
    using Invoke = std::function<std::any(const ArgumentList&)>;

    std::string name;
    HandlerSignature signature;
    Invoke invoke;
};

class HandlerTable {
public:
    HandlerTable() = default;
    HandlerTable(std::initializer_list<Handler> handlers);

    void add(Handler handler);

    // Accepts "find_by_id" as well as the qualified "Record.find_by_id".
    const Handler* find(std::string_view name) const;
    const Handler& at(std::string_view name) const;

    bool empty() const noexcept { return handlers_.empty(); }
    std::size_t size() const noexcept { return handlers_.size(); }

    static std::string_view methodName(std::string_view delegateName);

private:
    std::vector<Handler> handlers_;
};

namespace detail {

template <typename T>
T argumentAs(const std::string& handler,
             const std::string& parameter,
             const Argument& argument,
             std::size_t position) {
    static_assert((std::is_integral_v<T> && !std::is_same_v<T, bool>) || std::is_same_v<T, ParamMap>,
                  "handler parameters must be integers or raptor::ParamMap");
    if constexpr (std::is_integral_v<T>) {
        if (const auto* value = std::get_if<std::int64_t>(&argument)) {
            // A path integer the parameter type cannot hold must not wrap into another id.
            if (!std::in_range<T>(*value)) {
                throw InvalidPathArgument(parameter, std::to_string(*value));
            }
            return static_cast<T>(*value);
        }
    } else {
        if (const auto* value = std::get_if<ParamMap>(&argument)) {
            return *value;
        }
    }
    throw InvalidArgumentType(handler, position);
}

template <typename R, typename... Args, std::size_t... I>
std::any invokeWith(const std::string& handler,
                    const std::vector<std::string>& parameters,
                    const std::function<R(Args...)>& fn,
                    const ArgumentList& args,
                    std::index_sequence<I...>) {
    return std::any(fn(argumentAs<std::decay_t<Args>>(handler, parameters[I], args[I], I)...));
}

template <typename R, typename... Args>
Handler bindHandler(std::string name,
                    std::vector<std::string> parameterNames,
                    std::function<R(Args...)> fn) {
    static_assert(!std::is_void_v<R>, "handlers must return a value to present");
    if (parameterNames.size() != sizeof...(Args)) {
        throw MissingResourceConvention("handler '" + name + "' declares " +
                                        std::to_string(parameterNames.size()) +
                                        " parameter names but takes " +
                                        std::to_string(sizeof...(Args)) + " arguments");
    }
    Handler handler;
    handler.name = name;
    handler.signature = HandlerSignature::named(parameterNames);
    handler.invoke = [name = std::move(name), names = std::move(parameterNames), fn = std::move(fn)](
                         const ArgumentList& args) {
        if (args.size() != sizeof...(Args)) {
            throw RoutingError("handler '" + name + "' called with " +
                               std::to_string(args.size()) + " arguments");
        }
        return invokeWith(name, names, fn, args, std::index_sequence_for<Args...>{});
    };
    return handler;
}

} // namespace detail

// Binds a typed callable to its declared parameter names. Integral parameters
// receive path integers, a ParamMap parameter receives the request params.
template <typename F>
Handler makeHandler(std::string name, std::vector<std::string> parameterNames, F&& callable) {
    std::function fn{std::forward<F>(callable)};
    return detail::bindHandler(std::move(name), std::move(parameterNames), std::move(fn));
}

template <typename F>
Handler makeVariadicHandler(std::string name, F&& callable) {
    std::function fn{std::forward<F>(callable)};
    static_assert(std::is_invocable_v<decltype(fn)>, "variadic handlers take no arguments");
    Handler handler;
    handler.name = std::move(name);
    handler.signature = HandlerSignature::rest();
    handler.invoke = [fn = std::move(fn)](const ArgumentList&) { return std::any(fn()); };
    return handler;
}

} // namespace raptor::routing
