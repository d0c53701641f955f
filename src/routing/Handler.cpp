#include "raptor/routing/Handler.hpp"

#include <algorithm>

namespace raptor::routing {

HandlerTable::HandlerTable(std::initializer_list<Handler> handlers) {
    for (const auto& handler : handlers) {
        add(handler);
    }
}

void HandlerTable::add(Handler handler) {
    if (handler.name.empty() || !handler.invoke) {
        throw MissingResourceConvention("handlers need a name and a callable");
    }
    auto existing = std::find_if(handlers_.begin(), handlers_.end(), [&](const Handler& h) {
        return h.name == handler.name;
    });
    if (existing != handlers_.end()) {
        *existing = std::move(handler);
        return;
    }
    handlers_.push_back(std::move(handler));
}

std::string_view HandlerTable::methodName(std::string_view delegateName) {
    auto dot = delegateName.rfind('.');
    if (dot == std::string_view::npos) {
        return delegateName;
    }
    return delegateName.substr(dot + 1);
}

const Handler* HandlerTable::find(std::string_view name) const {
    auto method = methodName(name);
    for (const auto& handler : handlers_) {
        if (handler.name == method) {
            return &handler;
        }
    }
    return nullptr;
}

const Handler& HandlerTable::at(std::string_view name) const {
    if (const auto* handler = find(name)) {
        return *handler;
    }
    throw MissingResourceConvention("record has no handler named '" + std::string(methodName(name)) + "'");
}

} // namespace raptor::routing
