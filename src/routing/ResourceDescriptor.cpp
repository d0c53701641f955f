#include "raptor/routing/ResourceDescriptor.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace raptor::routing {

ResourceDescriptor::ResourceDescriptor(std::string typeName,
                                       HandlerTable handlers,
                                       PresenterFactory onePresenter,
                                       PresenterFactory manyPresenter)
    : typeName_(std::move(typeName))
    , resourceName_(deriveName(typeName_))
    , handlers_(std::move(handlers))
    , onePresenter_(std::move(onePresenter))
    , manyPresenter_(std::move(manyPresenter)) {
    if (resourceName_.empty()) {
        throw MissingResourceConvention("resource '" + typeName_ + "' has no usable name");
    }
    if (handlers_.empty()) {
        throw MissingResourceConvention("resource '" + typeName_ + "' declares no Record handlers");
    }
    if (!onePresenter_ || !manyPresenter_) {
        throw MissingResourceConvention("resource '" + typeName_ + "' is missing a presenter");
    }
}

std::string ResourceDescriptor::deriveName(std::string_view typeName) {
    std::string simple(typeName);
    if (auto pos = simple.rfind("::"); pos != std::string::npos) {
        simple = simple.substr(pos + 2);
    }

    static const std::regex boundary("(.)([A-Z])");
    auto result = std::regex_replace(simple, boundary, "$1_$2");
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}

} // namespace raptor::routing
