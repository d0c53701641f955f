#pragma once

#include "raptor/core/Request.hpp"
#include "raptor/routing/Handler.hpp"
#include "raptor/routing/ResourceDescriptor.hpp"
#include "raptor/routing/RoutePath.hpp"
#include "raptor/view/TemplateEngine.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace raptor::routing {

class Route {
public:
    Route(std::string path,
          std::string handlerName,
          std::string kind,
          std::shared_ptr<const ResourceDescriptor> resource,
          std::shared_ptr<const view::TemplateEngine> engine);

    bool matches(std::string_view path) const { return path_.matches(path); }

    // Resolves arguments, invokes the handler, presents and renders the result.
    // Handler exceptions propagate unchanged.
    std::string call(const Request& request) const;

    bool plural() const noexcept { return kind_ == "index"; }

    const RoutePath& path() const noexcept { return path_; }
    const std::string& handlerName() const noexcept { return handlerName_; }
    const std::string& kind() const noexcept { return kind_; }

private:
    const PresenterFactory& presenterFactory() const;

    RoutePath path_;
    std::string handlerName_;
    std::string kind_;
    std::shared_ptr<const ResourceDescriptor> resource_;
    std::shared_ptr<const view::TemplateEngine> engine_;
    Handler handler_;
};

} // namespace raptor::routing
