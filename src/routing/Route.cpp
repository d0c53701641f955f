#include "raptor/routing/Route.hpp"
#include "raptor/routing/ArgumentResolver.hpp"

#include <utility>

namespace raptor::routing {

Route::Route(std::string path,
             std::string handlerName,
             std::string kind,
             std::shared_ptr<const ResourceDescriptor> resource,
             std::shared_ptr<const view::TemplateEngine> engine)
    : path_(std::move(path))
    , handlerName_(std::move(handlerName))
    , kind_(std::move(kind))
    , resource_(std::move(resource))
    , engine_(std::move(engine)) {
    if (!resource_ || !engine_) {
        throw MissingResourceConvention("route " + path_.pattern() + " needs a resource and a template engine");
    }
    handler_ = resource_->recordType().at(handlerName_);
}

const PresenterFactory& Route::presenterFactory() const {
    return plural() ? resource_->manyPresenter() : resource_->onePresenter();
}

std::string Route::call(const Request& request) const {
    auto args = ArgumentResolver::resolve(handler_.signature, path_, request);
    auto record = handler_.invoke(args);
    auto presenter = presenterFactory()(std::move(record));
    return engine_->render(*presenter, resource_->resourceName(), kind_);
}

} // namespace raptor::routing
