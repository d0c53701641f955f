#pragma once

#include "raptor/core/Errors.hpp"
#include "raptor/routing/Handler.hpp"
#include "raptor/view/Presenter.hpp"

#include <any>
#include <concepts>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace raptor::routing {

using PresenterFactory = std::function<std::unique_ptr<view::Presenter>(std::any)>;

// What a resource definition has to provide: a name, a Record type carrying
// the handler table, and presenters for one record and for a collection.
template <typename R>
concept Resource = requires {
    { R::name } -> std::convertible_to<std::string_view>;
    typename R::Record;
    typename R::PresentsOne;
    typename R::PresentsMany;
    { R::Record::handlers() } -> std::convertible_to<HandlerTable>;
} && std::derived_from<typename R::PresentsOne, view::Presenter>
  && std::derived_from<typename R::PresentsMany, view::Presenter>
  && std::constructible_from<typename R::PresentsOne, typename R::Record>
  && std::constructible_from<typename R::PresentsMany, std::vector<typename R::Record>>;

template <typename P, typename V>
PresenterFactory presenterFor() {
    return [](std::any value) -> std::unique_ptr<view::Presenter> {
        auto* typed = std::any_cast<V>(&value);
        if (!typed) {
            throw PresenterMismatch("handler result does not fit the presenter");
        }
        return std::make_unique<P>(std::move(*typed));
    };
}

class ResourceDescriptor {
public:
    ResourceDescriptor(std::string typeName,
                       HandlerTable handlers,
                       PresenterFactory onePresenter,
                       PresenterFactory manyPresenter);

    template <Resource R>
    static std::shared_ptr<const ResourceDescriptor> wrap() {
        using Record = typename R::Record;
        return std::make_shared<ResourceDescriptor>(
            std::string(R::name),
            Record::handlers(),
            presenterFor<typename R::PresentsOne, Record>(),
            presenterFor<typename R::PresentsMany, std::vector<Record>>());
    }

    const std::string& typeName() const noexcept { return typeName_; }
    const std::string& resourceName() const noexcept { return resourceName_; }
    const HandlerTable& recordType() const noexcept { return handlers_; }
    const PresenterFactory& onePresenter() const noexcept { return onePresenter_; }
    const PresenterFactory& manyPresenter() const noexcept { return manyPresenter_; }

    // "Blog::BlogPost" -> "blog_post"
    static std::string deriveName(std::string_view typeName);

private:
    std::string typeName_;
    std::string resourceName_;
    HandlerTable handlers_;
    PresenterFactory onePresenter_;
    PresenterFactory manyPresenter_;
};

} // namespace raptor::routing
