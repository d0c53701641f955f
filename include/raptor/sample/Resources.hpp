#pragma once

#include "raptor/routing/Router.hpp"
#include "raptor/sample/Models.hpp"
#include "raptor/view/Presenter.hpp"
#include "raptor/view/TemplateEngine.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace raptor::sample {

boost::json::object toJson(const Post& post);
boost::json::object toJson(const Author& author);

struct Posts {
    static constexpr std::string_view name = "Posts";
    using Record = Post;

    class PresentsOne : public view::Presenter {
    public:
        explicit PresentsOne(Post post);
        boost::json::object fields() const override;

    private:
        Post post_;
    };

    class PresentsMany : public view::Presenter {
    public:
        explicit PresentsMany(std::vector<Post> posts);
        boost::json::object fields() const override;

    private:
        std::vector<Post> posts_;
    };
};

struct Authors {
    static constexpr std::string_view name = "Authors";
    using Record = Author;

    class PresentsOne : public view::Presenter {
    public:
        explicit PresentsOne(Author author);
        boost::json::object fields() const override;

    private:
        Author author_;
    };

    class PresentsMany : public view::Presenter {
    public:
        explicit PresentsMany(std::vector<Author> authors);
        boost::json::object fields() const override;

    private:
        std::vector<Author> authors_;
    };
};

// Routers for the sample blog, in dispatch order: posts, then authors.
std::vector<std::shared_ptr<const routing::Router>> blogRoutes(std::shared_ptr<const view::TemplateEngine> engine);

} // namespace raptor::sample
