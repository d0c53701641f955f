#include "raptor/sample/Resources.hpp"
#include "raptor/routing/RouteTable.hpp"
#include "raptor/sample/BlogStore.hpp"

#include <utility>

namespace raptor::sample {
namespace {

std::string paramOrEmpty(const ParamMap& params, const std::string& key) {
    auto it = params.find(key);
    return it == params.end() ? std::string{} : it->second;
}

} // namespace

routing::HandlerTable Post::handlers() {
    return {
        routing::makeHandler("find_by_id", {"id"}, [](std::int64_t id) {
            return BlogStore::shared().findPost(id);
        }),
        routing::makeVariadicHandler("all", [] { return BlogStore::shared().allPosts(); }),
        // Blank post for the "new" form, prefilled from the request.
        routing::makeHandler("initialize", {"params"}, [](const ParamMap& params) {
            Post post;
            post.title = paramOrEmpty(params, "title");
            post.body = paramOrEmpty(params, "body");
            return post;
        }),
    };
}

routing::HandlerTable Author::handlers() {
    return {
        routing::makeVariadicHandler("all", [] { return BlogStore::shared().allAuthors(); }),
        routing::makeHandler("find_with_posts", {"id"}, [](std::int64_t id) {
            return BlogStore::shared().findAuthor(id, true);
        }),
    };
}

boost::json::object toJson(const Post& post) {
    return {{"id", post.id},
            {"authorId", post.authorId},
            {"title", post.title},
            {"body", post.body}};
}

boost::json::object toJson(const Author& author) {
    boost::json::array posts;
    for (const auto& post : author.posts) {
        posts.push_back(toJson(post));
    }
    return {{"id", author.id},
            {"name", author.name},
            {"posts", std::move(posts)}};
}

Posts::PresentsOne::PresentsOne(Post post)
    : post_(std::move(post)) {}

boost::json::object Posts::PresentsOne::fields() const {
    auto fields = toJson(post_);
    fields["persisted"] = post_.id != 0;
    return fields;
}

Posts::PresentsMany::PresentsMany(std::vector<Post> posts)
    : posts_(std::move(posts)) {}

boost::json::object Posts::PresentsMany::fields() const {
    boost::json::array posts;
    for (const auto& post : posts_) {
        posts.push_back(toJson(post));
    }
    return {{"posts", std::move(posts)}, {"count", posts_.size()}};
}

Authors::PresentsOne::PresentsOne(Author author)
    : author_(std::move(author)) {}

boost::json::object Authors::PresentsOne::fields() const {
    return toJson(author_);
}

Authors::PresentsMany::PresentsMany(std::vector<Author> authors)
    : authors_(std::move(authors)) {}

boost::json::object Authors::PresentsMany::fields() const {
    boost::json::array authors;
    for (const auto& author : authors_) {
        authors.push_back(toJson(author));
    }
    return {{"authors", std::move(authors)}};
}

std::vector<std::shared_ptr<const routing::Router>> blogRoutes(std::shared_ptr<const view::TemplateEngine> engine) {
    return {
        routing::routes<Posts>(engine, [](routing::RouteTableBuilder& r) {
            r.newRecord();
            r.show();
            r.index();
        }),
        routing::routes<Authors>(engine, [](routing::RouteTableBuilder& r) {
            r.index();
            r.route("/authors/:id/posts", "find_with_posts", "posts");
        }),
    };
}

} // namespace raptor::sample
