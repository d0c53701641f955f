#include "raptor/sample/BlogStore.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace raptor::sample {

Post BlogStore::findPost(std::int64_t id) const {
    std::lock_guard lk(mutex_);
    auto it = std::find_if(posts_.begin(), posts_.end(), [id](const Post& p) { return p.id == id; });
    if (it == posts_.end()) {
        throw RecordNotFound("no post with id " + std::to_string(id));
    }
    return *it;
}

std::vector<Post> BlogStore::allPosts() const {
    std::lock_guard lk(mutex_);
    return posts_;
}

Author BlogStore::findAuthor(std::int64_t id, bool withPosts) const {
    std::lock_guard lk(mutex_);
    auto it = std::find_if(authors_.begin(), authors_.end(), [id](const Author& a) { return a.id == id; });
    if (it == authors_.end()) {
        throw RecordNotFound("no author with id " + std::to_string(id));
    }
    Author author = *it;
    if (withPosts) {
        std::copy_if(posts_.begin(), posts_.end(), std::back_inserter(author.posts),
                     [id](const Post& p) { return p.authorId == id; });
    }
    return author;
}

std::vector<Author> BlogStore::allAuthors() const {
    std::lock_guard lk(mutex_);
    return authors_;
}

Author BlogStore::addAuthor(std::string name) {
    std::lock_guard lk(mutex_);
    Author author;
    author.id = nextAuthorId_++;
    author.name = std::move(name);
    authors_.push_back(author);
    return author;
}

Post BlogStore::addPost(std::int64_t authorId, std::string title, std::string body) {
    std::lock_guard lk(mutex_);
    Post post;
    post.id = nextPostId_++;
    post.authorId = authorId;
    post.title = std::move(title);
    post.body = std::move(body);
    posts_.push_back(post);
    return post;
}

BlogStore& BlogStore::shared() {
    static BlogStore store;
    static std::once_flag seeded;
    std::call_once(seeded, [] {
        auto ada = store.addAuthor("Ada");
        auto linus = store.addAuthor("Linus");
        store.addPost(ada.id, "Hello, raptor", "Routes are inferred from resources.");
        store.addPost(linus.id, "Second post", "Handlers get their arguments by name.");
    });
    return store;
}

} // namespace raptor::sample
