#pragma once

#include "raptor/sample/Models.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace raptor::sample {

class RecordNotFound : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// In-memory store behind the sample resources. Lookups return copies.
class BlogStore {
public:
    BlogStore() = default;

    Post findPost(std::int64_t id) const;
    std::vector<Post> allPosts() const;
    Author findAuthor(std::int64_t id, bool withPosts) const;
    std::vector<Author> allAuthors() const;

    Author addAuthor(std::string name);
    Post addPost(std::int64_t authorId, std::string title, std::string body);

    static BlogStore& shared();

private:
    mutable std::mutex mutex_;
    std::vector<Post> posts_;
    std::vector<Author> authors_;
    std::int64_t nextPostId_{1};
    std::int64_t nextAuthorId_{1};
};

} // namespace raptor::sample
