#pragma once

#include "raptor/routing/Handler.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace raptor::sample {

struct Post {
    std::int64_t id{};
    std::int64_t authorId{};
    std::string title;
    std::string body;

    static routing::HandlerTable handlers();
};

struct Author {
    std::int64_t id{};
    std::string name;
    std::vector<Post> posts;

    static routing::HandlerTable handlers();
};

} // namespace raptor::sample
