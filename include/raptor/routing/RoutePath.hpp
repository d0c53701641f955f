#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace raptor::routing {

// Compiled path template such as "/posts/:id". Segments starting with ':'
// bind a named integer argument; all others must match literally.
class RoutePath {
public:
    struct Segment {
        std::string text;
        bool named{false};
    };

    explicit RoutePath(std::string pattern);

    const std::string& pattern() const noexcept { return pattern_; }
    const std::vector<Segment>& segments() const noexcept { return segments_; }

    bool matches(std::string_view path) const;

    // Throws InvalidPathArgument when a named position does not hold an integer.
    std::map<std::string, std::int64_t> extractArgs(std::string_view path) const;

    // Splits on '/', keeping the leading empty component and dropping trailing
    // empty ones, so "/posts/" and "/posts" have the same shape.
    static std::vector<std::string> splitPath(std::string_view path);

private:
    std::string pattern_;
    std::vector<Segment> segments_;
};

} // namespace raptor::routing
