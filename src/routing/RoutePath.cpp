#include "raptor/routing/RoutePath.hpp"
#include "raptor/core/Errors.hpp"

#include <charconv>
#include <system_error>
#include <utility>

namespace raptor::routing {
namespace {

std::int64_t parseInteger(const std::string& name, const std::string& segment) {
    std::int64_t value = 0;
    const char* first = segment.data();
    const char* last = segment.data() + segment.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (segment.empty() || ec != std::errc{} || ptr != last) {
        throw InvalidPathArgument(name, segment);
    }
    return value;
}

} // namespace

RoutePath::RoutePath(std::string pattern)
    : pattern_(std::move(pattern)) {
    for (auto& token : splitPath(pattern_)) {
        Segment segment;
        if (!token.empty() && token.front() == ':') {
            segment.text = token.substr(1);
            segment.named = true;
        } else {
            segment.text = std::move(token);
        }
        segments_.push_back(std::move(segment));
    }
}

std::vector<std::string> RoutePath::splitPath(std::string_view path) {
    std::vector<std::string> components;
    std::size_t start = 0;
    while (start <= path.size()) {
        auto end = path.find('/', start);
        if (end == std::string_view::npos) {
            end = path.size();
        }
        components.emplace_back(path.substr(start, end - start));
        start = end + 1;
    }
    while (!components.empty() && components.back().empty()) {
        components.pop_back();
    }
    return components;
}

bool RoutePath::matches(std::string_view path) const {
    auto components = splitPath(path);
    if (components.size() != segments_.size()) {
        return false;
    }
    for (std::size_t i = 0; i < segments_.size(); ++i) {
        const auto& segment = segments_[i];
        if (!segment.named && segment.text != components[i]) {
            return false;
        }
    }
    return true;
}

std::map<std::string, std::int64_t> RoutePath::extractArgs(std::string_view path) const {
    std::map<std::string, std::int64_t> args;
    auto components = splitPath(path);
    for (std::size_t i = 0; i < segments_.size() && i < components.size(); ++i) {
        const auto& segment = segments_[i];
        if (segment.named) {
            args[segment.text] = parseInteger(segment.text, components[i]);
        }
    }
    return args;
}

} // namespace raptor::routing
