#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace raptor {

class RoutingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Raised by a Router when none of its routes accepts the path. Application
// recovers from it and tries the next resource.
class NoRouteMatches : public RoutingError {
public:
    explicit NoRouteMatches(const std::string& path);

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

class MissingArgument : public RoutingError {
public:
    explicit MissingArgument(const std::string& name);

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

class InvalidPathArgument : public RoutingError {
public:
    InvalidPathArgument(const std::string& name, const std::string& segment);

    const std::string& name() const noexcept { return name_; }
    const std::string& segment() const noexcept { return segment_; }

private:
    std::string name_;
    std::string segment_;
};

class InvalidArgumentType : public RoutingError {
public:
    InvalidArgumentType(const std::string& handler, std::size_t position);
};

class MissingResourceConvention : public RoutingError {
public:
    using RoutingError::RoutingError;
};

class UnknownRouteKind : public RoutingError {
public:
    explicit UnknownRouteKind(const std::string& kind);
};

class PresenterMismatch : public RoutingError {
public:
    using RoutingError::RoutingError;
};

class TemplateNotFound : public RoutingError {
public:
    explicit TemplateNotFound(const std::string& path);
};

class TemplateSyntaxError : public RoutingError {
public:
    using RoutingError::RoutingError;
};

} // namespace raptor
