#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace raptor {

// Query string merged with the form body, one value per key.
using ParamMap = std::unordered_map<std::string, std::string>;

// A handler argument is either an integer taken from the path or the whole
// parameter map.
using Argument = std::variant<std::int64_t, ParamMap>;
using ArgumentList = std::vector<Argument>;

struct Request {
    std::string path;
    ParamMap params;
};

} // namespace raptor
