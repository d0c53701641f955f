#include "raptor/util/JsonUtil.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>

namespace raptor::util {

boost::json::value parseJson(const std::string& payload) {
    return boost::json::parse(payload);
}

std::string stringifyJson(const boost::json::value& value) {
    return boost::json::serialize(value);
}

std::optional<boost::json::value> loadJsonFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("cannot open " + path.string());
    }
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    return parseJson(content);
}

std::optional<std::string> stringField(const boost::json::object& object, std::string_view key) {
    if (auto it = object.if_contains(boost::json::string_view(key.data(), key.size())); it && it->is_string()) {
        return std::string(it->as_string().c_str());
    }
    return std::nullopt;
}

std::optional<std::int64_t> intField(const boost::json::object& object, std::string_view key) {
    if (auto it = object.if_contains(boost::json::string_view(key.data(), key.size())); it && it->is_int64()) {
        return it->as_int64();
    }
    return std::nullopt;
}

} // namespace raptor::util
