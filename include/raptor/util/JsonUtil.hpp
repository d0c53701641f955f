#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace raptor::util {

boost::json::value parseJson(const std::string& payload);
std::string stringifyJson(const boost::json::value& value);

// std::nullopt when the file does not exist; parse errors throw.
std::optional<boost::json::value> loadJsonFile(const std::filesystem::path& path);

std::optional<std::string> stringField(const boost::json::object& object, std::string_view key);
std::optional<std::int64_t> intField(const boost::json::object& object, std::string_view key);

} // namespace raptor::util
