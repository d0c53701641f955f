#include "raptor/server/RequestParser.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace raptor::server {
namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool isFormContentType(std::string_view contentType) {
    std::string lowered(contentType);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered.find("application/x-www-form-urlencoded") != std::string::npos;
}

} // namespace

std::string urlDecode(std::string_view value) {
    std::string result;
    result.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            result.push_back(' ');
        } else if (c == '%' && i + 2 < value.size()) {
            int high = hexValue(value[i + 1]);
            int low = hexValue(value[i + 2]);
            if (high < 0 || low < 0) {
                result.push_back(c);
                continue;
            }
            result.push_back(static_cast<char>(high * 16 + low));
            i += 2;
        } else {
            result.push_back(c);
        }
    }
    return result;
}

void parseUrlEncoded(std::string_view encoded, ParamMap& params) {
    std::size_t start = 0;
    while (start < encoded.size()) {
        auto end = encoded.find('&', start);
        if (end == std::string_view::npos) {
            end = encoded.size();
        }
        auto token = encoded.substr(start, end - start);
        start = end + 1;
        if (token.empty()) {
            continue;
        }
        auto eq = token.find('=');
        if (eq != std::string_view::npos) {
            params.emplace(urlDecode(token.substr(0, eq)), urlDecode(token.substr(eq + 1)));
        } else {
            params.emplace(urlDecode(token), "");
        }
    }
}

Request buildRequest(std::string_view target, std::string_view body, std::string_view contentType) {
    Request request;
    if (auto hash = target.find('#'); hash != std::string_view::npos) {
        target = target.substr(0, hash);
    }
    auto queryPos = target.find('?');
    request.path = std::string(target.substr(0, queryPos));
    if (request.path.empty()) {
        request.path = "/";
    }
    if (queryPos != std::string_view::npos) {
        parseUrlEncoded(target.substr(queryPos + 1), request.params);
    }
    if (!body.empty() && isFormContentType(contentType)) {
        parseUrlEncoded(body, request.params);
    }
    return request;
}

} // namespace raptor::server
