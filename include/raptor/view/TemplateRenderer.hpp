#pragma once

#include <boost/json.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace raptor::view {

// Logic-less mustache subset: {{name}}, {{{name}}}, {{&name}}, {{!comment}},
// {{#section}}...{{/section}}, {{^inverted}}...{{/inverted}} and {{.}}.
class TemplateRenderer {
public:
    explicit TemplateRenderer(std::string_view source);

    std::string render(const boost::json::object& context) const;

    static std::string escapeHtml(std::string_view text);

private:
    enum class NodeKind {
        text,
        variable,
        rawVariable,
        section,
        invertedSection
    };

    struct Node {
        NodeKind kind{NodeKind::text};
        std::string value;
        std::vector<Node> children;
    };

    using ContextStack = std::vector<const boost::json::value*>;

    static void renderNodes(const std::vector<Node>& nodes, ContextStack& stack, std::string& out);
    static const boost::json::value* lookup(const ContextStack& stack, std::string_view name);
    static bool isTruthy(const boost::json::value* value);
    static std::string toText(const boost::json::value& value);

    std::vector<Node> nodes_;
};

} // namespace raptor::view
