#include "raptor/view/TemplateRenderer.hpp"
#include "raptor/core/Errors.hpp"

#include <utility>

namespace raptor::view {
namespace {

std::string_view trim(std::string_view input) {
    const auto begin = input.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(" \t\r\n");
    return input.substr(begin, end - begin + 1);
}

boost::json::string_view jsonKey(std::string_view key) {
    return boost::json::string_view(key.data(), key.size());
}

} // namespace

TemplateRenderer::TemplateRenderer(std::string_view source) {
    struct Frame {
        std::vector<Node>* nodes;
        std::string name;
    };
    std::vector<Frame> frames{{&nodes_, {}}};

    auto appendText = [&frames](std::string_view text) {
        auto& nodes = *frames.back().nodes;
        if (!nodes.empty() && nodes.back().kind == NodeKind::text) {
            nodes.back().value.append(text);
            return;
        }
        Node node;
        node.value = std::string(text);
        nodes.push_back(std::move(node));
    };
    auto appendTag = [&frames](NodeKind kind, std::string_view name) {
        Node node;
        node.kind = kind;
        node.value = std::string(name);
        frames.back().nodes->push_back(std::move(node));
    };

    std::size_t pos = 0;
    while (pos < source.size()) {
        const auto open = source.find("{{", pos);
        if (open == std::string_view::npos) {
            appendText(source.substr(pos));
            break;
        }
        if (open > pos) {
            appendText(source.substr(pos, open - pos));
        }

        const bool triple = source.compare(open, 3, "{{{") == 0;
        const std::string_view closer = triple ? "}}}" : "}}";
        const auto contentStart = open + (triple ? 3 : 2);
        const auto close = source.find(closer, contentStart);
        if (close == std::string_view::npos) {
            throw TemplateSyntaxError("unterminated tag at offset " + std::to_string(open));
        }
        auto tag = trim(source.substr(contentStart, close - contentStart));
        pos = close + closer.size();

        if (tag.empty()) {
            throw TemplateSyntaxError("empty tag at offset " + std::to_string(open));
        }
        if (triple) {
            appendTag(NodeKind::rawVariable, tag);
            continue;
        }

        switch (tag.front()) {
        case '!':
            break;
        case '&':
            appendTag(NodeKind::rawVariable, trim(tag.substr(1)));
            break;
        case '#':
        case '^': {
            appendTag(tag.front() == '#' ? NodeKind::section : NodeKind::invertedSection,
                      trim(tag.substr(1)));
            auto& inserted = frames.back().nodes->back();
            frames.push_back({&inserted.children, inserted.value});
            break;
        }
        case '/': {
            auto name = trim(tag.substr(1));
            if (frames.size() == 1 || frames.back().name != name) {
                throw TemplateSyntaxError("unexpected closing tag '" + std::string(name) + "'");
            }
            frames.pop_back();
            break;
        }
        default:
            appendTag(NodeKind::variable, tag);
            break;
        }
    }

    if (frames.size() > 1) {
        throw TemplateSyntaxError("unclosed section '" + frames.back().name + "'");
    }
}

std::string TemplateRenderer::render(const boost::json::object& context) const {
    boost::json::value root(context);
    ContextStack stack{&root};
    std::string out;
    renderNodes(nodes_, stack, out);
    return out;
}

void TemplateRenderer::renderNodes(const std::vector<Node>& nodes, ContextStack& stack, std::string& out) {
    for (const auto& node : nodes) {
        switch (node.kind) {
        case NodeKind::text:
            out += node.value;
            break;
        case NodeKind::variable:
            if (const auto* value = lookup(stack, node.value)) {
                out += escapeHtml(toText(*value));
            }
            break;
        case NodeKind::rawVariable:
            if (const auto* value = lookup(stack, node.value)) {
                out += toText(*value);
            }
            break;
        case NodeKind::section: {
            const auto* value = lookup(stack, node.value);
            if (!isTruthy(value)) {
                break;
            }
            if (value->is_array()) {
                for (const auto& item : value->as_array()) {
                    stack.push_back(&item);
                    renderNodes(node.children, stack, out);
                    stack.pop_back();
                }
            } else {
                stack.push_back(value);
                renderNodes(node.children, stack, out);
                stack.pop_back();
            }
            break;
        }
        case NodeKind::invertedSection:
            if (!isTruthy(lookup(stack, node.value))) {
                renderNodes(node.children, stack, out);
            }
            break;
        }
    }
}

const boost::json::value* TemplateRenderer::lookup(const ContextStack& stack, std::string_view name) {
    if (name == ".") {
        return stack.back();
    }

    auto dot = name.find('.');
    auto head = name.substr(0, dot);
    const boost::json::value* current = nullptr;
    for (auto it = stack.rbegin(); it != stack.rend(); ++it) {
        if (!(*it)->is_object()) {
            continue;
        }
        if (const auto* found = (*it)->as_object().if_contains(jsonKey(head))) {
            current = found;
            break;
        }
    }

    while (current && dot != std::string_view::npos) {
        auto next = name.find('.', dot + 1);
        auto part = name.substr(dot + 1, next == std::string_view::npos ? std::string_view::npos : next - dot - 1);
        current = current->is_object() ? current->as_object().if_contains(jsonKey(part)) : nullptr;
        dot = next;
    }
    return current;
}

bool TemplateRenderer::isTruthy(const boost::json::value* value) {
    if (!value || value->is_null()) {
        return false;
    }
    if (value->is_bool()) {
        return value->as_bool();
    }
    if (value->is_string()) {
        return !value->as_string().empty();
    }
    if (value->is_array()) {
        return !value->as_array().empty();
    }
    return true;
}

std::string TemplateRenderer::toText(const boost::json::value& value) {
    if (value.is_string()) {
        const auto& str = value.as_string();
        return std::string(str.data(), str.size());
    }
    if (value.is_null()) {
        return {};
    }
    if (value.is_bool()) {
        return value.as_bool() ? "true" : "false";
    }
    return boost::json::serialize(value);
}

std::string TemplateRenderer::escapeHtml(std::string_view text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char ch : text) {
        switch (ch) {
        case '&': escaped += "&amp;"; break;
        case '<': escaped += "&lt;"; break;
        case '>': escaped += "&gt;"; break;
        case '"': escaped += "&quot;"; break;
        case '\'': escaped += "&#39;"; break;
        default: escaped.push_back(ch); break;
        }
    }
    return escaped;
}

} // namespace raptor::view
