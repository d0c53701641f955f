#pragma once

#include "raptor/routing/Handler.hpp"
#include "raptor/view/Presenter.hpp"
#include "raptor/view/TemplateEngine.hpp"

#include <boost/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace raptor::test {

struct Widget {
    std::int64_t id{};
    std::string label;

    static routing::HandlerTable handlers();
};

struct Widgets {
    static constexpr std::string_view name = "Widgets";
    using Record = Widget;

    class PresentsOne : public view::Presenter {
    public:
        explicit PresentsOne(Widget widget) : widget_(std::move(widget)) {}
        boost::json::object fields() const override {
            return {{"presenter", "one"}, {"id", widget_.id}, {"label", widget_.label}};
        }

    private:
        Widget widget_;
    };

    class PresentsMany : public view::Presenter {
    public:
        explicit PresentsMany(std::vector<Widget> widgets) : widgets_(std::move(widgets)) {}
        boost::json::object fields() const override {
            boost::json::array ids;
            for (const auto& widget : widgets_) {
                ids.push_back(widget.id);
            }
            return {{"presenter", "many"}, {"ids", std::move(ids)}};
        }

    private:
        std::vector<Widget> widgets_;
    };
};

inline routing::HandlerTable Widget::handlers() {
    return {
        routing::makeHandler("find_by_id", {"id"}, [](std::int64_t id) {
            return Widget{id, "widget " + std::to_string(id)};
        }),
        routing::makeVariadicHandler("all", [] {
            return std::vector<Widget>{{1, "one"}, {2, "two"}};
        }),
        routing::makeHandler("initialize", {"params"}, [](const ParamMap& params) {
            Widget widget;
            if (auto it = params.find("label"); it != params.end()) {
                widget.label = it->second;
            }
            return widget;
        }),
        routing::makeHandler("find_in", {"bin", "id"}, [](std::int64_t bin, std::int64_t id) {
            return Widget{bin * 100 + id, "binned"};
        }),
        routing::makeHandler("explode", {"id"}, [](std::int64_t id) -> Widget {
            throw std::logic_error("widget " + std::to_string(id) + " exploded");
        }),
        routing::makeHandler("count", {}, [] { return 3; }),
        routing::makeHandler("find_slot", {"id"}, [](std::int32_t id) { return Widget{id, "slot"}; }),
    };
}

struct Gadget {
    std::int64_t id{};

    static routing::HandlerTable handlers() {
        return {
            routing::makeVariadicHandler("all", [] { return std::vector<Gadget>{Gadget{5}}; }),
            routing::makeHandler("find_by_id", {"id"}, [](std::int64_t id) { return Gadget{id}; }),
        };
    }
};

struct GadgetParts {
    static constexpr std::string_view name = "Shop::GadgetPart";
    using Record = Gadget;

    class PresentsOne : public view::Presenter {
    public:
        explicit PresentsOne(Gadget gadget) : gadget_(gadget) {}
        boost::json::object fields() const override { return {{"gadget", gadget_.id}}; }

    private:
        Gadget gadget_;
    };

    class PresentsMany : public view::Presenter {
    public:
        explicit PresentsMany(std::vector<Gadget> gadgets) : count_(gadgets.size()) {}
        boost::json::object fields() const override { return {{"gadgets", count_}}; }

    private:
        std::size_t count_;
    };
};

// Renders "<resource>/<template>:<fields as JSON>" so tests can see which
// presenter and template a route picked.
class RecordingTemplateEngine : public view::TemplateEngine {
public:
    std::string render(const view::Presenter& presenter,
                       std::string_view resourceName,
                       std::string_view templateName) const override {
        return std::string(resourceName) + "/" + std::string(templateName) + ":" +
               boost::json::serialize(presenter.fields());
    }
};

} // namespace raptor::test
