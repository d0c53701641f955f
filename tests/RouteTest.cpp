#include "TestResources.hpp"

#include "raptor/core/Errors.hpp"
#include "raptor/routing/Route.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

using namespace raptor;
using raptor::routing::Route;

class RouteTest : public ::testing::Test {
protected:
    Route makeRoute(std::string path, std::string handler, std::string kind) {
        return Route(std::move(path), std::move(handler), std::move(kind), resource, engine);
    }

    std::shared_ptr<const routing::ResourceDescriptor> resource = routing::ResourceDescriptor::wrap<test::Widgets>();
    std::shared_ptr<const view::TemplateEngine> engine = std::make_shared<test::RecordingTemplateEngine>();
};

TEST_F(RouteTest, ShowRendersOneRecordWithShowTemplate) {
    auto route = makeRoute("/widgets/:id", "Record.find_by_id", "show");
    EXPECT_FALSE(route.plural());
    EXPECT_EQ(route.call({"/widgets/7", {}}),
              R"(widgets/show:{"presenter":"one","id":7,"label":"widget 7"})");
}

TEST_F(RouteTest, IndexUsesThePluralPresenter) {
    auto route = makeRoute("/widgets", "all", "index");
    EXPECT_TRUE(route.plural());
    EXPECT_EQ(route.call({"/widgets", {{"ignored", "x"}}}),
              R"(widgets/index:{"presenter":"many","ids":[1,2]})");
}

TEST_F(RouteTest, NewBuildsRecordFromRequestParams) {
    auto route = makeRoute("/widgets/new", "initialize", "new");
    EXPECT_EQ(route.call({"/widgets/new", {{"label", "draft"}}}),
              R"(widgets/new:{"presenter":"one","id":0,"label":"draft"})");
}

TEST_F(RouteTest, CustomKindNamesTheTemplate) {
    auto route = makeRoute("/bins/:bin/widgets/:id", "find_in", "binned");
    EXPECT_EQ(route.call({"/bins/2/widgets/5", {}}),
              R"(widgets/binned:{"presenter":"one","id":205,"label":"binned"})");
}

TEST_F(RouteTest, MatchesDelegatesToThePathTemplate) {
    auto route = makeRoute("/widgets/:id", "find_by_id", "show");
    EXPECT_TRUE(route.matches("/widgets/1"));
    EXPECT_FALSE(route.matches("/widgets"));
    EXPECT_EQ(route.path().pattern(), "/widgets/:id");
    EXPECT_EQ(route.handlerName(), "find_by_id");
    EXPECT_EQ(route.kind(), "show");
}

TEST_F(RouteTest, HandlerErrorsPropagateUnchanged) {
    auto route = makeRoute("/widgets/:id/explode", "explode", "show");
    EXPECT_THROW(route.call({"/widgets/1/explode", {}}), std::logic_error);
}

TEST_F(RouteTest, MissingPathArgumentFailsTheCall) {
    auto route = makeRoute("/bins/:bin", "find_in", "show");
    try {
        route.call({"/bins/3", {{"id", "4"}}});
        FAIL() << "expected MissingArgument";
    } catch (const MissingArgument& ex) {
        EXPECT_EQ(ex.name(), "id");
    }
}

TEST_F(RouteTest, NonNumericIdFailsTheCall) {
    auto route = makeRoute("/widgets/:id", "find_by_id", "show");
    EXPECT_THROW(route.call({"/widgets/abc", {}}), InvalidPathArgument);
}

TEST_F(RouteTest, ResultThePresenterCannotTakeIsReported) {
    auto route = makeRoute("/widgets/count", "count", "show");
    EXPECT_THROW(route.call({"/widgets/count", {}}), PresenterMismatch);
}

TEST_F(RouteTest, UnknownHandlerIsRejectedAtConstruction) {
    EXPECT_THROW(makeRoute("/widgets/:id", "destroy", "show"), MissingResourceConvention);
    EXPECT_THROW(Route("/widgets", "all", "index", resource, nullptr), MissingResourceConvention);
}
