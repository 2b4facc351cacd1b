/**
 * Unit tests for router.hpp
 */

#include <argroute/router.hpp>
#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace argroute;

namespace {

// app
//   build
//   test
//     unit  (alias: u)
//     integration
CommandGroup makeTree() {
    CommandGroup test("test", "Runs tests");
    test.withSharedFlag({"--coverage"}, "Collect coverage");
    test.addCommand(Command("unit", "Unit tests").addAlias("u"));
    test.addCommand(Command("integration", "Integration tests"));

    CommandGroup root("app");
    root.withSharedFlag({"--quiet"}, "Less output");
    root.addCommand(Command("build", "Builds").withFlag({"-r", "--release"}, "Release mode"));
    root.addGroup(std::move(test));
    return root;
}

TokenStream streamOf(std::vector<std::string> tokens) { return TokenStream(std::move(tokens)); }

} // namespace

TEST(RouterTest, RoutesTopLevelCommand) {
    const auto root = makeTree();
    const AliasTable aliases;

    auto result = Router(root, aliases).route(streamOf({"build", "--release", "x"}));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().command().name(), "build");
    EXPECT_TRUE(result.value().groups().groups().empty());
    EXPECT_EQ(result.value().joinedNames(), "app build");
    EXPECT_EQ(result.stream.tokens(), (std::vector<std::string>{"--release", "x"}));
}

TEST(RouterTest, RoutesThroughGroups) {
    const auto root = makeTree();
    const AliasTable aliases;

    auto result = Router(root, aliases).route(streamOf({"test", "unit"}));
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.value().groups().groups().size(), 1u);
    EXPECT_EQ(result.value().groups().groups()[0]->name(), "test");
    EXPECT_EQ(result.value().joinedNames(), "app test unit");
    EXPECT_TRUE(result.stream.exhausted());
}

TEST(RouterTest, ChildAlternateNameMatches) {
    const auto root = makeTree();
    const AliasTable aliases;

    auto result = Router(root, aliases).route(streamOf({"test", "u"}));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().command().name(), "unit");
}

TEST(RouterTest, FailureKeepsPartialPathAndToken) {
    const auto root = makeTree();
    const AliasTable aliases;

    auto result = Router(root, aliases).route(streamOf({"test", "bogus", "x"}));
    ASSERT_FALSE(result.ok());

    const auto& failure = result.error();
    ASSERT_EQ(failure.partialPath.groups().size(), 1u);
    EXPECT_EQ(failure.partialPath.deepest().name(), "test");
    ASSERT_TRUE(failure.unmatchedToken.has_value());
    EXPECT_EQ(*failure.unmatchedToken, "bogus");
    EXPECT_EQ(result.stream.tokens(), (std::vector<std::string>{"bogus", "x"}));
}

TEST(RouterTest, RunningOutOfTokensAtGroupIsFailureWithoutToken) {
    const auto root = makeTree();
    const AliasTable aliases;

    auto atRoot = Router(root, aliases).route(streamOf({}));
    ASSERT_FALSE(atRoot.ok());
    EXPECT_TRUE(atRoot.error().partialPath.groups().empty());
    EXPECT_FALSE(atRoot.error().unmatchedToken.has_value());

    auto atGroup = Router(root, aliases).route(streamOf({"test"}));
    ASSERT_FALSE(atGroup.ok());
    EXPECT_EQ(atGroup.error().partialPath.joinedNames(), "app test");
    EXPECT_FALSE(atGroup.error().unmatchedToken.has_value());
}

TEST(RouterTest, MatchingIsExact) {
    const auto root = makeTree();
    const AliasTable aliases;

    EXPECT_FALSE(Router(root, aliases).route(streamOf({"bui"})).ok());
    EXPECT_FALSE(Router(root, aliases).route(streamOf({"Build"})).ok());
}

TEST(RouterTest, AliasIsSubstitutedOnce) {
    const auto root = makeTree();
    AliasTable aliases;
    aliases.set("b", "build").set("bb", "b");

    auto direct = Router(root, aliases).route(streamOf({"b"}));
    ASSERT_TRUE(direct.ok());
    EXPECT_EQ(direct.value().command().name(), "build");

    // "bb" -> "b" is not followed to "build".
    auto chained = Router(root, aliases).route(streamOf({"bb"}));
    ASSERT_FALSE(chained.ok());
    EXPECT_EQ(chained.error().unmatchedToken.value(), "bb");
}

TEST(RouterTest, AliasToMissingTargetReportsTokenAsTyped) {
    const auto root = makeTree();
    const auto aliases = AliasTable::withDefaults();

    auto result = Router(root, aliases).route(streamOf({"-v"}));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().unmatchedToken.value(), "-v");
    EXPECT_TRUE(result.error().partialPath.groups().empty());
}

TEST(RouterTest, VisibleOptionsNearestFirst) {
    const auto root = makeTree();
    const AliasTable aliases;

    auto result = Router(root, aliases).route(streamOf({"test", "unit"}));
    ASSERT_TRUE(result.ok());

    std::vector<std::string> ids;
    for (const auto* o : result.value().visibleOptions()) ids.push_back(o->identifier());
    EXPECT_EQ(ids, (std::vector<std::string>{"--coverage", "--quiet"}));
}

TEST(AliasTableTest, DefaultsAndEditing) {
    auto aliases = AliasTable::withDefaults();
    EXPECT_EQ(aliases.resolve("-h"), "help");
    EXPECT_EQ(aliases.resolve("-v"), "version");
    EXPECT_EQ(aliases.resolve("build"), "build");

    aliases.remove("-v");
    EXPECT_FALSE(aliases.contains("-v"));
    aliases.clear();
    EXPECT_TRUE(aliases.entries().empty());
}

TEST(CommandGroupTest, DuplicateChildNamesAreRejected) {
    CommandGroup root("app");
    root.addCommand(Command("build").addAlias("b"));
    EXPECT_THROW(root.addCommand(Command("build")), ConfigurationError);
    EXPECT_THROW(root.addGroup(CommandGroup("b")), ConfigurationError);
    EXPECT_THROW(Command(""), ConfigurationError);
}
