/**
 * Unit tests for help.hpp
 */

#include <argroute/help.hpp>
#include <gtest/gtest.h>

#include <string>

using namespace argroute;

namespace {

CommandGroup makeTree() {
    CommandGroup test("test", "Runs tests");
    test.addCommand(Command("unit", "Unit tests", "Runs the unit test suite.")
                        .withKey({"-f", "--filter"}, ValueType::String, "Only matching tests", "pattern")
                        .withParameter(Parameter::optional("target")));

    CommandGroup root("app", "Builds things");
    root.withSharedFlag({"-q", "--quiet"}, "Less output");
    root.addCommand(Command("build", "Builds the project").withParameter(Parameter::required("dir")));
    root.addGroup(std::move(test));
    return root;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST(HelpMessageTest, CommandListSeparatesGroupsAndCommands) {
    const auto root = makeTree();
    DefaultHelpMessageGenerator gen;

    const auto text = gen.commandList(GroupPath(root));
    EXPECT_TRUE(contains(text, "Usage: app <command> [options]\n"));
    EXPECT_TRUE(contains(text, "Builds things"));
    EXPECT_TRUE(contains(text, "Groups:\n  test - Runs tests\n"));
    EXPECT_TRUE(contains(text, "Commands:\n  build - Builds the project\n"));
}

TEST(HelpMessageTest, UsageShowsOwnAndInheritedOptions) {
    const auto root = makeTree();
    DefaultHelpMessageGenerator gen;

    const auto& test = std::get<CommandGroup>(*root.findChild("test"));
    const auto& unit = std::get<Command>(*test.findChild("unit"));
    const CommandPath path(GroupPath(root).appending(test), unit);

    EXPECT_EQ(DefaultHelpMessageGenerator::usageLine(path), "Usage: app test unit [<target>] [options]");

    const auto text = gen.usage(path);
    EXPECT_TRUE(contains(text, "Runs the unit test suite."));
    EXPECT_TRUE(contains(text, "Options:\n  -f, --filter <pattern> - Only matching tests\n"));
    EXPECT_TRUE(contains(text, "Global Options:\n  -q, --quiet - Less output\n"));
}

TEST(HelpMessageTest, UnknownCommandSuggestsCloseNames) {
    const auto root = makeTree();

    const auto text = DefaultHelpMessageGenerator().unknownCommand(GroupPath(root), "biuld");
    EXPECT_TRUE(contains(text, "Command \"biuld\" not found"));
    EXPECT_TRUE(contains(text, "Did you mean this?\n  build\n"));

    DefaultHelpMessageGenerator::Options quiet;
    quiet.suggestions = false;
    const auto plain = DefaultHelpMessageGenerator(quiet).unknownCommand(GroupPath(root), "biuld");
    EXPECT_FALSE(contains(plain, "Did you mean"));
}

TEST(HelpMessageTest, MisusedOptionsLeadsWithTheProblem) {
    const auto root = makeTree();
    const auto& build = std::get<Command>(*root.findChild("build"));
    const CommandPath path(GroupPath(root), build);

    OptionError err;
    err.kind = OptionError::Kind::UnrecognizedOption;
    err.option = "--quite";

    const auto text = DefaultHelpMessageGenerator().misusedOptions(path, err);
    EXPECT_EQ(text.rfind("Unrecognized option: --quite", 0), 0u);
    EXPECT_TRUE(contains(text, "Did you mean this?\n  --quiet\n"));
    EXPECT_TRUE(contains(text, "Usage: app build <dir> [options]"));
}

TEST(HelpMessageTest, DescribeOptionErrors) {
    OptionError expected;
    expected.kind = OptionError::Kind::ExpectedValue;
    expected.option = "--filter";
    EXPECT_EQ(DefaultHelpMessageGenerator::describe(expected), "Expected a value to follow: --filter");

    OptionError invalid;
    invalid.kind = OptionError::Kind::InvalidValue;
    invalid.option = "--count";
    invalid.value = "many";
    invalid.expected = ValueType::Int;
    EXPECT_EQ(DefaultHelpMessageGenerator::describe(invalid), "Invalid value \"many\" for --count: expected int");

    const auto group = OptionGroup::exactlyOne({"--json", "--yaml"});
    OptionError unsatisfied;
    unsatisfied.kind = OptionError::Kind::UnsatisfiedGroup;
    unsatisfied.group = &group;
    EXPECT_EQ(DefaultHelpMessageGenerator::describe(unsatisfied),
              "Exactly one of the following options must be passed: --json, --yaml");
}

TEST(HelpMessageTest, DescribeParameterErrors) {
    ParameterError exact;
    exact.kind = ParameterError::Kind::NotEnoughArguments;
    exact.minimum = 1;
    exact.maximum = 1;
    exact.given = 0;
    EXPECT_EQ(DefaultHelpMessageGenerator::describe(exact), "Expected 1 argument, but got 0.");

    ParameterError range;
    range.kind = ParameterError::Kind::TooManyArguments;
    range.minimum = 1;
    range.maximum = 2;
    range.given = 3;
    EXPECT_EQ(DefaultHelpMessageGenerator::describe(range), "Expected between 1 and 2 arguments, but got 3.");

    ParameterError open;
    open.minimum = 2;
    open.given = 1;
    EXPECT_EQ(DefaultHelpMessageGenerator::describe(open), "Expected at least 2 arguments, but got 1.");
}
