#include <iostream>
#include <optional>
#include <string>

#include <spdlog/cfg/env.h>

#include "argroute/argroute.hpp"

namespace {

std::optional<argroute::ProcessError> report(const argroute::BoundCommand& bound) {
    std::cout << bound.path.joinedNames();
    for (const auto& b : bound.parameters.bindings()) {
        for (const auto& v : b.values) std::cout << " " << b.name << "=" << v;
    }
    if (bound.options.flag("--json")) std::cout << " (json)";
    if (bound.options.flag("--yaml")) std::cout << " (yaml)";
    if (const auto jobs = bound.options.get<int>("--jobs")) std::cout << " jobs=" << *jobs;
    std::cout << "\n";
    return std::nullopt;
}

} // namespace

int main(int argc, char** argv) {
    spdlog::cfg::load_env_levels();

    argroute::Cli cli("app", "1.0.0", "Command group example");
    cli.aliases().set("t", "test");

    argroute::CommandGroup test("test", "Runs tests");
    test.withSharedKey({"-j", "--jobs"}, argroute::ValueType::Int, "Parallel jobs", "n");
    test.addCommand(argroute::Command("unit", "Runs unit tests")
                        .withParameter(argroute::Parameter::variadic("filter"))
                        .action(report));
    test.addCommand(argroute::Command("integration", "Runs integration tests")
                        .withParameter(argroute::Parameter::required("suite"))
                        .addAlias("it")
                        .action(report));

    argroute::Command show("show", "Prints the build configuration");
    show.withFlag({"--json"}, "JSON output")
        .withFlag({"--yaml"}, "YAML output")
        .withOptionGroup(argroute::OptionGroup::atMostOne({"--json", "--yaml"}))
        .action(report);

    cli.addGroup(std::move(test));
    cli.addCommand(std::move(show));
    return cli.go(argc, argv);
}
