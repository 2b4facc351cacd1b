#include <cctype>
#include <iostream>
#include <optional>
#include <string>

#include <spdlog/cfg/env.h>

#include "argroute/argroute.hpp"

int main(int argc, char** argv) {
    // SPDLOG_LEVEL=debug ./basic_example greet -lx alice
    spdlog::cfg::load_env_levels();

    argroute::Cli cli("greeter", "0.1.0", "A brief description of your application");
    cli.withGlobalFlag({"-q", "--quiet"}, "Disable output");

    argroute::Command greet("greet", "Greets someone");
    greet.withFlag({"-l", "--loud"}, "Shout the greeting")
        .withFlag({"-x", "--excited"}, "End with an exclamation mark")
        .withKey({"-t", "--times"}, argroute::ValueType::Int, "How many times to greet", "n")
        .withParameter(argroute::Parameter::required("name"))
        .withParameter(argroute::Parameter::optional("greeting", "Hello"))
        .addAlias("g")
        .action([](const argroute::BoundCommand& bound) -> std::optional<argroute::ProcessError> {
            if (bound.options.flag("--quiet")) return std::nullopt;

            const int times = bound.options.getOr<int>("--times", 1);
            if (times < 0) return argroute::ProcessError("--times must not be negative");

            std::string text = bound.parameters.get("greeting") + ", " + bound.parameters.get("name");
            if (bound.options.flag("--loud")) {
                for (auto& c : text) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            }
            text += bound.options.flag("--excited") ? "!" : ".";
            for (int i = 0; i < times; ++i) std::cout << text << "\n";
            return std::nullopt;
        });

    argroute::Command raw("raw", "Prints raw args without option parsing");
    raw.disableOptionParsing()
        .withParameter(argroute::Parameter::variadic("args"))
        .action([](const argroute::BoundCommand& bound) -> std::optional<argroute::ProcessError> {
            const auto& args = bound.parameters.collected("args");
            for (std::size_t i = 0; i < args.size(); ++i) {
                if (i) std::cout << " ";
                std::cout << args[i];
            }
            std::cout << "\n";
            return std::nullopt;
        });

    cli.addCommand(std::move(greet));
    cli.addCommand(std::move(raw));
    return cli.go(argc, argv);
}
