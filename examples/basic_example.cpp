#include <iostream>
#include <string>
#include <variant>

#include "argtree/argtree.hpp"

int main(int argc, char** argv) {
    argtree::Command build("build", "Build the project for a target");
    build
        .withOption(argtree::Option("target", "Target architecture")
                        .setShortName('t')
                        .setLongName("target")
                        .setValue(argtree::TypedValue<std::string>("arch").setDefault("x86_64")))
        .withOption(argtree::Option("verbose", "Print every step").setShortName('v').setLongName("verbose"))
        .withValue(argtree::TypedValue<std::string>("profile", "Build profile (debug or release)"));

    argtree::Command schema("app", "A small build driver");
    schema.addCommand(std::move(build));

    auto initialized = schema.init();
    if (auto* err = std::get_if<argtree::Error>(&initialized)) {
        std::cerr << argtree::toString(err->category()) << ": " << *err << "\n";
        return 2;
    }
    auto& app = std::get<argtree::Command>(initialized);

    if (app.parse(argc, argv)) return 1;
    if (app.checkFlag("help") || app.checkFlag("usage")) return 0;

    if (const auto* cmd = app.matchSubCmd("build")) {
        if (cmd->checkFlag("help") || cmd->checkFlag("usage")) return 0;
        const auto target = cmd->option("target")->getAs<std::string>().value_or("");
        const auto profile = cmd->value("profile")->getAs<std::string>().value_or("");
        if (cmd->checkFlag("verbose")) std::cout << "building with profile " << profile << "\n";
        std::cout << "target=" << target << " profile=" << profile << "\n";
    }
    return 0;
}
