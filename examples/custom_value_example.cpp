#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "argtree/argtree.hpp"

struct Level {
    int severity{1};
    std::string label{"info"};
};

enum class Color : int { Red, Green, Blue };

int main(int argc, char** argv) {
    argtree::Config config;
    config.value.typeParsers.add<Level>(
        [](std::string_view v, Level& out) -> std::optional<std::string> {
            static const char* const kLevels[] = {"debug", "info", "warn", "error"};
            for (int i = 0; i < 4; ++i) {
                if (v == kLevels[i]) {
                    out = Level{i, kLevels[i]};
                    return std::nullopt;
                }
            }
            return "invalid level: " + std::string(v);
        },
        "level");

    argtree::Command schema("app", "Custom value example");
    schema
        .withOption(argtree::Option("level", "Log level")
                        .setShortName('l')
                        .setLongName("level")
                        .setValue(argtree::TypedValue<Level>("level").setDefault(Level{})))
        .withOption(argtree::Option("color", "Output color")
                        .setShortName('c')
                        .setLongName("color")
                        .setValue(argtree::TypedValue<int>("color")
                                      .setTypeAlias("red|green|blue")
                                      .setParseFn(argtree::parsing::asEnum<Color>(
                                          {{"red", Color::Red}, {"green", Color::Green}, {"blue", Color::Blue}}))));
    schema.setValsMandatory(false);

    auto initialized = schema.init(config);
    if (auto* err = std::get_if<argtree::Error>(&initialized)) {
        std::cerr << *err << "\n";
        return 2;
    }
    auto& cmd = std::get<argtree::Command>(initialized);
    if (cmd.parse(argc, argv)) return 1;
    if (cmd.checkFlag("help") || cmd.checkFlag("usage")) return 0;

    const auto level = cmd.option("level")->getAs<Level>().value_or(Level{});
    const auto color = cmd.option("color")->getAs<Color>().value_or(Color::Red);
    std::cout << "level=" << level.label << " (" << level.severity << ") color=" << static_cast<int>(color) << "\n";
    return 0;
}
