#include <cstdint>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include "argtree/argtree.hpp"

static std::string join(const std::vector<std::int32_t>& v, const std::string& sep) {
    std::string out;
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (i) out += sep;
        out += std::to_string(v[i]);
    }
    return out;
}

int main(int argc, char** argv) {
    argtree::Command schema("sum", "Add up to six integers");
    schema
        .withOption(argtree::Option("ints", "Integers to add, repeatable or delimited (-i 1,2,3)")
                        .setShortName('i')
                        .setLongName("ints")
                        .setValue(argtree::TypedValue<std::int32_t>("int")
                                      .setBehavior(argtree::SetBehavior::Multi)
                                      .setMaxArgs(6)
                                      .setValidFn(argtree::validation::inRange<std::int32_t>(-1000, 1000))))
        .withOption(argtree::Option("base", "Base for the printed total")
                        .setLongName("base")
                        .setValue(argtree::TypedValue<std::uint8_t>("base")
                                      .setDefault(10)
                                      .setParseFn(argtree::parsing::asBase<std::uint8_t>(10))));
    schema.setValsMandatory(false);

    auto initialized = schema.init();
    if (auto* err = std::get_if<argtree::Error>(&initialized)) {
        std::cerr << *err << "\n";
        return 2;
    }
    auto& cmd = std::get<argtree::Command>(initialized);
    if (cmd.parse(argc, argv)) return 1;
    if (cmd.checkFlag("help") || cmd.checkFlag("usage")) return 0;

    const auto ints = cmd.option("ints")->getAllAs<std::int32_t>().value_or(std::vector<std::int32_t>{});
    std::int64_t total = 0;
    for (const auto i : ints) total += i;
    std::cout << join(ints, " + ") << " = " << total << "\n";
    return 0;
}
