#include "argtree/help.hpp"

#include <sstream>
#include <string>

#include "argtree/utils.hpp"

namespace argtree {

namespace {

std::string optionNames(const Option& opt, const OptionConfig& cfg) {
    std::string names;
    if (opt.shortName() && cfg.shortPrefix) {
        names += *cfg.shortPrefix;
        names += *opt.shortName();
    }
    if (opt.longName() && cfg.longPrefix) {
        if (!names.empty()) names += ",";
        names += *cfg.longPrefix + *opt.longName();
    }
    return names;
}

std::string repeat(const std::string& s, int n) {
    std::string out;
    for (int i = 0; i < n; ++i) out += s;
    return out;
}

} // namespace

void writeValueUsage(std::ostream& os, const Value& val, const HelpFormat& fmt) {
    os << utils::renderTemplate(fmt.valuesUsage, {{"Name", val.name()}, {"Type", val.typeName()}});
}

void writeValueHelp(std::ostream& os, const Value& val, const HelpFormat& fmt) {
    os << utils::renderTemplate(fmt.valuesHelp,
                                {
                                    {"Name", val.name()},
                                    {"Type", val.typeName()},
                                    {"Description", val.description()},
                                });
}

void writeOptionUsage(std::ostream& os, const Option& opt, const Config& config) {
    os << utils::renderTemplate(config.help.optionUsage,
                                {
                                    {"Names", optionNames(opt, config.option)},
                                    {"ValueName", opt.value().name()},
                                    {"Type", opt.typeName()},
                                });
}

void writeOptionHelp(std::ostream& os, const Option& opt, const Config& config) {
    std::ostringstream usage;
    writeOptionUsage(usage, opt, config);
    if (!config.help.optionHelp.empty()) {
        os << utils::renderTemplate(config.help.optionHelp,
                                    {
                                        {"Name", utils::capitalize(opt.name())},
                                        {"Description", opt.description()},
                                        {"Usage", usage.str()},
                                        {"Indent", config.help.indent},
                                    });
        return;
    }
    const auto indent = repeat(config.help.indent, 3);
    os << utils::capitalize(opt.name()) << ":\n" << indent << usage.str() << "\n" << indent << opt.description();
}

void writeCommandUsage(std::ostream& os, const Command& cmd) {
    const auto& config = cmd.config();
    os << "USAGE: " << cmd.name() << " ";
    if (!cmd.options().empty()) {
        for (const auto& opt : cmd.options()) {
            writeOptionUsage(os, opt, config);
            os << " ";
        }
        os << "| ";
    }
    if (!cmd.values().empty()) {
        for (const auto& val : cmd.values()) {
            writeValueUsage(os, val, config.help);
            os << " ";
        }
        os << "| ";
    }
    for (const auto& sub : cmd.subCommands()) {
        os << utils::renderTemplate(config.help.subcmdsUsage, {{"Name", sub.name()}}) << " ";
    }
    os << "\n\n";
}

void writeCommandHelp(std::ostream& os, const Command& cmd) {
    const auto& config = cmd.config();
    const auto& indent = config.help.indent;
    const auto itemIndent = repeat(indent, 2);

    if (!cmd.helpPrefix().empty()) os << cmd.helpPrefix() << "\n";
    writeCommandUsage(os, cmd);

    os << "HELP:\n"
       << indent << "COMMAND: " << cmd.name() << "\n\n"
       << indent << "DESCRIPTION: " << cmd.description() << "\n\n";

    if (!cmd.subCommands().empty()) {
        os << indent << "SUB COMMANDS:\n";
        for (const auto& sub : cmd.subCommands()) {
            os << itemIndent
               << utils::renderTemplate(config.help.subcmdsHelp,
                                        {{"Name", sub.name()}, {"Description", sub.description()}})
               << "\n";
        }
        os << "\n";
    }

    if (!cmd.options().empty()) {
        os << indent << "OPTIONS:\n";
        for (const auto& opt : cmd.options()) {
            os << itemIndent;
            writeOptionHelp(os, opt, config);
            os << "\n";
        }
        os << "\n";
    }

    if (!cmd.values().empty()) {
        os << indent << "VALUES:\n";
        for (const auto& val : cmd.values()) {
            os << itemIndent;
            writeValueHelp(os, val, config.help);
            os << "\n";
        }
        os << "\n";
    }
}

} // namespace argtree
