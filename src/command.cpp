#include "argtree/command.hpp"

#include <algorithm>

#include "argtree/help.hpp"
#include "argtree/parser.hpp"

namespace argtree {

namespace {

bool isReservedName(std::string_view name) { return name == "help" || name == "usage"; }

template <typename T>
bool contains(const std::vector<T>& seen, const T& v) {
    return std::find(seen.begin(), seen.end(), v) != seen.end();
}

// Works for both const and mutable containers.
template <typename Items>
auto findNamed(Items& items, std::string_view name) -> decltype(&items.front()) {
    for (auto& item : items) {
        if (item.name() == name) return &item;
    }
    return nullptr;
}

Error duplicate(const std::string& what, const std::string& name) {
    return Error(ErrorKind::DuplicateName, "the " + what + " \"" + name + "\" is set more than once", {}, name);
}

std::optional<Error> checkValueCapacity(const Value& val, std::size_t maxChildren) {
    if (val.maxArgs() == 0 || val.maxArgs() > maxChildren) {
        return Error(ErrorKind::CapacityExceeded,
                     "value \"" + val.name() + "\" accepts " + std::to_string(val.maxArgs()) +
                         " arguments, it must be between 1 and " + std::to_string(maxChildren),
                     {},
                     val.name());
    }
    return std::nullopt;
}

} // namespace

const Config& Command::config() const {
    static const Config kDefault{};
    return config_ ? *config_ : kDefault;
}

std::variant<Command, Error> Command::init(const Config& config, const InitConfig& initConfig) const {
    const bool hasLong = config.option.longPrefix && !config.option.longPrefix->empty();
    if (!config.option.shortPrefix && !hasLong) {
        return Error(ErrorKind::MissingPrefix, "either a short or a long option prefix must be set", {}, name_);
    }
    if (config.value.maxChildren == 0 || config.value.maxChildren > kMaxChildren) {
        return Error(ErrorKind::CapacityExceeded,
                     "maxChildren must be between 1 and " + std::to_string(kMaxChildren),
                     {},
                     name_);
    }

    auto shared = std::make_shared<const Config>(config);
    Command cmd(*this);
    if (auto err = cmd.initialize(shared, initConfig)) return std::move(*err);
    return std::variant<Command, Error>(std::move(cmd));
}

std::optional<Error> Command::initialize(const std::shared_ptr<const Config>& config, const InitConfig& initConfig) {
    const bool addHelpCmds = initConfig.addHelpCmds && !isReservedName(name_);
    if (initConfig.validateCmd) {
        if (auto err = validate(addHelpCmds, initConfig.addHelpOpts)) return err;
    }

    if (!subCmdsMandatory_) subCmdsMandatory_ = config->subCmdsMandatory;
    if (!valsMandatory_) valsMandatory_ = config->valsMandatory;
    for (auto& opt : options_) opt.value().bind(config->value);
    for (auto& val : values_) val.bind(config->value);
    if (auto err = checkCapacity(*config)) return err;

    if (initConfig.initSubcmds) {
        for (auto& sub : subCommands_) {
            if (auto err = sub.initialize(config, initConfig)) return err;
        }
    }
    if (addHelpCmds) addHelpCommands(config);
    if (initConfig.addHelpOpts) {
        addHelpOptions();
        for (auto& opt : options_) opt.value().bind(config->value);
    }

    config_ = config;
    initialized_ = true;
    activeSubCmd_.reset();
    return std::nullopt;
}

std::optional<Error> Command::validate(bool checkHelpCmds, bool checkHelpOpts) const {
    std::vector<std::string> cmdNames;
    if (checkHelpCmds) cmdNames = {"usage", "help"};
    for (const auto& sub : subCommands_) {
        if (contains(cmdNames, sub.name())) return duplicate("sub-command", sub.name());
        cmdNames.push_back(sub.name());
    }

    std::vector<std::string> optNames;
    std::vector<char> shortNames;
    std::vector<std::string> longNames;
    if (checkHelpOpts) {
        optNames = {"usage", "help"};
        shortNames = {'u', 'h'};
        longNames = {"usage", "help"};
    }
    for (const auto& opt : options_) {
        if (!opt.shortName() && !opt.longName()) {
            return Error(ErrorKind::MissingOptionName,
                         "option \"" + opt.name() + "\" needs a short name or a long name",
                         {},
                         opt.name());
        }
        if (contains(optNames, opt.name())) return duplicate("option", opt.name());
        optNames.push_back(opt.name());
        if (opt.shortName()) {
            if (contains(shortNames, *opt.shortName())) {
                return duplicate("option short name", std::string(1, *opt.shortName()));
            }
            shortNames.push_back(*opt.shortName());
        }
        if (opt.longName()) {
            if (contains(longNames, *opt.longName())) return duplicate("option long name", *opt.longName());
            longNames.push_back(*opt.longName());
        }
    }

    std::vector<std::string> valNames;
    for (const auto& val : values_) {
        if (contains(valNames, val.name())) return duplicate("value", val.name());
        valNames.push_back(val.name());
    }
    return std::nullopt;
}

std::optional<Error> Command::checkCapacity(const Config& config) const {
    const auto tooMany = [&](const char* what, std::size_t count) {
        return Error(ErrorKind::CapacityExceeded,
                     "command \"" + name_ + "\" has " + std::to_string(count) + " " + what + ", the limit is " +
                         std::to_string(config.maxArgs),
                     {},
                     name_);
    };
    if (subCommands_.size() > config.maxArgs) return tooMany("sub-commands", subCommands_.size());
    if (options_.size() > config.maxArgs) return tooMany("options", options_.size());
    if (values_.size() > config.maxArgs) return tooMany("values", values_.size());

    for (const auto& opt : options_) {
        if (auto err = checkValueCapacity(opt.value(), config.value.maxChildren)) return err;
    }
    for (const auto& val : values_) {
        if (auto err = checkValueCapacity(val, config.value.maxChildren)) return err;
    }
    return std::nullopt;
}

void Command::addHelpCommands(const std::shared_ptr<const Config>& config) {
    for (const char* kind : {"usage", "help"}) {
        Command sub(kind, "Show the '" + name_ + "' " + kind + " display.");
        sub.helpPrefix_ = name_;
        sub.subCmdsMandatory_ = false;
        sub.valsMandatory_ = false;
        sub.config_ = config;
        sub.initialized_ = true;
        subCommands_.push_back(std::move(sub));
    }
}

void Command::addHelpOptions() {
    for (const char* kind : {"usage", "help"}) {
        Option opt(kind, "Show the '" + name_ + "' " + kind + " display.");
        opt.setShortName(kind[0]).setLongName(kind).setValue(TypedValue<bool>(std::string(kind) + "_flag"));
        options_.push_back(std::move(opt));
    }
}

Command* Command::getSubCmd(std::string_view name) { return findNamed(subCommands_, name); }

const Command* Command::getSubCmd(std::string_view name) const { return findNamed(subCommands_, name); }

Option* Command::option(std::string_view name) { return findNamed(options_, name); }

const Option* Command::option(std::string_view name) const { return findNamed(options_, name); }

Value* Command::value(std::string_view name) { return findNamed(values_, name); }

const Value* Command::value(std::string_view name) const { return findNamed(values_, name); }

Command* Command::activeSubCmd() {
    return activeSubCmd_ ? &subCommands_[*activeSubCmd_] : nullptr;
}

const Command* Command::activeSubCmd() const {
    return activeSubCmd_ ? &subCommands_[*activeSubCmd_] : nullptr;
}

bool Command::checkSubCmd(std::string_view name) const {
    const auto* sub = activeSubCmd();
    return sub && sub->name_ == name;
}

const Command* Command::matchSubCmd(std::string_view name) const {
    return checkSubCmd(name) ? activeSubCmd() : nullptr;
}

Command* Command::matchSubCmd(std::string_view name) {
    return checkSubCmd(name) ? activeSubCmd() : nullptr;
}

bool Command::checkFlag(std::string_view name) const {
    if (checkSubCmd(name)) return true;
    for (const auto& opt : options_) {
        if (opt.name() == name && opt.isBool() && opt.getAs<bool>().value_or(false)) return true;
    }
    for (const auto& val : values_) {
        if (val.name() == name && val.isBool() && val.getAs<bool>().value_or(false)) return true;
    }
    return false;
}

std::map<std::string, const Option*> Command::getOpts() const {
    std::map<std::string, const Option*> out;
    for (const auto& opt : options_) out.emplace(opt.name(), &opt);
    return out;
}

std::map<std::string, const Value*> Command::getVals() const {
    std::map<std::string, const Value*> out;
    for (const auto& val : values_) out.emplace(val.name(), &val);
    return out;
}

void Command::usage(std::ostream& os) const {
    if (usageFunc_) {
        usageFunc_(*this, os);
        return;
    }
    writeCommandUsage(os, *this);
}

void Command::help(std::ostream& os) const {
    if (helpFunc_) {
        helpFunc_(*this, os);
        return;
    }
    writeCommandHelp(os, *this);
}

bool Command::checkUsageHelp(std::ostream& os) const {
    if (checkFlag("usage")) {
        usage(os);
        return true;
    }
    if (checkFlag("help")) {
        help(os);
        return true;
    }
    return false;
}

std::optional<Error> Command::parse(int argc, char** argv, const ParseConfig& parseConfig) {
    Parser parser(*this, parseConfig);
    TokenStream tokens(argc, argv);
    return parser.parse(tokens);
}

std::optional<Error> Command::parse(const std::vector<std::string>& args, const ParseConfig& parseConfig) {
    ParseConfig rawConfig = parseConfig;
    rawConfig.skipExeName = false;
    Parser parser(*this, rawConfig);
    return parser.parse(args);
}

} // namespace argtree
