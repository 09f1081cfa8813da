#ifndef ARGTREE_COMMAND_HPP
#define ARGTREE_COMMAND_HPP

#include <cstddef>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "config.hpp"
#include "error.hpp"
#include "option.hpp"
#include "value.hpp"

namespace argtree {

class Parser;

// Container of sub-Commands, Options and Values. Declared as a schema,
// turned into a parse-ready tree by init(), then filled by parse().
class Command {
public:
    using HelpFunc = std::function<void(const Command&, std::ostream&)>;
    using UsageFunc = std::function<void(const Command&, std::ostream&)>;

    explicit Command(std::string name, std::string description = {})
        : name_(std::move(name)),
          description_(std::move(description)) {}

    Command& setDescription(std::string v) {
        description_ = std::move(v);
        return *this;
    }

    // First line of the help output.
    Command& setHelpPrefix(std::string v) {
        helpPrefix_ = std::move(v);
        return *this;
    }

    Command& addCommand(Command sub) {
        subCommands_.push_back(std::move(sub));
        return *this;
    }

    Command& withOption(Option opt) {
        options_.push_back(std::move(opt));
        return *this;
    }

    Command& withValue(Value val) {
        values_.push_back(std::move(val));
        return *this;
    }

    Command& setSubCmdsMandatory(bool v = true) {
        subCmdsMandatory_ = v;
        return *this;
    }

    Command& setValsMandatory(bool v = true) {
        valsMandatory_ = v;
        return *this;
    }

    Command& setOut(std::ostream& os) {
        out_ = &os;
        return *this;
    }

    Command& setErr(std::ostream& os) {
        err_ = &os;
        return *this;
    }

    Command& setHelpFunc(HelpFunc f) {
        helpFunc_ = std::move(f);
        return *this;
    }

    Command& setUsageFunc(UsageFunc f) {
        usageFunc_ = std::move(f);
        return *this;
    }

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& description() const { return description_; }
    [[nodiscard]] const std::string& helpPrefix() const { return helpPrefix_; }
    [[nodiscard]] const std::vector<Command>& subCommands() const { return subCommands_; }
    [[nodiscard]] const std::vector<Option>& options() const { return options_; }
    [[nodiscard]] const std::vector<Value>& values() const { return values_; }
    [[nodiscard]] bool subCmdsMandatory() const { return subCmdsMandatory_.value_or(true); }
    [[nodiscard]] bool valsMandatory() const { return valsMandatory_.value_or(true); }
    [[nodiscard]] bool isInitialized() const { return initialized_; }
    [[nodiscard]] const Config& config() const;

    std::ostream& out() const { return out_ ? *out_ : std::cout; }
    std::ostream& err() const { return err_ ? *err_ : std::cerr; }

    // Validates the schema and returns a runtime copy: defaults applied,
    // help/usage items added, every Value bound to `config`.
    [[nodiscard]] std::variant<Command, Error> init(const Config& config = {}, const InitConfig& initConfig = {}) const;

    // Distinct sibling names at this level. With the check flags set the
    // reserved help/usage names count as taken.
    [[nodiscard]] std::optional<Error> validate(bool checkHelpCmds = false, bool checkHelpOpts = false) const;

    [[nodiscard]] Command* getSubCmd(std::string_view name);
    [[nodiscard]] const Command* getSubCmd(std::string_view name) const;
    [[nodiscard]] Option* option(std::string_view name);
    [[nodiscard]] const Option* option(std::string_view name) const;
    [[nodiscard]] Value* value(std::string_view name);
    [[nodiscard]] const Value* value(std::string_view name) const;

    [[nodiscard]] Command* activeSubCmd();
    [[nodiscard]] const Command* activeSubCmd() const;
    // True when the active sub-command is named `name`.
    [[nodiscard]] bool checkSubCmd(std::string_view name) const;
    // The active sub-command if it is named `name`.
    [[nodiscard]] const Command* matchSubCmd(std::string_view name) const;
    [[nodiscard]] Command* matchSubCmd(std::string_view name);

    // True when `name` is the active sub-command, or a bool Option/Value
    // that is set to true.
    [[nodiscard]] bool checkFlag(std::string_view name) const;

    [[nodiscard]] std::map<std::string, const Option*> getOpts() const;
    [[nodiscard]] std::map<std::string, const Value*> getVals() const;

    void usage(std::ostream& os) const;
    void help(std::ostream& os) const;
    // Renders usage or help if either was requested on this Command.
    bool checkUsageHelp(std::ostream& os) const;

    // argv-style entry point; argv[0] is skipped per ParseConfig::skipExeName.
    std::optional<Error> parse(int argc, char** argv, const ParseConfig& parseConfig = {});
    // Raw argument tokens, without an executable name.
    std::optional<Error> parse(const std::vector<std::string>& args, const ParseConfig& parseConfig = {});

private:
    friend class Parser;

    std::optional<Error> initialize(const std::shared_ptr<const Config>& config, const InitConfig& initConfig);
    std::optional<Error> checkCapacity(const Config& config) const;
    void addHelpCommands(const std::shared_ptr<const Config>& config);
    void addHelpOptions();
    void setActiveSubCmd(std::size_t idx) { activeSubCmd_ = idx; }

    std::string name_;
    std::string description_;
    std::string helpPrefix_;
    std::vector<Command> subCommands_;
    std::vector<Option> options_;
    std::vector<Value> values_;
    std::optional<bool> subCmdsMandatory_;
    std::optional<bool> valsMandatory_;
    std::optional<std::size_t> activeSubCmd_;

    std::shared_ptr<const Config> config_;
    bool initialized_{false};

    std::ostream* out_{nullptr};
    std::ostream* err_{nullptr};
    HelpFunc helpFunc_;
    UsageFunc usageFunc_;
};

} // namespace argtree

#endif // ARGTREE_COMMAND_HPP
