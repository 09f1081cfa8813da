#ifndef ARGTREE_CONFIG_HPP
#define ARGTREE_CONFIG_HPP

#include <any>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <utility>

#ifndef ARGTREE_MAX_CHILDREN
#define ARGTREE_MAX_CHILDREN 10
#endif

namespace argtree {

// Slot capacity compiled into every TypedValue.
inline constexpr std::size_t kMaxChildren = ARGTREE_MAX_CHILDREN;

enum class SetBehavior {
    First, // keep the first argument
    Last,  // keep the last argument
    Multi, // keep up to maxArgs arguments
};

// Return empty optional on success, otherwise an error message.
template <typename T>
using ParseFn = std::function<std::optional<std::string>(std::string_view arg, T& out)>;
template <typename T>
using ValidFn = std::function<bool(const T&)>;

// Type-level parse functions. Used for every Value of the registered type
// that has no instance-level parse function.
class TypeParsers {
public:
    template <typename T>
    TypeParsers& add(ParseFn<T> fn, std::string typeName = {}) {
        entries_[std::type_index(typeid(T))] = Entry{std::any(std::move(fn)), std::move(typeName)};
        return *this;
    }

    template <typename T>
    [[nodiscard]] const ParseFn<T>* find() const {
        const auto it = entries_.find(std::type_index(typeid(T)));
        if (it == entries_.end()) return nullptr;
        return std::any_cast<ParseFn<T>>(&it->second.fn);
    }

    template <typename T>
    [[nodiscard]] std::string typeName() const {
        const auto it = entries_.find(std::type_index(typeid(T)));
        return it == entries_.end() ? std::string{} : it->second.typeName;
    }

    [[nodiscard]] bool empty() const { return entries_.empty(); }

private:
    struct Entry {
        std::any fn;
        std::string typeName;
    };
    std::unordered_map<std::type_index, Entry> entries_;
};

struct ValueConfig {
    SetBehavior globalSetBehavior{SetBehavior::Last};
    std::string globalArgDelims{",;"};
    std::size_t maxChildren{kMaxChildren};
    TypeParsers typeParsers{};
};

struct OptionConfig {
    std::optional<char> shortPrefix{'-'};
    std::optional<std::string> longPrefix{std::string("--")};
    // Separators between an Option and its inline value (`--opt=value`).
    std::string optValSeps{"="};
    // Allow `-nvalue` for short Options.
    bool allowOptValNoSpace{true};
    // Allow `--verb` for `--verbose`. Uniqueness is not checked; the first
    // declared match wins.
    bool allowAbbreviatedLongOpts{true};
};

// Templates use `{{.Key}}` placeholders.
struct HelpFormat {
    std::string indent{"    "};
    std::string valuesUsage{"\"{{.Name}} ({{.Type}})\""};
    std::string valuesHelp{"{{.Name}} ({{.Type}}): {{.Description}}"};
    std::string subcmdsUsage{"'{{.Name}}'"};
    std::string subcmdsHelp{"{{.Name}}: {{.Description}}"};
    std::string optionUsage{"[{{.Names}} \"{{.ValueName}} ({{.Type}})\"]"};
    // Empty selects the default multi-line layout.
    std::string optionHelp{};
};

struct Config {
    ValueConfig value{};
    OptionConfig option{};
    HelpFormat help{};
    bool subCmdsMandatory{true};
    bool valsMandatory{true};
    // Per Command cap on each of sub-commands, Options and Values.
    std::size_t maxArgs{25};
};

struct InitConfig {
    bool validateCmd{true};
    bool addHelpCmds{true};
    bool addHelpOpts{true};
    bool initSubcmds{true};
};

enum class ErrReaction {
    None,
    Usage,
    Help,
};

struct ParseConfig {
    bool skipExeName{true};
    bool autoHandleUsageHelp{true};
    // A bare `--` sends all following tokens to Values.
    bool enableOptTermination{true};
    ErrReaction errReaction{ErrReaction::Usage};
    bool silenceErrors{false};
    std::optional<bool> valsMandatory{};
    std::optional<bool> subCmdsMandatory{};
};

} // namespace argtree

#endif // ARGTREE_CONFIG_HPP
