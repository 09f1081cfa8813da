#include "argtree/parser.hpp"

#include <algorithm>

#include "argtree/utils.hpp"

namespace argtree {

namespace {

// `-5`, `-0.25`, `-1e3` and the like are positional arguments, not options.
bool looksNumeric(std::string_view token) {
    double ignored = 0.0;
    return !detail::parseFloating(token, ignored).has_value();
}

bool isReservedName(std::string_view name) { return name == "help" || name == "usage"; }

std::string didYouMean(const std::vector<std::string>& suggestions) {
    if (suggestions.empty()) return {};
    std::string out = "\n\nDid you mean this?\n";
    for (const auto& s : suggestions) out += "  " + s + "\n";
    return out;
}

} // namespace

Parser::Parser(Command& root, ParseConfig options)
    : root_(root),
      config_(root.config()),
      options_(std::move(options)) {}

std::optional<Error> Parser::parse(TokenStream& tokens) {
    usageHelpCalled_ = false;
    usageHelpRequested_ = false;
    if (options_.skipExeName && tokens.index() == 0) (void)tokens.next();
    return parseContext(root_, tokens);
}

std::optional<Error> Parser::parse(std::vector<std::string> tokens) {
    TokenStream stream(std::move(tokens));
    return parse(stream);
}

std::optional<Error> Parser::parseContext(Command& cmd, TokenStream& tokens) {
    std::size_t valIdx = 0;
    bool terminated = false;

    while (auto next = tokens.next()) {
        const std::string& token = *next;
        if (!terminated) {
            bool handled = false;
            switch (shapeOf(token)) {
                case TokenShape::Terminator:
                    terminated = true;
                    handled = true;
                    break;
                case TokenShape::Long: {
                    bool matched = true;
                    const auto body = std::string_view(token).substr(config_.option.longPrefix->size());
                    if (auto err = parseLong(cmd, body, token, tokens, matched)) return err;
                    handled = matched;
                    break;
                }
                case TokenShape::Short: {
                    bool matched = true;
                    if (auto err = parseShort(cmd, std::string_view(token).substr(1), token, tokens, matched)) return err;
                    handled = matched;
                    break;
                }
                case TokenShape::Plain:
                    break;
            }
            if (handled) continue;

            // The matched sub-command consumes the rest of the stream.
            for (std::size_t i = 0; i < cmd.subCommands_.size(); ++i) {
                if (cmd.subCommands_[i].name() != token) continue;
                cmd.setActiveSubCmd(i);
                if (auto err = parseContext(cmd.subCommands_[i], tokens)) return err;
                return checkMandatory(cmd);
            }
        }
        if (auto err = setPositional(cmd, token, valIdx)) return err;
    }
    return checkMandatory(cmd);
}

std::optional<Error> Parser::parseLong(Command& cmd,
                                       std::string_view body,
                                       const std::string& token,
                                       TokenStream& tokens,
                                       bool& matched) {
    const auto sepPos = body.find_first_of(config_.option.optValSeps);
    const auto name = body.substr(0, sepPos);

    Option* opt = findLong(cmd, name);
    if (!opt) {
        const auto& shortPrefix = config_.option.shortPrefix;
        if (shortPrefix && token.size() > 1 && token.front() == *shortPrefix &&
            (findShort(cmd, token[1]) || looksNumeric(token))) {
            return parseShort(cmd, std::string_view(token).substr(1), token, tokens, matched);
        }
        return unknownOption(cmd, "unknown flag: " + longDisplay(name), longDisplay(name), token);
    }

    const auto display = longDisplay(*opt->longName());
    if (sepPos != std::string_view::npos) {
        if (opt->isBool()) {
            return fail(cmd,
                        Error(ErrorKind::BoolCannotTakeArgument,
                              "flag " + display + " is a boolean and cannot take an argument",
                              token,
                              opt->name()));
        }
        const auto arg = body.substr(sepPos + 1);
        if (arg.empty()) {
            return fail(cmd,
                        Error(ErrorKind::EmptyArgumentProvidedToOption,
                              "flag needs an argument: " + display,
                              token,
                              opt->name()));
        }
        if (auto err = opt->set(arg)) return fail(cmd, std::move(*err));
        return std::nullopt;
    }

    if (opt->isBool()) {
        if (auto err = opt->set("true")) return fail(cmd, std::move(*err));
        return std::nullopt;
    }
    return parseOptionArg(cmd, *opt, display, tokens);
}

std::optional<Error> Parser::parseShort(Command& cmd,
                                        std::string_view body,
                                        const std::string& token,
                                        TokenStream& tokens,
                                        bool& matched) {
    const auto& seps = config_.option.optValSeps;
    for (std::size_t i = 0; i < body.size(); ++i) {
        const char c = body[i];
        Option* opt = findShort(cmd, c);
        if (!opt) {
            if (i == 0 && looksNumeric(token)) {
                matched = false;
                return std::nullopt;
            }
            return unknownOption(cmd,
                                 "unknown shorthand flag: '" + std::string(1, c) + "' in " + token,
                                 shortDisplay(c),
                                 token);
        }

        const auto display = shortDisplay(c);
        const auto rest = body.substr(i + 1);
        if (!rest.empty() && seps.find(rest.front()) != std::string::npos) {
            if (opt->isBool()) {
                return fail(cmd,
                            Error(ErrorKind::BoolCannotTakeArgument,
                                  "flag " + display + " is a boolean and cannot take an argument",
                                  token,
                                  opt->name()));
            }
            const auto arg = rest.substr(1);
            if (arg.empty()) {
                return fail(cmd,
                            Error(ErrorKind::EmptyArgumentProvidedToOption,
                                  "flag needs an argument: " + display,
                                  token,
                                  opt->name()));
            }
            if (auto err = opt->set(arg)) return fail(cmd, std::move(*err));
            return std::nullopt;
        }

        if (opt->isBool()) {
            if (auto err = opt->set("true")) return fail(cmd, std::move(*err));
            continue;
        }
        if (rest.empty()) return parseOptionArg(cmd, *opt, display, tokens);
        if (config_.option.allowOptValNoSpace) {
            if (auto err = opt->set(rest)) return fail(cmd, std::move(*err));
            return std::nullopt;
        }
        return fail(cmd,
                    Error(ErrorKind::EmptyArgumentProvidedToOption,
                          "flag needs an argument: " + display + " in " + token,
                          token,
                          opt->name()));
    }
    return std::nullopt;
}

std::optional<Error> Parser::parseOptionArg(Command& cmd, Option& opt, const std::string& display, TokenStream& tokens) {
    const std::string* peeked = tokens.peek();
    if (!peeked || isOptionShaped(*peeked)) {
        return fail(cmd,
                    Error(ErrorKind::EmptyArgumentProvidedToOption,
                          "flag needs an argument: " + display,
                          display,
                          opt.name()));
    }
    const auto arg = *tokens.next();
    if (auto err = opt.set(arg)) return fail(cmd, std::move(*err));
    return std::nullopt;
}

std::optional<Error> Parser::setPositional(Command& cmd, const std::string& token, std::size_t& valIdx) {
    auto& vals = cmd.values_;
    if (vals.empty()) return unexpectedArgument(cmd, token);

    while (valIdx < vals.size() && vals[valIdx].isMaxed()) ++valIdx;
    if (valIdx >= vals.size()) {
        return fail(cmd,
                    Error(ErrorKind::TooManyValues,
                          "too many values for \"" + cmd.name() + "\": \"" + token + "\" has no remaining value",
                          token,
                          cmd.name()));
    }
    if (auto err = vals[valIdx].set(token)) return fail(cmd, std::move(*err));
    return std::nullopt;
}

std::optional<Error> Parser::checkMandatory(Command& cmd) {
    if (options_.autoHandleUsageHelp && !usageHelpCalled_ && cmd.checkUsageHelp(root_.out())) {
        usageHelpCalled_ = true;
    }
    if (cmd.checkFlag("help") || cmd.checkFlag("usage")) usageHelpRequested_ = true;
    if (usageHelpRequested_) return std::nullopt;

    if (options_.valsMandatory.value_or(cmd.valsMandatory())) {
        const auto filled = static_cast<std::size_t>(
            std::count_if(cmd.values_.begin(), cmd.values_.end(), [](const Value& v) { return v.isSet(); }));
        for (const auto& v : cmd.values_) {
            if (v.isSet() || v.hasDefault()) continue;
            return fail(cmd,
                        Error(ErrorKind::ExpectedMoreValues,
                              "command \"" + cmd.name() + "\" expects " + std::to_string(cmd.values_.size()) +
                                  " values, but only received " + std::to_string(filled) + " (missing \"" + v.name() +
                                  "\")",
                              {},
                              v.name()));
        }
    }

    if (options_.subCmdsMandatory.value_or(cmd.subCmdsMandatory()) && !cmd.activeSubCmd()) {
        const bool hasUserSubCmds = std::any_of(cmd.subCommands_.begin(), cmd.subCommands_.end(), [](const Command& c) {
            return !isReservedName(c.name());
        });
        if (hasUserSubCmds) {
            return fail(cmd,
                        Error(ErrorKind::ExpectedSubCommand,
                              "command \"" + cmd.name() + "\" requires a sub-command",
                              {},
                              cmd.name()));
        }
    }
    return std::nullopt;
}

Parser::TokenShape Parser::shapeOf(std::string_view token) const {
    const auto& opt = config_.option;
    if (options_.enableOptTermination && token == "--") return TokenShape::Terminator;
    if (opt.longPrefix && !opt.longPrefix->empty()) {
        const std::string_view prefix(*opt.longPrefix);
        if (token == prefix) return TokenShape::Plain;
        if (token.size() > prefix.size() && token.substr(0, prefix.size()) == prefix) return TokenShape::Long;
    }
    if (opt.shortPrefix && token.size() > 1 && token.front() == *opt.shortPrefix) return TokenShape::Short;
    return TokenShape::Plain;
}

bool Parser::isOptionShaped(std::string_view token) const {
    switch (shapeOf(token)) {
        case TokenShape::Terminator:
            return true;
        case TokenShape::Long:
        case TokenShape::Short:
            return !looksNumeric(token);
        case TokenShape::Plain:
            return false;
    }
    return false;
}

std::string Parser::shortDisplay(char c) const {
    std::string out;
    if (config_.option.shortPrefix) out += *config_.option.shortPrefix;
    out += c;
    return out;
}

std::string Parser::longDisplay(std::string_view name) const {
    return config_.option.longPrefix.value_or(std::string{}) + std::string(name);
}

// Exact long name first, then the first declared abbreviation match.
Option* Parser::findLong(Command& cmd, std::string_view name) const {
    for (auto& opt : cmd.options_) {
        if (opt.matchesLong(name)) return &opt;
    }
    if (!config_.option.allowAbbreviatedLongOpts) return nullptr;
    for (auto& opt : cmd.options_) {
        if (opt.matchesLongPrefix(name)) return &opt;
    }
    return nullptr;
}

Option* Parser::findShort(Command& cmd, char c) {
    for (auto& opt : cmd.options_) {
        if (opt.matchesShort(c)) return &opt;
    }
    return nullptr;
}

Error Parser::fail(const Command& cmd, Error err) const {
    if (!options_.silenceErrors) {
        auto& os = root_.err();
        os << "Error: " << err.message;
        if (err.message.empty() || err.message.back() != '\n') os << "\n";
        switch (options_.errReaction) {
            case ErrReaction::Usage:
                os << "\n";
                cmd.usage(os);
                break;
            case ErrReaction::Help:
                os << "\n";
                cmd.help(os);
                break;
            case ErrReaction::None:
                break;
        }
    }
    return err;
}

Error Parser::unknownOption(const Command& cmd,
                            std::string message,
                            std::string_view display,
                            const std::string& token) const {
    std::vector<std::string> candidates;
    for (const auto& opt : cmd.options()) {
        if (opt.longName() && config_.option.longPrefix) candidates.push_back(longDisplay(*opt.longName()));
        if (opt.shortName() && config_.option.shortPrefix) candidates.push_back(shortDisplay(*opt.shortName()));
    }
    message += didYouMean(utils::suggest(display, candidates));
    return fail(cmd, Error(ErrorKind::UnknownOption, std::move(message), token, cmd.name()));
}

Error Parser::unexpectedArgument(const Command& cmd, const std::string& token) const {
    std::vector<std::string> candidates;
    for (const auto& sub : cmd.subCommands()) candidates.push_back(sub.name());
    std::string message = candidates.empty()
                              ? "unexpected argument \"" + token + "\" for \"" + cmd.name() + "\""
                              : "unknown command \"" + token + "\" for \"" + cmd.name() + "\"";
    message += didYouMean(utils::suggest(token, candidates));
    return fail(cmd, Error(ErrorKind::UnexpectedArgument, std::move(message), token, cmd.name()));
}

} // namespace argtree
