#ifndef ARGTREE_PARSER_HPP
#define ARGTREE_PARSER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "command.hpp"
#include "config.hpp"
#include "error.hpp"

namespace argtree {

// Peekable, left-to-right source of raw argument tokens.
class TokenStream {
public:
    TokenStream() = default;
    explicit TokenStream(std::vector<std::string> tokens) : tokens_(std::move(tokens)) {}
    TokenStream(int argc, char** argv) {
        for (int i = 0; i < argc; ++i) tokens_.emplace_back(argv[i]);
    }

    [[nodiscard]] const std::string* peek() const { return done() ? nullptr : &tokens_[pos_]; }
    std::optional<std::string> next() {
        if (done()) return std::nullopt;
        return tokens_[pos_++];
    }
    [[nodiscard]] bool done() const { return pos_ >= tokens_.size(); }
    [[nodiscard]] std::size_t index() const { return pos_; }
    [[nodiscard]] std::size_t size() const { return tokens_.size(); }

private:
    std::vector<std::string> tokens_;
    std::size_t pos_{0};
};

// Single forward pass over a TokenStream against an initialized Command
// tree. Mutates Option/Value storage and active sub-commands in place.
class Parser {
public:
    explicit Parser(Command& root, ParseConfig options = {});

    std::optional<Error> parse(TokenStream& tokens);
    std::optional<Error> parse(std::vector<std::string> tokens);

    // Set once usage or help was rendered by autoHandleUsageHelp.
    [[nodiscard]] bool usageHelpCalled() const { return usageHelpCalled_; }

private:
    enum class TokenShape {
        Long,
        Short,
        Terminator,
        Plain,
    };

    std::optional<Error> parseContext(Command& cmd, TokenStream& tokens);
    // Falls back to parseShort when no long name matches and the token also
    // carries the short prefix (e.g. both prefixes set to "-").
    std::optional<Error> parseLong(Command& cmd,
                                   std::string_view body,
                                   const std::string& token,
                                   TokenStream& tokens,
                                   bool& matched);
    // `matched` is false when the first character is no known short name and
    // the token should be treated as a positional argument instead.
    std::optional<Error> parseShort(Command& cmd,
                                    std::string_view body,
                                    const std::string& token,
                                    TokenStream& tokens,
                                    bool& matched);
    std::optional<Error> parseOptionArg(Command& cmd, Option& opt, const std::string& display, TokenStream& tokens);
    std::optional<Error> setPositional(Command& cmd, const std::string& token, std::size_t& valIdx);
    std::optional<Error> checkMandatory(Command& cmd);

    [[nodiscard]] TokenShape shapeOf(std::string_view token) const;
    [[nodiscard]] bool isOptionShaped(std::string_view token) const;
    [[nodiscard]] std::string shortDisplay(char c) const;
    [[nodiscard]] std::string longDisplay(std::string_view name) const;
    Option* findLong(Command& cmd, std::string_view name) const;
    static Option* findShort(Command& cmd, char c);

    Error fail(const Command& cmd, Error err) const;
    Error unknownOption(const Command& cmd, std::string message, std::string_view display, const std::string& token) const;
    Error unexpectedArgument(const Command& cmd, const std::string& token) const;

    Command& root_;
    const Config& config_;
    ParseConfig options_;
    bool usageHelpCalled_{false};
    bool usageHelpRequested_{false};
};

} // namespace argtree

#endif // ARGTREE_PARSER_HPP
