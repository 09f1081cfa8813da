#include <cstdint>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include <gtest/gtest.h>

#include "argtree/command.hpp"
#include "argtree/parser.hpp"

using argtree::Command;
using argtree::Config;
using argtree::Error;
using argtree::ErrorCategory;
using argtree::ErrorKind;
using argtree::Option;
using argtree::ParseConfig;
using argtree::SetBehavior;
using argtree::TypedValue;

namespace {

Command initOrFail(const Command& schema, const Config& config = {}) {
    auto result = schema.init(config);
    if (auto* err = std::get_if<Error>(&result)) {
        ADD_FAILURE() << "init failed: " << *err;
        return schema;
    }
    return std::get<Command>(std::move(result));
}

ParseConfig quiet() {
    ParseConfig cfg;
    cfg.silenceErrors = true;
    cfg.autoHandleUsageHelp = false;
    return cfg;
}

// app [-v|--verbose] [-n|--level int32] [-I|--include string...]
Command flagsSchema() {
    Command app("app", "Flag playground");
    app.withOption(Option("verbose").setShortName('v').setLongName("verbose"));
    app.withOption(Option("all").setShortName('a').setLongName("all"));
    app.withOption(Option("brief").setShortName('b'));
    app.withOption(Option("level").setShortName('n').setLongName("level").setValue(TypedValue<std::int32_t>("n")));
    app.withOption(Option("include").setShortName('I').setLongName("include").setValue(
        TypedValue<std::string>("dir").setBehavior(SetBehavior::Multi).setMaxArgs(4)));
    app.setValsMandatory(false).setSubCmdsMandatory(false);
    return app;
}

// app [-v] build [-t|--target string=x86_64] [--jobs uint8] <mode>
Command buildSchema() {
    Command build("build", "Build the project");
    build.withOption(Option("target")
                         .setShortName('t')
                         .setLongName("target")
                         .setValue(TypedValue<std::string>("arch").setDefault("x86_64")));
    build.withOption(Option("jobs").setLongName("jobs").setValue(TypedValue<std::uint8_t>("count")));
    build.withValue(TypedValue<std::string>("mode", "debug or release"));

    Command app("app", "Sample application");
    app.withOption(Option("verbose").setShortName('v').setLongName("verbose"));
    app.addCommand(std::move(build));
    return app;
}

Error expectError(Command& cmd, std::vector<std::string> args, const ParseConfig& cfg = quiet()) {
    auto err = cmd.parse(args, cfg);
    if (!err) {
        ADD_FAILURE() << "parse unexpectedly succeeded";
        return Error();
    }
    return *err;
}

} // namespace

TEST(Parser, ParsesSubCommandOptionAndValue) {
    auto app = initOrFail(buildSchema());
    ASSERT_FALSE(app.parse(std::vector<std::string>{"build", "--target", "arm64", "release"}, quiet()));

    ASSERT_TRUE(app.checkSubCmd("build"));
    const auto* build = app.matchSubCmd("build");
    ASSERT_NE(build, nullptr);
    EXPECT_EQ(build->option("target")->getAs<std::string>(), "arm64");
    EXPECT_EQ(build->value("mode")->getAs<std::string>(), "release");
    EXPECT_FALSE(app.checkFlag("verbose"));
}

TEST(Parser, DefaultsFillUnsetOptions) {
    auto app = initOrFail(buildSchema());
    ASSERT_FALSE(app.parse(std::vector<std::string>{"-v", "build", "debug"}, quiet()));
    EXPECT_TRUE(app.checkFlag("verbose"));
    const auto* build = app.matchSubCmd("build");
    ASSERT_NE(build, nullptr);
    EXPECT_EQ(build->option("target")->getAs<std::string>(), "x86_64");
    EXPECT_FALSE(build->option("target")->isSet());
    EXPECT_FALSE(build->option("jobs")->getAs<std::uint8_t>());
}

TEST(Parser, SubCommandConsumesRemainingTokens) {
    auto app = initOrFail(buildSchema());
    // Parent options are not visible inside the sub-command.
    const auto err = expectError(app, {"build", "debug", "--verbose"});
    EXPECT_EQ(err.kind, ErrorKind::UnknownOption);
    EXPECT_EQ(err.argument, "build");
}

TEST(Parser, ArgvEntrySkipsExecutableName) {
    auto app = initOrFail(flagsSchema());
    std::vector<std::string> storage{"/usr/bin/app", "-v"};
    std::vector<char*> argv;
    for (auto& s : storage) argv.push_back(s.data());

    ASSERT_FALSE(app.parse(static_cast<int>(argv.size()), argv.data(), quiet()));
    EXPECT_TRUE(app.checkFlag("verbose"));
}

TEST(Parser, ArgvEntryCanKeepExecutableName) {
    Command schema("app");
    schema.withValue(TypedValue<std::string>("first"));
    auto app = initOrFail(schema);

    std::vector<std::string> storage{"prog"};
    std::vector<char*> argv;
    for (auto& s : storage) argv.push_back(s.data());

    auto cfg = quiet();
    cfg.skipExeName = false;
    ASSERT_FALSE(app.parse(static_cast<int>(argv.size()), argv.data(), cfg));
    EXPECT_EQ(app.value("first")->getAs<std::string>(), "prog");
}

TEST(Parser, AbbreviatedLongOption) {
    auto app = initOrFail(flagsSchema());
    ASSERT_FALSE(app.parse(std::vector<std::string>{"--verb"}, quiet()));
    EXPECT_TRUE(app.checkFlag("verbose"));
}

TEST(Parser, ExactLongNameBeatsEarlierAbbreviation) {
    Command schema("app");
    schema.withOption(Option("verbose").setLongName("verbose"));
    schema.withOption(Option("verb").setLongName("verb"));
    auto app = initOrFail(schema);
    ASSERT_FALSE(app.parse(std::vector<std::string>{"--verb"}, quiet()));
    EXPECT_TRUE(app.checkFlag("verb"));
    EXPECT_FALSE(app.checkFlag("verbose"));
}

TEST(Parser, FirstDeclaredAbbreviationWins) {
    Command schema("app");
    schema.withOption(Option("verbose").setLongName("verbose"));
    schema.withOption(Option("version").setLongName("version"));
    auto app = initOrFail(schema);
    ASSERT_FALSE(app.parse(std::vector<std::string>{"--ver"}, quiet()));
    EXPECT_TRUE(app.checkFlag("verbose"));
    EXPECT_FALSE(app.checkFlag("version"));
}

TEST(Parser, AbbreviationCanBeDisabled) {
    Config config;
    config.option.allowAbbreviatedLongOpts = false;
    auto app = initOrFail(flagsSchema(), config);
    const auto err = expectError(app, {"--verb"});
    EXPECT_EQ(err.kind, ErrorKind::UnknownOption);
}

TEST(Parser, ChainedShortFlags) {
    auto app = initOrFail(flagsSchema());
    ASSERT_FALSE(app.parse(std::vector<std::string>{"-vab"}, quiet()));
    EXPECT_TRUE(app.checkFlag("verbose"));
    EXPECT_TRUE(app.checkFlag("all"));
    EXPECT_TRUE(app.checkFlag("brief"));
}

TEST(Parser, ChainEndingInValueOption) {
    auto fused = initOrFail(flagsSchema());
    ASSERT_FALSE(fused.parse(std::vector<std::string>{"-vn5"}, quiet()));
    EXPECT_TRUE(fused.checkFlag("verbose"));
    EXPECT_EQ(fused.option("level")->getAs<std::int32_t>(), 5);

    auto spaced = initOrFail(flagsSchema());
    ASSERT_FALSE(spaced.parse(std::vector<std::string>{"-an", "7"}, quiet()));
    EXPECT_TRUE(spaced.checkFlag("all"));
    EXPECT_EQ(spaced.option("level")->getAs<std::int32_t>(), 7);
}

TEST(Parser, OptionValueSeparators) {
    auto app = initOrFail(flagsSchema());
    ASSERT_FALSE(app.parse(std::vector<std::string>{"--level=12"}, quiet()));
    EXPECT_EQ(app.option("level")->getAs<std::int32_t>(), 12);

    auto shortSep = initOrFail(flagsSchema());
    ASSERT_FALSE(shortSep.parse(std::vector<std::string>{"-n=3"}, quiet()));
    EXPECT_EQ(shortSep.option("level")->getAs<std::int32_t>(), 3);
}

TEST(Parser, FusedShortValueCanBeDisabled) {
    Config config;
    config.option.allowOptValNoSpace = false;
    auto app = initOrFail(flagsSchema(), config);
    const auto err = expectError(app, {"-n5"});
    EXPECT_EQ(err.kind, ErrorKind::EmptyArgumentProvidedToOption);
}

TEST(Parser, BoolOptionRejectsInlineArgument) {
    auto app = initOrFail(flagsSchema());
    const auto err = expectError(app, {"--verbose=true"});
    EXPECT_EQ(err.kind, ErrorKind::BoolCannotTakeArgument);
    EXPECT_EQ(err.category(), ErrorCategory::Arity);
    EXPECT_EQ(err.argument, "verbose");
}

TEST(Parser, BoolOptionDoesNotConsumeNextToken) {
    Command schema("app");
    schema.withOption(Option("verbose").setShortName('v'));
    schema.withValue(TypedValue<std::string>("file"));
    auto app = initOrFail(schema);
    ASSERT_FALSE(app.parse(std::vector<std::string>{"-v", "false"}, quiet()));
    EXPECT_TRUE(app.checkFlag("verbose"));
    EXPECT_EQ(app.value("file")->getAs<std::string>(), "false");
}

TEST(Parser, ValueOptionNeedsArgument) {
    auto atEnd = initOrFail(flagsSchema());
    auto err = expectError(atEnd, {"--level"});
    EXPECT_EQ(err.kind, ErrorKind::EmptyArgumentProvidedToOption);
    EXPECT_EQ(err.message, "flag needs an argument: --level");

    auto beforeOption = initOrFail(flagsSchema());
    err = expectError(beforeOption, {"-n", "--verbose"});
    EXPECT_EQ(err.kind, ErrorKind::EmptyArgumentProvidedToOption);
    EXPECT_EQ(err.argument, "level");

    auto emptyInline = initOrFail(flagsSchema());
    err = expectError(emptyInline, {"--level="});
    EXPECT_EQ(err.kind, ErrorKind::EmptyArgumentProvidedToOption);
}

TEST(Parser, OptionArgumentParseFailure) {
    auto app = initOrFail(flagsSchema());
    const auto err = expectError(app, {"--level", "abc"});
    EXPECT_EQ(err.kind, ErrorKind::InvalidCharacter);
    EXPECT_EQ(err.category(), ErrorCategory::Parse);
    EXPECT_EQ(err.argument, "level");
    EXPECT_EQ(err.token, "abc");
}

TEST(Parser, RepeatedOptionFollowsSetBehavior) {
    auto app = initOrFail(flagsSchema());
    ASSERT_FALSE(app.parse(std::vector<std::string>{"-n", "1", "-n", "2", "-I", "a", "--include", "b", "-Ic"},
                           quiet()));
    EXPECT_EQ(app.option("level")->getAs<std::int32_t>(), 2);
    EXPECT_EQ(app.option("include")->getAllAs<std::string>(), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(Parser, MultiOptionOverflowIsAnError) {
    Command schema("app");
    schema.withOption(Option("num").setShortName('x').setValue(
        TypedValue<std::int32_t>("nums").setBehavior(SetBehavior::Multi).setMaxArgs(2)));
    auto app = initOrFail(schema);
    const auto err = expectError(app, {"-x", "1,2,3"});
    EXPECT_EQ(err.kind, ErrorKind::ValueMaxed);
    EXPECT_FALSE(app.option("num")->isSet());
}

TEST(Parser, UnknownLongOptionSuggestsCloseName) {
    auto app = initOrFail(flagsSchema());
    const auto err = expectError(app, {"--vrebose"});
    EXPECT_EQ(err.kind, ErrorKind::UnknownOption);
    EXPECT_EQ(err.category(), ErrorCategory::Classification);
    EXPECT_EQ(err.token, "--vrebose");
    EXPECT_NE(err.message.find("unknown flag: --vrebose"), std::string::npos);
    EXPECT_NE(err.message.find("Did you mean this?\n  --verbose\n"), std::string::npos);
}

TEST(Parser, UnknownShortOption) {
    auto app = initOrFail(flagsSchema());
    const auto err = expectError(app, {"-vz"});
    EXPECT_EQ(err.kind, ErrorKind::UnknownOption);
    EXPECT_NE(err.message.find("unknown shorthand flag: 'z' in -vz"), std::string::npos);
}

TEST(Parser, FillsValuesInOrder) {
    Command schema("cp");
    schema.withValue(TypedValue<std::string>("files").setBehavior(SetBehavior::Multi).setMaxArgs(3));
    schema.withValue(TypedValue<std::string>("dest"));
    auto cp = initOrFail(schema);
    ASSERT_FALSE(cp.parse(std::vector<std::string>{"a", "b", "c", "out"}, quiet()));
    EXPECT_EQ(cp.value("files")->getAllAs<std::string>(), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(cp.value("dest")->getAs<std::string>(), "out");
}

TEST(Parser, WideLastValueKeepsLatestPositional) {
    Command schema("app");
    schema.withValue(TypedValue<std::string>("target").setBehavior(SetBehavior::Last).setMaxArgs(2));
    auto app = initOrFail(schema);
    ASSERT_FALSE(app.parse(std::vector<std::string>{"a", "b", "c"}, quiet()));
    EXPECT_EQ(app.value("target")->getAs<std::string>(), "c");
    EXPECT_EQ(app.value("target")->argIdx(), 1u);
}

TEST(Parser, TooManyValues) {
    Command schema("app");
    schema.withValue(TypedValue<std::string>("file"));
    auto app = initOrFail(schema);
    const auto err = expectError(app, {"one", "two"});
    EXPECT_EQ(err.kind, ErrorKind::TooManyValues);
    EXPECT_EQ(err.token, "two");
    EXPECT_EQ(app.value("file")->getAs<std::string>(), "one");
}

TEST(Parser, UnexpectedArgumentWithoutValues) {
    Command schema("app");
    schema.withOption(Option("verbose").setShortName('v'));
    auto app = initOrFail(schema);
    const auto err = expectError(app, {"stray"});
    EXPECT_EQ(err.kind, ErrorKind::UnexpectedArgument);
    EXPECT_EQ(err.category(), ErrorCategory::Classification);
}

TEST(Parser, UnknownCommandSuggestsSubCommand) {
    auto app = initOrFail(buildSchema());
    const auto err = expectError(app, {"biuld"});
    EXPECT_EQ(err.kind, ErrorKind::UnexpectedArgument);
    EXPECT_NE(err.message.find("unknown command \"biuld\" for \"app\""), std::string::npos);
    EXPECT_NE(err.message.find("Did you mean this?\n  build\n"), std::string::npos);
}

TEST(Parser, MissingValueIsAnArityError) {
    Command schema("app");
    schema.withValue(TypedValue<std::string>("src"));
    schema.withValue(TypedValue<std::string>("dst"));
    auto app = initOrFail(schema);
    const auto err = expectError(app, {"a"});
    EXPECT_EQ(err.kind, ErrorKind::ExpectedMoreValues);
    EXPECT_EQ(err.category(), ErrorCategory::Arity);
    EXPECT_EQ(err.argument, "dst");
}

TEST(Parser, DefaultSatisfiesMandatoryValue) {
    Command schema("app");
    schema.withValue(TypedValue<std::string>("file").setDefault("-"));
    auto app = initOrFail(schema);
    ASSERT_FALSE(app.parse(std::vector<std::string>{}, quiet()));
    EXPECT_EQ(app.value("file")->getAs<std::string>(), "-");
}

TEST(Parser, MandatoryChecksCanBeOverridden) {
    Command schema("app");
    schema.withValue(TypedValue<std::string>("file"));
    auto app = initOrFail(schema);
    auto cfg = quiet();
    cfg.valsMandatory = false;
    ASSERT_FALSE(app.parse(std::vector<std::string>{}, cfg));
    EXPECT_FALSE(app.value("file")->isSet());
}

TEST(Parser, MissingSubCommand) {
    auto app = initOrFail(buildSchema());
    const auto err = expectError(app, {"-v"});
    EXPECT_EQ(err.kind, ErrorKind::ExpectedSubCommand);
    EXPECT_EQ(err.argument, "app");

    auto relaxed = initOrFail(buildSchema());
    auto cfg = quiet();
    cfg.subCmdsMandatory = false;
    EXPECT_FALSE(relaxed.parse(std::vector<std::string>{"-v"}, cfg));
}

TEST(Parser, NestedMandatoryValueIsChecked) {
    auto app = initOrFail(buildSchema());
    const auto err = expectError(app, {"build", "--target", "arm64"});
    EXPECT_EQ(err.kind, ErrorKind::ExpectedMoreValues);
    EXPECT_EQ(err.argument, "mode");
}

TEST(Parser, HelpRequestSkipsMandatoryChecks) {
    auto app = initOrFail(buildSchema());
    std::ostringstream out;
    app.setOut(out);

    ParseConfig cfg;
    cfg.silenceErrors = true;
    cfg.skipExeName = false;
    argtree::Parser parser(app, cfg);
    ASSERT_FALSE(parser.parse(std::vector<std::string>{"build", "--help"}));
    EXPECT_TRUE(parser.usageHelpCalled());
    EXPECT_NE(out.str().find("COMMAND: build"), std::string::npos);
}

TEST(Parser, HelpSubCommandPrintsParentHelpOnce) {
    auto app = initOrFail(buildSchema());
    std::ostringstream out;
    app.setOut(out);

    ParseConfig cfg;
    cfg.silenceErrors = true;
    ASSERT_FALSE(app.parse(std::vector<std::string>{"help"}, cfg));
    const auto text = out.str();
    const auto first = text.find("COMMAND: app");
    ASSERT_NE(first, std::string::npos);
    EXPECT_EQ(text.find("COMMAND: app", first + 1), std::string::npos);
}

TEST(Parser, UsageOptionPrintsUsageOnly) {
    auto app = initOrFail(buildSchema());
    std::ostringstream out;
    app.setOut(out);

    ParseConfig cfg;
    cfg.silenceErrors = true;
    ASSERT_FALSE(app.parse(std::vector<std::string>{"-u"}, cfg));
    EXPECT_EQ(out.str().rfind("USAGE: app ", 0), 0u);
    EXPECT_EQ(out.str().find("HELP:"), std::string::npos);
}

TEST(Parser, HelpIsNotPrintedWhenAutoHandlingIsOff) {
    auto app = initOrFail(buildSchema());
    std::ostringstream out;
    app.setOut(out);

    ASSERT_FALSE(app.parse(std::vector<std::string>{"--help"}, quiet()));
    EXPECT_TRUE(out.str().empty());
    EXPECT_TRUE(app.checkFlag("help"));
}

TEST(Parser, TerminatorSendsRestToValues) {
    Command schema("app");
    schema.withOption(Option("verbose").setShortName('v'));
    schema.withValue(TypedValue<std::string>("args").setBehavior(SetBehavior::Multi).setMaxArgs(3));
    auto app = initOrFail(schema);
    ASSERT_FALSE(app.parse(std::vector<std::string>{"--", "-v", "--help"}, quiet()));
    EXPECT_FALSE(app.checkFlag("verbose"));
    EXPECT_EQ(app.value("args")->getAllAs<std::string>(), (std::vector<std::string>{"-v", "--help"}));
}

TEST(Parser, NegativeNumbersArePositional) {
    Command schema("calc");
    schema.withOption(Option("offset").setLongName("offset").setValue(TypedValue<std::int32_t>("n")));
    schema.withValue(TypedValue<std::int32_t>("lhs"));
    schema.withValue(TypedValue<double>("rhs"));
    auto calc = initOrFail(schema);
    ASSERT_FALSE(calc.parse(std::vector<std::string>{"-5", "--offset", "-3", "-0.25"}, quiet()));
    EXPECT_EQ(calc.value("lhs")->getAs<std::int32_t>(), -5);
    EXPECT_EQ(calc.option("offset")->getAs<std::int32_t>(), -3);
    EXPECT_DOUBLE_EQ(*calc.value("rhs")->getAs<double>(), -0.25);
}

TEST(Parser, CustomPrefixes) {
    Config config;
    config.option.shortPrefix = '/';
    config.option.longPrefix = std::string("//");
    auto app = initOrFail(flagsSchema(), config);
    ASSERT_FALSE(app.parse(std::vector<std::string>{"//verbose", "/n", "4"}, quiet()));
    EXPECT_TRUE(app.checkFlag("verbose"));
    EXPECT_EQ(app.option("level")->getAs<std::int32_t>(), 4);
}

TEST(Parser, SingleDashLongPrefixKeepsShortOptions) {
    Config config;
    config.option.longPrefix = std::string("-");

    Command schema("app");
    schema.withOption(Option("extract").setShortName('x'));
    schema.withOption(Option("zip").setShortName('z'));
    schema.withOption(Option("verbose").setLongName("verbose"));
    schema.withOption(Option("level").setShortName('n').setValue(TypedValue<std::int32_t>("n")));
    schema.withValue(TypedValue<std::int32_t>("count"));

    auto shortOnly = initOrFail(schema, config);
    ASSERT_FALSE(shortOnly.parse(std::vector<std::string>{"-x", "1"}, quiet()));
    EXPECT_TRUE(shortOnly.checkFlag("extract"));
    EXPECT_FALSE(shortOnly.checkFlag("verbose"));

    auto mixed = initOrFail(schema, config);
    ASSERT_FALSE(mixed.parse(std::vector<std::string>{"-verbose", "-xz", "-n", "-4", "-7"}, quiet()));
    EXPECT_TRUE(mixed.checkFlag("verbose"));
    EXPECT_TRUE(mixed.checkFlag("extract"));
    EXPECT_TRUE(mixed.checkFlag("zip"));
    EXPECT_EQ(mixed.option("level")->getAs<std::int32_t>(), -4);
    EXPECT_EQ(mixed.value("count")->getAs<std::int32_t>(), -7);

    auto unknown = initOrFail(schema, config);
    const auto err = expectError(unknown, {"-quiet"});
    EXPECT_EQ(err.kind, ErrorKind::UnknownOption);
    EXPECT_NE(err.message.find("unknown flag: -quiet"), std::string::npos);
}

TEST(Parser, ErrorsGoToErrStreamWithUsage) {
    auto app = initOrFail(flagsSchema());
    std::ostringstream err;
    app.setErr(err);

    ParseConfig cfg;
    ASSERT_TRUE(app.parse(std::vector<std::string>{"--nope"}, cfg));
    const auto text = err.str();
    EXPECT_EQ(text.rfind("Error: unknown flag: --nope\n", 0), 0u);
    EXPECT_NE(text.find("USAGE: app "), std::string::npos);
}

TEST(Parser, ErrorReactionNoneWritesMessageOnly) {
    auto app = initOrFail(flagsSchema());
    std::ostringstream err;
    app.setErr(err);

    ParseConfig cfg;
    cfg.errReaction = argtree::ErrReaction::None;
    ASSERT_TRUE(app.parse(std::vector<std::string>{"--level", "x"}, cfg));
    EXPECT_EQ(err.str().rfind("Error: invalid argument \"x\" for \"n\"", 0), 0u);
    EXPECT_EQ(err.str().find("USAGE:"), std::string::npos);
}

TEST(Parser, SilencedErrorsWriteNothing) {
    auto app = initOrFail(flagsSchema());
    std::ostringstream err;
    app.setErr(err);
    ASSERT_TRUE(app.parse(std::vector<std::string>{"--nope"}, quiet()));
    EXPECT_TRUE(err.str().empty());
}

TEST(TokenStream, PeekAndNext) {
    argtree::TokenStream tokens(std::vector<std::string>{"a", "b"});
    EXPECT_EQ(tokens.size(), 2u);
    ASSERT_NE(tokens.peek(), nullptr);
    EXPECT_EQ(*tokens.peek(), "a");
    EXPECT_EQ(tokens.next(), "a");
    EXPECT_EQ(tokens.index(), 1u);
    EXPECT_EQ(tokens.next(), "b");
    EXPECT_TRUE(tokens.done());
    EXPECT_EQ(tokens.peek(), nullptr);
    EXPECT_FALSE(tokens.next());
}
