#include <cli/Options.hpp>

#include <catch2/catch_test_macros.hpp>

#include <vector>

namespace {

    ReturnCode parse(cli::Options &options, std::vector<const char *> args)
    {
        args.insert(args.begin(), "spindle");
        return options.parse(static_cast<int>(args.size()), args.data());
    }

} // namespace

TEST_CASE("Options defaults", "[ut][cli][Options]")
{
    cli::Options options;
    REQUIRE(parse(options, {}) == ReturnCode::Ok);
    REQUIRE(options.exe_name == "spindle");
    REQUIRE(!options.print_help);
    REQUIRE(options.verbose == 0);
    REQUIRE(!options.keep_going);
    REQUIRE(!options.preprocess);
    REQUIRE(!options.quiet);
    REQUIRE(!options.input);
}

TEST_CASE("Options flags", "[ut][cli][Options]")
{
    cli::Options options;
    REQUIRE(parse(options, {"-k", "--preprocess", "-v", "2", "prog.sp", "-q"}) == ReturnCode::Ok);
    REQUIRE(options.keep_going);
    REQUIRE(options.preprocess);
    REQUIRE(options.quiet);
    REQUIRE(options.verbose == 2);
    REQUIRE(options.input == "prog.sp");

    REQUIRE(options.help().find("--keep-going") != std::string::npos);
}

TEST_CASE("Options errors", "[ut][cli][Options]")
{
    cli::Options options;

    SECTION("unknown flag")
    {
        REQUIRE(parse(options, {"--frobnicate"}) == ReturnCode::UnknownArgument);
    }
    SECTION("second input")
    {
        REQUIRE(parse(options, {"a.sp", "b.sp"}) == ReturnCode::UnknownArgument);
    }
    SECTION("bad verbosity")
    {
        REQUIRE(parse(options, {"-v", "loud"}) != ReturnCode::Ok);
    }
    SECTION("missing verbosity")
    {
        REQUIRE(parse(options, {"--verbose"}) != ReturnCode::Ok);
    }
}
