#include <tkn/Error.hpp>
#include <tkn/Token.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sstream>

TEST_CASE("keyword", "[ut][tkn][Token]")
{
    REQUIRE(tkn::keyword("fn") == tkn::Kind::Fn);
    REQUIRE(tkn::keyword("barrier") == tkn::Kind::Barrier);
    REQUIRE(tkn::keyword("jnz") == tkn::Kind::Jnz);
    REQUIRE(!tkn::keyword("jnz_"));
    REQUIRE(!tkn::keyword("Fn"));
    REQUIRE(!tkn::keyword(""));

    REQUIRE(tkn::is_keyword(tkn::Kind::Jump));
    REQUIRE(!tkn::is_keyword(tkn::Kind::Identifier));
    REQUIRE(!tkn::is_keyword(tkn::Kind::EndOfInput));
}

TEST_CASE("Token stream output", "[ut][tkn][Token]")
{
    std::ostringstream oss;

    SECTION("with lexeme")
    {
        oss << tkn::Token{.kind = tkn::Kind::Identifier, .lexeme = "foo", .range = {.ix = 4, .size = 3}, .pos = {.line = 2, .column = 3}};
        REQUIRE(oss.str() == "2:3 Identifier 'foo'");
    }
    SECTION("EndOfInput")
    {
        oss << tkn::Token{.kind = tkn::Kind::EndOfInput, .pos = {.line = 1, .column = 9}};
        REQUIRE(oss.str() == "1:9 EndOfInput");
    }
}

TEST_CASE("ScanError stream output", "[ut][tkn][Error]")
{
    std::ostringstream oss;

    SECTION("printable")
    {
        oss << tkn::ScanError{.ch = '@', .pos = {.line = 1, .column = 7}};
        REQUIRE(oss.str() == "1:7: error: invalid character '@'");
    }
    SECTION("non-printable")
    {
        oss << tkn::ScanError{.ch = '\x01', .pos = {.line = 3, .column = 1}} << ' ' << 10;
        REQUIRE(oss.str() == "3:1: error: invalid character '\\x01' 10");
    }
}
