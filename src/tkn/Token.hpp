#ifndef HEADER_tkn_Token_hpp_ALREADY_INCLUDED
#define HEADER_tkn_Token_hpp_ALREADY_INCLUDED

#include <str/Position.hpp>
#include <str/Range.hpp>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace tkn {

    enum class Kind : std::uint8_t
    {
        Identifier,
        Number,

        Plus,
        Minus,
        Star,
        Slash,
        Assign,
        Semicolon,
        LParen,
        RParen,
        LBrace,
        RBrace,
        Comma,

        Fn,
        Spawn,
        Sync,
        Barrier,
        Jump,
        Jz,
        Jnz,

        EndOfInput,
    };
    std::ostream &operator<<(std::ostream &os, Kind kind);

    // Exact, case-sensitive match against the reserved words
    std::optional<Kind> keyword(std::string_view word);

    bool is_keyword(Kind kind);

    struct Token
    {
        Kind kind = Kind::EndOfInput;
        std::string lexeme;
        str::Range range;
        str::Position pos;

        bool operator==(const Token &) const = default;
    };
    std::ostream &operator<<(std::ostream &os, const Token &token);

    using Tokens = std::vector<Token>;

} // namespace tkn

#endif
