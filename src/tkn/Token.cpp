#include <tkn/Token.hpp>

#include <array>
#include <utility>

namespace tkn {

    std::ostream &operator<<(std::ostream &os, Kind kind)
    {
        switch (kind)
        {
            case Kind::Identifier: os << "Identifier"; break;
            case Kind::Number: os << "Number"; break;
            case Kind::Plus: os << "Plus"; break;
            case Kind::Minus: os << "Minus"; break;
            case Kind::Star: os << "Star"; break;
            case Kind::Slash: os << "Slash"; break;
            case Kind::Assign: os << "Assign"; break;
            case Kind::Semicolon: os << "Semicolon"; break;
            case Kind::LParen: os << "LParen"; break;
            case Kind::RParen: os << "RParen"; break;
            case Kind::LBrace: os << "LBrace"; break;
            case Kind::RBrace: os << "RBrace"; break;
            case Kind::Comma: os << "Comma"; break;
            case Kind::Fn: os << "Fn"; break;
            case Kind::Spawn: os << "Spawn"; break;
            case Kind::Sync: os << "Sync"; break;
            case Kind::Barrier: os << "Barrier"; break;
            case Kind::Jump: os << "Jump"; break;
            case Kind::Jz: os << "Jz"; break;
            case Kind::Jnz: os << "Jnz"; break;
            case Kind::EndOfInput: os << "EndOfInput"; break;
        }
        return os;
    }

    static const std::array<std::pair<std::string_view, Kind>, 7> s_keywords{{
        {"fn", Kind::Fn},
        {"spawn", Kind::Spawn},
        {"sync", Kind::Sync},
        {"barrier", Kind::Barrier},
        {"jump", Kind::Jump},
        {"jz", Kind::Jz},
        {"jnz", Kind::Jnz},
    }};

    std::optional<Kind> keyword(std::string_view word)
    {
        for (const auto &[text, kind] : s_keywords)
            if (word == text)
                return kind;
        return std::nullopt;
    }

    bool is_keyword(Kind kind)
    {
        switch (kind)
        {
            case Kind::Fn:
            case Kind::Spawn:
            case Kind::Sync:
            case Kind::Barrier:
            case Kind::Jump:
            case Kind::Jz:
            case Kind::Jnz:
                return true;
            default:
                return false;
        }
    }

    std::ostream &operator<<(std::ostream &os, const Token &token)
    {
        os << token.pos << ' ' << token.kind;
        switch (token.kind)
        {
            case Kind::EndOfInput:
                break;
            default:
                os << " '" << token.lexeme << "'";
                break;
        }
        return os;
    }

} // namespace tkn
