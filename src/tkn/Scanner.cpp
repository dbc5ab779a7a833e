#include <tkn/Scanner.hpp>

#include <rubr/mss.hpp>

#include <array>
#include <utility>

namespace tkn {

    struct Table
    {
        std::array<CharClass, 256> klass;
        std::array<Kind, 256> punct;
        Table()
        {
            for (auto &cls : klass)
                cls = CharClass::Invalid;
            for (auto &kind : punct)
                kind = Kind::EndOfInput;

            klass[' '] = CharClass::Space;
            klass['\t'] = CharClass::Space;
            klass['\r'] = CharClass::Space;
            klass['\n'] = CharClass::Newline;
            for (char ch = 'a'; ch <= 'z'; ++ch)
                klass[ch] = CharClass::Letter;
            for (char ch = 'A'; ch <= 'Z'; ++ch)
                klass[ch] = CharClass::Letter;
            for (char ch = '0'; ch <= '9'; ++ch)
                klass[ch] = CharClass::Digit;
            klass['_'] = CharClass::Underscore;

            auto add_punct = [&](char ch, Kind kind) {
                klass[ch] = CharClass::Punct;
                punct[ch] = kind;
            };
            add_punct('+', Kind::Plus);
            add_punct('-', Kind::Minus);
            add_punct('*', Kind::Star);
            add_punct('/', Kind::Slash);
            add_punct('=', Kind::Assign);
            add_punct(';', Kind::Semicolon);
            add_punct('(', Kind::LParen);
            add_punct(')', Kind::RParen);
            add_punct('{', Kind::LBrace);
            add_punct('}', Kind::RBrace);
            add_punct(',', Kind::Comma);
        }
    };
    static const Table s_table;

    CharClass char_class(char ch)
    {
        return s_table.klass[static_cast<unsigned char>(ch)];
    }

    static bool is_space(char ch)
    {
        const auto cls = char_class(ch);
        return cls == CharClass::Space || cls == CharClass::Newline;
    }

    static bool is_word(char ch)
    {
        switch (char_class(ch))
        {
            case CharClass::Letter:
            case CharClass::Digit:
            case CharClass::Underscore:
                return true;
            default:
                return false;
        }
    }

    void Scanner::reset()
    {
        ix_ = 0;
        pos_ = str::Position{};
        error_.reset();
    }

    ReturnCode Scanner::next(Token &token)
    {
        skip_();

        const auto begin = ix_;
        const auto pos = pos_;

        if (ix_ >= content_.size())
        {
            token = make_token_(Kind::EndOfInput, begin, pos);
            return ReturnCode::Ok;
        }

        const char ch = content_[ix_];
        switch (char_class(ch))
        {
            case CharClass::Letter:
            {
                // Keywords only match the complete run: `jz1` is an Identifier
                while (ix_ < content_.size() && is_word(content_[ix_]))
                    advance_();
                const auto kind = keyword(std::string_view{content_}.substr(begin, ix_ - begin));
                token = make_token_(kind.value_or(Kind::Identifier), begin, pos);
                return ReturnCode::Ok;
            }

            case CharClass::Digit:
                while (ix_ < content_.size() && char_class(content_[ix_]) == CharClass::Digit)
                    advance_();
                token = make_token_(Kind::Number, begin, pos);
                return ReturnCode::Ok;

            case CharClass::Punct:
                advance_();
                token = make_token_(s_table.punct[static_cast<unsigned char>(ch)], begin, pos);
                return ReturnCode::Ok;

            default:
                break;
        }

        advance_();
        error_ = ScanError{.ch = ch, .pos = pos};
        return ReturnCode::InvalidCharacter;
    }

    ReturnCode Scanner::scan()
    {
        MSS_BEGIN(ReturnCode);

        reset();
        tokens_.resize(0);

        for (bool done = false; !done;)
        {
            Token token;
            MSS(next(token));
            done = token.kind == Kind::EndOfInput;
            tokens_.push_back(std::move(token));
        }

        MSS_END();
    }

    // Privates
    char Scanner::peek_(std::size_t offset) const
    {
        const auto ix = ix_ + offset;
        return ix < content_.size() ? content_[ix] : '\0';
    }

    void Scanner::advance_()
    {
        if (content_[ix_] == '\n')
        {
            ++pos_.line;
            pos_.column = 1;
        }
        else
            ++pos_.column;
        ++ix_;
    }

    void Scanner::skip_()
    {
        while (true)
        {
            while (ix_ < content_.size() && is_space(content_[ix_]))
                advance_();

            if (peek_(0) != '/' || peek_(1) != '/')
                break;

            // Comment runs up to, not including, the newline
            while (ix_ < content_.size() && content_[ix_] != '\n')
                advance_();
        }
    }

    Token Scanner::make_token_(Kind kind, std::size_t begin, const str::Position &pos) const
    {
        Token token;
        token.kind = kind;
        token.lexeme = content_.substr(begin, ix_ - begin);
        token.range = str::Range{.ix = static_cast<std::uint32_t>(begin), .size = static_cast<std::uint32_t>(ix_ - begin)};
        token.pos = pos;
        return token;
    }

} // namespace tkn
