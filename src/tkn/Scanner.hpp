#ifndef HEADER_tkn_Scanner_hpp_ALREADY_INCLUDED
#define HEADER_tkn_Scanner_hpp_ALREADY_INCLUDED

#include <ReturnCode.hpp>
#include <tkn/Error.hpp>
#include <tkn/Token.hpp>

#include <rubr/mss.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tkn {

    enum class CharClass : std::uint8_t
    {
        Invalid,
        Space,
        Newline,
        Letter,
        Digit,
        Underscore,
        Punct,
    };

    CharClass char_class(char ch);

    // Scans one buffer into Tokens.
    // next() is a pull interface. Once EndOfInput is reached, it keeps returning EndOfInput at the same position.
    // scan() rewinds and collects everything up to and including EndOfInput, stopping at the first ScanError.
    // An instance must not be shared between threads.
    class Scanner
    {
    public:
        // Builder allows user to directly read data into content_
        template<typename Builder>
        ReturnCode init(Builder builder)
        {
            MSS_BEGIN(ReturnCode);
            content_.clear();
            MSS(builder(content_));
            reset();
            MSS_END();
        }

        std::string_view content() const { return content_; }

        // Rewinds the cursor to the start of content_
        void reset();

        // On ReturnCode::InvalidCharacter, error() describes the offending character and the cursor is already past it
        ReturnCode next(Token &token);

        ReturnCode scan();

        const Tokens &tokens() const { return tokens_; }
        const std::optional<ScanError> &error() const { return error_; }
        const str::Position &position() const { return pos_; }

    private:
        char peek_(std::size_t offset = 0) const;
        void advance_();
        void skip_();
        Token make_token_(Kind kind, std::size_t begin, const str::Position &pos) const;

        std::string content_;
        std::size_t ix_ = 0;
        str::Position pos_;
        Tokens tokens_;
        std::optional<ScanError> error_;
    };

} // namespace tkn

#endif
