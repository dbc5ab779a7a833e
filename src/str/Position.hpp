#ifndef HEADER_str_Position_hpp_ALREADY_INCLUDED
#define HEADER_str_Position_hpp_ALREADY_INCLUDED

#include <cstdint>
#include <ostream>

namespace str {

    // 1-based line and column
    struct Position
    {
        std::uint32_t line = 1;
        std::uint32_t column = 1;

        bool operator==(const Position &) const = default;
    };

    inline std::ostream &operator<<(std::ostream &os, const Position &pos)
    {
        return os << pos.line << ':' << pos.column;
    }

} // namespace str

#endif
