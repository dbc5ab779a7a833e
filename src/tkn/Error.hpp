#ifndef HEADER_tkn_Error_hpp_ALREADY_INCLUDED
#define HEADER_tkn_Error_hpp_ALREADY_INCLUDED

#include <str/Position.hpp>

#include <ostream>

namespace tkn {

    // Reported as ReturnCode::InvalidCharacter, the only way scanning can fail
    struct ScanError
    {
        char ch{};
        str::Position pos;

        bool operator==(const ScanError &) const = default;
    };

    // Writes `LINE:COL: error: invalid character 'c'`
    std::ostream &operator<<(std::ostream &os, const ScanError &error);

} // namespace tkn

#endif
