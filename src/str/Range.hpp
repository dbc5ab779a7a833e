#ifndef HEADER_str_Range_hpp_ALREADY_INCLUDED
#define HEADER_str_Range_hpp_ALREADY_INCLUDED

#include <cstdint>
#include <string_view>

namespace str {

    // Byte span into a source buffer
    struct Range
    {
        std::uint32_t ix{};
        std::uint32_t size{};

        std::string_view sv(const std::string_view &sv) const { return sv.substr(ix, size); }

        bool operator==(const Range &) const = default;
    };

} // namespace str

#endif
