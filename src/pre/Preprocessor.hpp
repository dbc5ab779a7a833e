#ifndef HEADER_pre_Preprocessor_hpp_ALREADY_INCLUDED
#define HEADER_pre_Preprocessor_hpp_ALREADY_INCLUDED

#include <ReturnCode.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pre {

    // Line-based text substitution that runs before scanning:
    // * `#define NAME VALUE` replaces NAME with VALUE in all subsequent lines
    // * `#include "path"` inlines a file, resolved relative to the including file
    // Each included file is processed with its own, empty, macro table.
    class Preprocessor
    {
    public:
        static constexpr unsigned int MaxDepth = 16;

        // fp is the location of content, empty when it did not come from a file
        ReturnCode process(std::string &output, std::string_view content, const std::filesystem::path &fp = {}) const;

    private:
        using Macros = std::vector<std::pair<std::string, std::string>>;

        ReturnCode process_(std::string &output, std::string_view content, const std::filesystem::path &fp, unsigned int depth) const;
        ReturnCode include_(std::string &output, std::string_view arg, const std::filesystem::path &fp, unsigned int depth) const;
    };

    std::string_view trim(std::string_view sv);

    void replace_all(std::string &str, std::string_view needle, std::string_view replacement);

} // namespace pre

#endif
