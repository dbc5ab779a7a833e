#ifndef HEADER_cli_Options_hpp_ALREADY_INCLUDED
#define HEADER_cli_Options_hpp_ALREADY_INCLUDED

#include <ReturnCode.hpp>

#include <optional>
#include <string>

namespace cli {

    class Options
    {
    public:
        std::string exe_name;

        bool print_help = false;
        int verbose = 0;
        bool keep_going = false;
        bool preprocess = false;
        bool quiet = false;
        std::optional<std::string> input;

        ReturnCode parse(int argc, const char **argv);

        std::string help() const;
    };

} // namespace cli

#endif
