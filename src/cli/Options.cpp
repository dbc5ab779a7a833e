#include <cli/Options.hpp>

#include <rubr/cli/Range.hpp>
#include <rubr/mss.hpp>

#include <charconv>
#include <iostream>
#include <sstream>

namespace cli {

    ReturnCode Options::parse(int argc, const char **argv)
    {
        MSS_BEGIN(ReturnCode);

        rubr::cli::Range r{argc, argv};

        MSS(r.pop(exe_name));

        for (std::string arg; r.pop(arg);)
        {
            auto is = [&](const char *sh, const char *lh) {
                return arg == sh || arg == lh;
            };

            if (false) {}
            else if (is("-h", "--help"))
                print_help = true;
            else if (is("-v", "--verbose"))
            {
                std::string level;
                MSS(r.pop(level), std::cerr << "Expected a level after '" << arg << "'" << std::endl);
                const auto [ptr, ec] = std::from_chars(level.data(), level.data() + level.size(), verbose);
                MSS(ec == std::errc{} && ptr == level.data() + level.size(), std::cerr << "Invalid verbosity level '" << level << "'" << std::endl);
            }
            else if (is("-k", "--keep-going"))
                keep_going = true;
            else if (is("-E", "--preprocess"))
                preprocess = true;
            else if (is("-q", "--quiet"))
                quiet = true;
            else if (!arg.empty() && arg[0] != '-' && !input)
                input = arg;
            else
            {
                std::cerr << "Unknown CLI argument '" << arg << "'" << std::endl;
                return ReturnCode::UnknownArgument;
            }
        }

        MSS_END();
    }

    std::string Options::help() const
    {
        std::ostringstream oss;
        oss << "Help for '" << exe_name << "'" << std::endl;
        oss << exe_name << " Options [FILE]" << std::endl;
        oss << "Without FILE, lines from stdin are scanned one by one until 'exit'" << std::endl;
        oss << "Options" << std::endl;
        oss << "    -h  --help          Print this help" << std::endl;
        oss << "    -v  --verbose LEVEL Log level" << std::endl;
        oss << "    -k  --keep-going    Report all invalid characters, not only the first" << std::endl;
        oss << "    -E  --preprocess    Expand #define and #include before scanning" << std::endl;
        oss << "    -q  --quiet         Only print diagnostics" << std::endl;
        return oss.str();
    }

} // namespace cli
