#ifndef HEADER_cli_Config_hpp_ALREADY_INCLUDED
#define HEADER_cli_Config_hpp_ALREADY_INCLUDED

#include <cli/Options.hpp>

#include <ReturnCode.hpp>

#include <filesystem>
#include <optional>

namespace cli {

    enum class OnError
    {
        Abort,
        KeepGoing,
    };

    struct Config
    {
        // Empty means interactive input from stdin
        std::optional<std::filesystem::path> input;
        OnError on_error = OnError::Abort;
        bool preprocess = false;
        bool print_tokens = true;

        ReturnCode init(const Options &options);
    };

} // namespace cli

#endif
