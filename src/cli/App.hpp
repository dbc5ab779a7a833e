#ifndef HEADER_cli_App_hpp_ALREADY_INCLUDED
#define HEADER_cli_App_hpp_ALREADY_INCLUDED

#include <cli/Config.hpp>
#include <cli/Options.hpp>
#include <pre/Preprocessor.hpp>
#include <tkn/Scanner.hpp>

#include <ReturnCode.hpp>

#include <filesystem>
#include <iostream>
#include <string_view>

namespace cli {

    class App
    {
    public:
        App(const Options &options, std::istream &is = std::cin, std::ostream &os = std::cout, std::ostream &es = std::cerr)
            : options_(options), is_(is), os_(os), es_(es) {}

        ReturnCode run();

        // Preprocesses when configured, scans text and reports tokens and diagnostics
        ReturnCode scan(std::string_view name, std::string_view text, const std::filesystem::path &fp = {});

    private:
        ReturnCode scan_file_(const std::filesystem::path &fp);
        ReturnCode interactive_();

        const Options &options_;
        std::istream &is_;
        std::ostream &os_;
        std::ostream &es_;
        Config config_;
        pre::Preprocessor preprocessor_;
        tkn::Scanner scanner_;
    };

} // namespace cli

#endif
