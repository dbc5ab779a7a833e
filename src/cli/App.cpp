#include <cli/App.hpp>

#include <util/log.hpp>

#include <rubr/fs/util.hpp>
#include <rubr/macro/capture.hpp>
#include <rubr/mss.hpp>
#include <rubr/profile/Stopwatch.hpp>

#include <chrono>
#include <string>

namespace cli {

    ReturnCode App::run()
    {
        MSS_BEGIN(ReturnCode);

        MSS(config_.init(options_));

        if (config_.input)
            MSS(scan_file_(*config_.input));
        else
            MSS(interactive_());

        MSS_END();
    }

    ReturnCode App::scan(std::string_view name, std::string_view text, const std::filesystem::path &fp)
    {
        MSS_BEGIN(ReturnCode);

        MSS(scanner_.init([&](std::string &content) {
            MSS_BEGIN(ReturnCode);
            if (config_.preprocess)
                MSS(preprocessor_.process(content, text, fp));
            else
                content = text;
            MSS_END();
        }));

        const rubr::profile::Stopwatch sw;

        std::size_t token_count = 0;
        std::size_t error_count = 0;

        auto report_token = [&](const tkn::Token &token) {
            ++token_count;
            util::log::os(2) << C(token) << std::endl;
            if (config_.print_tokens)
                os_ << token << std::endl;
        };
        auto report_error = [&]() {
            ++error_count;
            if (const auto &error = scanner_.error())
                es_ << name << ':' << *error << std::endl;
        };

        switch (config_.on_error)
        {
            case OnError::Abort:
            {
                // Tokens before the first error are still reported
                const auto rc = scanner_.scan();
                for (const auto &token : scanner_.tokens())
                    report_token(token);
                if (rc != ReturnCode::Ok)
                    report_error();
                break;
            }

            case OnError::KeepGoing:
                for (bool done = false; !done;)
                {
                    tkn::Token token;
                    if (scanner_.next(token) != ReturnCode::Ok)
                    {
                        report_error();
                        continue;
                    }
                    done = token.kind == tkn::Kind::EndOfInput;
                    report_token(token);
                }
                break;
        }

        util::log::os(1) << name << C(token_count) C(error_count) << " Elapse: " << sw.elapse<std::chrono::milliseconds>() << std::endl;

        if (error_count > 0)
            return ReturnCode::InvalidCharacter;

        MSS_END();
    }

    // Privates
    ReturnCode App::scan_file_(const std::filesystem::path &fp)
    {
        MSS_BEGIN(ReturnCode);

        std::string text;
        MSS(rubr::fs::read(text, fp), es_ << "Could not read " << fp << std::endl);

        util::log::os(1) << "Scanning " << fp << C(text.size()) << std::endl;

        MSS(scan(fp.string(), text, fp));

        MSS_END();
    }

    ReturnCode App::interactive_()
    {
        MSS_BEGIN(ReturnCode);

        os_ << "spindle interactive scanner. Type 'exit' to quit." << std::endl;

        for (std::string line;;)
        {
            os_ << "> " << std::flush;
            if (!std::getline(is_, line))
                break;

            const auto input = pre::trim(line);
            if (input == "exit")
                break;
            if (input.empty())
                continue;

            // A bad line is reported but does not end the session
            if (scan("<stdin>", input) != ReturnCode::Ok)
                util::log::os(1) << "Line was not scanned cleanly" << std::endl;
        }

        MSS_END();
    }

} // namespace cli
