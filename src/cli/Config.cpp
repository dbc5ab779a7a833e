#include <cli/Config.hpp>

#include <util/log.hpp>

#include <rubr/mss.hpp>

#include <iostream>

namespace cli {

    ReturnCode Config::init(const Options &options)
    {
        MSS_BEGIN(ReturnCode);

        util::log::set_level(options.verbose);

        input.reset();
        if (options.input)
        {
            const std::filesystem::path fp{*options.input};
            if (!std::filesystem::is_regular_file(fp))
            {
                std::cerr << "Input file " << fp << " does not exist" << std::endl;
                return ReturnCode::FileNotFound;
            }
            input = fp;
        }

        on_error = options.keep_going ? OnError::KeepGoing : OnError::Abort;
        preprocess = options.preprocess;
        print_tokens = !options.quiet;

        MSS_END();
    }

} // namespace cli
