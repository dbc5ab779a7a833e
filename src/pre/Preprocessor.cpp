#include <pre/Preprocessor.hpp>

#include <util/log.hpp>

#include <rubr/fs/util.hpp>
#include <rubr/mss.hpp>

#include <algorithm>

namespace pre {

    namespace {
        constexpr std::string_view c_define = "#define ";
        constexpr std::string_view c_include = "#include ";
    } // namespace

    ReturnCode Preprocessor::process(std::string &output, std::string_view content, const std::filesystem::path &fp) const
    {
        MSS_BEGIN(ReturnCode);
        output.clear();
        MSS(process_(output, content, fp, 0));
        MSS_END();
    }

    std::string_view trim(std::string_view sv)
    {
        const auto is_space = [](char ch) { return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n'; };
        while (!sv.empty() && is_space(sv.front()))
            sv.remove_prefix(1);
        while (!sv.empty() && is_space(sv.back()))
            sv.remove_suffix(1);
        return sv;
    }

    void replace_all(std::string &str, std::string_view needle, std::string_view replacement)
    {
        if (needle.empty())
            return;
        for (auto ix = str.find(needle); ix != std::string::npos; ix = str.find(needle, ix + replacement.size()))
            str.replace(ix, needle.size(), replacement);
    }

    // Privates
    ReturnCode Preprocessor::process_(std::string &output, std::string_view content, const std::filesystem::path &fp, unsigned int depth) const
    {
        MSS_BEGIN(ReturnCode);

        Macros macros;

        while (!content.empty())
        {
            const auto eol = content.find('\n');
            auto line = content.substr(0, eol);
            content.remove_prefix(eol == std::string_view::npos ? content.size() : eol + 1);
            if (!line.empty() && line.back() == '\r')
                line.remove_suffix(1);

            const auto trimmed = trim(line);

            if (trimmed.starts_with(c_define))
            {
                const auto rest = trimmed.substr(c_define.size());
                if (const auto sp = rest.find(' '); sp != std::string_view::npos)
                {
                    const std::string name{rest.substr(0, sp)};
                    const std::string value{rest.substr(sp + 1)};
                    auto it = std::find_if(macros.begin(), macros.end(), [&](const auto &p) { return p.first == name; });
                    if (it != macros.end())
                        it->second = value;
                    else
                        macros.emplace_back(name, value);
                }
                continue;
            }

            if (trimmed.starts_with(c_include))
            {
                MSS(include_(output, trim(trimmed.substr(c_include.size())), fp, depth));
                continue;
            }

            std::string processed{line};
            for (const auto &[name, value] : macros)
                replace_all(processed, name, value);
            output += processed;
            output += '\n';
        }

        MSS_END();
    }

    ReturnCode Preprocessor::include_(std::string &output, std::string_view arg, const std::filesystem::path &fp, unsigned int depth) const
    {
        MSS_BEGIN(ReturnCode);

        if (arg.size() < 2 || arg.front() != '"' || arg.back() != '"')
        {
            util::log::warning() << "Ignoring malformed include " << arg << std::endl;
            MSS_RETURN_OK();
        }

        if (depth >= MaxDepth)
        {
            util::log::error() << "Include nesting exceeds " << MaxDepth << " levels at " << arg << std::endl;
            return ReturnCode::IncludeTooDeep;
        }

        const std::filesystem::path rel{std::string{arg.substr(1, arg.size() - 2)}};
        const auto include_fp = fp.empty() ? rel : fp.parent_path() / rel;

        if (!std::filesystem::is_regular_file(include_fp))
        {
            util::log::warning() << "Skipping missing include " << include_fp << std::endl;
            MSS_RETURN_OK();
        }

        util::log::os(1) << "Including " << include_fp << std::endl;

        std::string content;
        MSS(rubr::fs::read(content, include_fp));
        MSS(process_(output, content, include_fp, depth + 1));
        output += '\n';

        MSS_END();
    }

} // namespace pre
