#include "commands/command_support.hpp"

#include <stdexcept>
#include <system_error>

#include "model/loader.hpp"

namespace fs = std::filesystem;

namespace muslforge::commands
{

    bool splitCommandLine(
        const std::vector<std::string> &argv,
        GlobalOptions &global,
        std::string &command,
        std::vector<std::string> &args,
        std::string &error)
    {
        command.clear();
        args.clear();
        for (std::size_t i = 0; i < argv.size(); ++i)
        {
            const std::string &arg = argv[i];
            if (arg == "--config")
            {
                if (i + 1 >= argv.size())
                {
                    error = "--config requires value";
                    return false;
                }
                global.configFile = argv[++i];
                continue;
            }
            if (arg == "--quiet" || arg == "-q")
            {
                global.quiet = true;
                continue;
            }
            if (arg == "--verbose")
            {
                global.verbose = true;
                continue;
            }
            if (command.empty())
            {
                command = arg;
                continue;
            }
            args.push_back(arg);
        }
        return true;
    }

    std::optional<model::Settings> loadCommandSettings(const muslforge::Context &ctx, const fs::path &configFile)
    {
        const fs::path file = model::resolveConfigFile(configFile.string());
        std::error_code ec;
        if (!configFile.empty() && !fs::exists(file, ec))
        {
            ctx.error("Config file not found: ", file.string());
            return std::nullopt;
        }
        ctx.debug("Config: ", file.string());
        return model::loadSettings(file, ctx);
    }

    std::vector<std::string> splitList(const std::string &value)
    {
        std::vector<std::string> out;
        std::string token;
        for (std::size_t i = 0; i <= value.size(); ++i)
        {
            if (i == value.size() || value[i] == ',')
            {
                if (!token.empty())
                {
                    out.push_back(token);
                }
                token.clear();
                continue;
            }
            token.push_back(value[i]);
        }
        return out;
    }

    bool takeValue(const std::vector<std::string> &args, std::size_t &i, std::string &out, const muslforge::Context &ctx)
    {
        if (i + 1 >= args.size())
        {
            ctx.error(args[i], " requires value");
            return false;
        }
        out = args[++i];
        return true;
    }

    bool parsePositive(const std::string &option, const std::string &text, std::size_t &out, const muslforge::Context &ctx)
    {
        try
        {
            std::size_t used = 0;
            const long value = std::stol(text, &used);
            if (used != text.size() || value <= 0)
            {
                ctx.error("Invalid ", option, ": ", text);
                return false;
            }
            out = static_cast<std::size_t>(value);
            return true;
        }
        catch (const std::exception &)
        {
            ctx.error("Invalid ", option, " value");
            return false;
        }
    }

} // namespace muslforge::commands
