#include "CommandLine.hpp"

#include "bitbrush/api/bitbrush.hpp"

#include <charconv>
#include <ostream>

namespace app
{

namespace
{

std::optional<int> ParseInt(const std::string& text)
{
    int value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || text.empty())
        return std::nullopt;
    return value;
}

bool SetCommand(CommandLineOptions& options, bool& command_seen, Command command, std::string& error)
{
    if (command_seen)
    {
        error = "only one of --sequence, --mirror, --count, --show, --benchmark may be given";
        return false;
    }
    command_seen = true;
    options.command = command;
    return true;
}

} // namespace

ParseResult ParseCommandLine(const std::vector<std::string>& args)
{
    ParseResult result;
    CommandLineOptions options;
    bool command_seen = false;

    auto next_value = [&](std::size_t& i, const std::string& flag) -> std::optional<std::string>
    {
        if (i + 1 >= args.size())
        {
            result.error = "missing value for " + flag;
            return std::nullopt;
        }
        return args[++i];
    };

    auto next_int = [&](std::size_t& i, const std::string& flag) -> std::optional<int>
    {
        auto text = next_value(i, flag);
        if (!text)
            return std::nullopt;
        auto value = ParseInt(*text);
        if (!value)
            result.error = "expected an integer after " + flag + ", got '" + *text + "'";
        return value;
    };

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h")
        {
            options.command = Command::Help;
            result.options = options;
            return result;
        }
        else if (arg == "--version")
        {
            options.command = Command::Version;
            result.options = options;
            return result;
        }
        else if (arg == "--verbose")
        {
            options.verbose = true;
        }
        else if (arg == "--blocks")
        {
            options.blocks = true;
        }
        else if (arg == "--width")
        {
            if (!(options.width = next_int(i, arg)))
                return result;
        }
        else if (arg == "--step")
        {
            if (!(options.step = next_int(i, arg)))
                return result;
        }
        else if (arg == "--iterations")
        {
            if (!(options.iterations = next_int(i, arg)))
                return result;
            if (*options.iterations <= 0)
            {
                result.error = "--iterations must be positive";
                return result;
            }
        }
        else if (arg == "--config")
        {
            auto path = next_value(i, arg);
            if (!path)
                return result;
            options.config_path = *path;
        }
        else if (arg == "--log-file")
        {
            auto path = next_value(i, arg);
            if (!path)
                return result;
            options.log_file = *path;
        }
        else if (arg == "--sequence")
        {
            auto name = next_value(i, arg);
            if (!name || !SetCommand(options, command_seen, Command::Sequence, result.error))
                return result;
            options.sequence_name = *name;
        }
        else if (arg == "--mirror" || arg == "--count" || arg == "--show")
        {
            const Command command = arg == "--mirror" ? Command::Mirror
                                    : arg == "--count" ? Command::Count
                                                       : Command::Show;
            auto value = next_value(i, arg);
            if (!value || !SetCommand(options, command_seen, command, result.error))
                return result;
            options.value_text = *value;
        }
        else if (arg == "--benchmark")
        {
            if (!SetCommand(options, command_seen, Command::Benchmark, result.error))
                return result;
        }
        else
        {
            result.error = "unknown option '" + arg + "'";
            return result;
        }
    }

    if (!command_seen)
    {
        result.error = "no command given";
        return result;
    }

    result.options = options;
    return result;
}

void PrintUsage(const char* program_name, std::ostream& out)
{
    out << "Usage: " << program_name << " [OPTIONS] COMMAND\n";
    out << "bitbrush - bit pattern generator and inspector\n\n";
    out << "Commands:\n";
    out << "  --sequence NAME      Print a generated sequence, one row per pattern\n";
    out << "                       NAME: sweep-ones, sweep-zeros, toggle-sparse, scan, scan-rings\n";
    out << "  --mirror VALUE       Reverse the bit order of VALUE across the width\n";
    out << "  --count VALUE        Count the set bits of VALUE\n";
    out << "  --show VALUE         Print VALUE as a binary row\n";
    out << "  --benchmark          Time every generator and the batch mirror\n";
    out << "  --version            Show version information\n";
    out << "  --help               Show this help message\n";
    out << "\nOptions:\n";
    out << "  --width N            Bit width, a multiple of 8 up to 64 (default from config, 32)\n";
    out << "  --step N             Step for toggle-sparse (default from config, 3)\n";
    out << "  --iterations N       Benchmark repetitions (default from config, 1000)\n";
    out << "  --config PATH        Config file (default config.toml)\n";
    out << "  --log-file PATH      Log file (default logs/bitbrush.log)\n";
    out << "  --blocks             Render rows with '#' and '.'\n";
    out << "  --verbose            Log debug output to the console\n";
    out << "\nVALUE may be decimal, 0x hexadecimal or 0b binary.\n";
}

void PrintVersion(std::ostream& out)
{
    out << "bitbrush " << bitbrush::kVersion << "\n";
    out << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

bitbrush::Pattern ParsePatternValue(std::string_view text, const bitbrush::PatternEngine& engine)
{
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'b' || text[1] == 'B'))
        return engine.Parse(text.substr(2));

    int base = 10;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
    {
        base = 16;
        text.remove_prefix(2);
    }

    bitbrush::Pattern value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value, base);
    if (text.empty() || ec != std::errc() || ptr != last)
        throw bitbrush::InvalidArgument("cannot parse '" + std::string(text) + "' as a pattern value");
    return value;
}

} // namespace app
