#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "bitbrush/pattern/Pattern.hpp"

namespace bitbrush
{
class PatternEngine;
}

namespace app
{

enum class Command
{
    Help,
    Version,
    Sequence,
    Mirror,
    Count,
    Show,
    Benchmark
};

struct CommandLineOptions
{
    Command command = Command::Help;

    // Overrides for values read from config.toml
    std::optional<int> width;
    std::optional<int> step;
    std::optional<int> iterations;

    std::string config_path = "config.toml";
    std::string log_file = "logs/bitbrush.log"; // opened before the config is read
    bool verbose = false;
    bool blocks = false; // render rows with '#' and '.' instead of '1' and '0'

    std::string sequence_name; // --sequence NAME
    std::string value_text;    // operand of --mirror / --count / --show
};

struct ParseResult
{
    std::optional<CommandLineOptions> options;
    std::string error;
};

// args excludes the program name.
ParseResult ParseCommandLine(const std::vector<std::string>& args);

void PrintUsage(const char* program_name, std::ostream& out);
void PrintVersion(std::ostream& out);

/**
 * @brief Parse a pattern operand
 *
 * Accepts decimal ("73"), hexadecimal ("0x49") and binary ("0b1001001").
 * Binary text goes through PatternEngine::Parse so it is limited to the
 * engine width; decimal and hex values only need to fit in 64 bits.
 *
 * @throws bitbrush::InvalidArgument on malformed text
 */
bitbrush::Pattern ParsePatternValue(std::string_view text, const bitbrush::PatternEngine& engine);

} // namespace app
