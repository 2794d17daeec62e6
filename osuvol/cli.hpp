#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace osuvol {

struct usage_error : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

constexpr std::string_view version_string = "osuvol 1.0";

struct CliOptions
{
    std::filesystem::path source;
    // only this file is patched when set, otherwise every sibling difficulty
    std::optional<std::filesystem::path> dest;
    bool dry_run = false;
    bool quiet = false;
    bool help = false;
    bool version = false;
};

inline std::string usage(std::string_view program)
{
    return "usage: " + std::string(program) + " [options] <source.osu> [<dest.osu>]\n"
        "Copy the volume of every timing point in <source.osu> to the other difficulties in its folder.\n"
        "\n"
        "options:\n"
        "  -d, --dest <file>  patch only this file instead of every sibling difficulty\n"
        "  -n, --dry-run      report what would change without writing anything\n"
        "  -q, --quiet        only print warnings and errors\n"
        "  -h, --help         print this message\n"
        "  -V, --version      print the version\n";
}

inline bool is_flag_like(std::string_view s)
{
    return s.size() > 1 && s[0] == '-';
}

// Throws usage_error on anything it doesn't understand. Stops early for --help
// and --version, leaving the remaining fields at their defaults.
inline CliOptions parse_cli(int argc, const char* const* argv)
{
    CliOptions options;
    std::vector<std::string_view> positional;
    bool options_done = false;

    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];

        if (options_done || !is_flag_like(arg))
        {
            positional.push_back(arg);
            continue;
        }

        if (arg == "--")
            options_done = true;
        else if (arg == "-h" || arg == "--help")
        {
            options.help = true;
            return options;
        }
        else if (arg == "-V" || arg == "--version")
        {
            options.version = true;
            return options;
        }
        else if (arg == "-n" || arg == "--dry-run")
            options.dry_run = true;
        else if (arg == "-q" || arg == "--quiet")
            options.quiet = true;
        else if (arg == "-d" || arg == "--dest")
        {
            if (i + 1 >= argc)
                throw usage_error(std::string(arg) + " requires a file");
            options.dest = argv[++i];
        }
        else if (arg.starts_with("--dest="))
        {
            arg.remove_prefix(std::string_view("--dest=").size());
            if (arg.empty())
                throw usage_error("--dest requires a file");
            options.dest = std::string(arg);
        }
        else
            throw usage_error("unknown option: " + std::string(arg));
    }

    if (positional.empty())
        throw usage_error("missing source beatmap");
    if (positional.size() > 2)
        throw usage_error("too many arguments");

    options.source = std::string(positional[0]);
    if (positional.size() == 2)
    {
        if (options.dest)
            throw usage_error("destination given both as an argument and with --dest");
        options.dest = std::string(positional[1]);
    }
    return options;
}

}
