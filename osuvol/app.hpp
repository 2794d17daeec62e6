#pragma once

#include <osuvol/cli.hpp>
#include <osuvol/mapset.hpp>

#include <ostream>
#include <string_view>

namespace osuvol {

enum ExitCode : int
{
    ExitSuccess=0,
    ExitFatal=1,
    ExitUsage=2,
};

// Progress and the summary go to out, warnings and errors to err.
inline int run(const CliOptions& options, std::ostream& out, std::ostream& err, std::string_view program="osuvol")
{
    if (options.help)
    {
        out << usage(program);
        return ExitSuccess;
    }
    if (options.version)
    {
        out << version_string << std::endl;
        return ExitSuccess;
    }

    VolumeProfile profile;
    std::vector<std::filesystem::path> targets;
    try
    {
        profile = load_volume_profile(options.source);

        if (options.dest)
            targets.push_back(*options.dest);
        else
            targets = find_sibling_beatmaps(options.source);
    }
    catch (const std::runtime_error& e)
    {
        err << "error: " << e.what() << std::endl;
        return ExitFatal;
    }

    if (targets.empty())
    {
        if (!options.quiet)
            out << "no other difficulties found next to " << options.source.string() << std::endl;
        return ExitSuccess;
    }

    if (!options.quiet)
    {
        out << "copying " << profile.size() << " volume points from " << options.source.string()
            << " to " << targets.size() << (targets.size() == 1 ? " difficulty" : " difficulties")
            << (options.dry_run ? " (dry run)" : "") << std::endl;
    }

    auto report = patch_beatmap_files(targets, profile, options.dry_run);

    if (!options.quiet)
    {
        for (const auto& result : report.results)
            if (result.status != PatchStatus::skipped)
                out << "  " << result.status << ": " << result.path.string() << std::endl;
    }

    if (!options.quiet || report.skipped)
    {
        out << "updated " << report.updated << ", unchanged " << report.unchanged
            << ", skipped " << report.skipped << std::endl;
    }

    for (const auto& result : report.results)
    {
        if (result.status == PatchStatus::skipped)
            err << "warning: " << result.path.string() << ": " << result.error << ": " << result.reason << std::endl;
    }
    return ExitSuccess;
}

inline int run_cli(int argc, const char* const* argv, std::ostream& out, std::ostream& err)
{
    std::string_view program = argc > 0 ? argv[0] : "osuvol";
    CliOptions options;
    try
    {
        options = parse_cli(argc, argv);
    }
    catch (const usage_error& e)
    {
        err << "error: " << e.what() << "\n\n" << usage(program);
        return ExitUsage;
    }
    return run(options, out, err, program);
}

}
