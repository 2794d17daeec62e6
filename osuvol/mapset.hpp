#pragma once

#include <osuvol/beatmap_parser.hpp>
#include <osuvol/beatmap_writer.hpp>
#include <osuvol/volume_profile.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace osuvol {

namespace fs = std::filesystem;

struct io_error : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

enum class SourceErrorKind
{
    unreadable,
    malformed,
};

struct source_error : std::runtime_error
{
    source_error(SourceErrorKind kind, const std::string& what):
        std::runtime_error(what),
        kind(kind)
    {}

    SourceErrorKind kind;
};

enum class PatchStatus
{
    updated,
    unchanged,
    skipped,
};

enum class TargetErrorKind
{
    none,
    unreadable,
    malformed,
    unwritable,
};

constexpr const char* to_string(PatchStatus s)
{
    switch(s) {
    case PatchStatus::updated: return "updated";
    case PatchStatus::unchanged: return "unchanged";
    case PatchStatus::skipped: return "skipped";
    }
    return "unknown";
}

constexpr const char* to_string(TargetErrorKind k)
{
    switch(k) {
    case TargetErrorKind::none: return "none";
    case TargetErrorKind::unreadable: return "unreadable";
    case TargetErrorKind::malformed: return "malformed";
    case TargetErrorKind::unwritable: return "unwritable";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, PatchStatus s)
{
    return os << to_string(s);
}

inline std::ostream& operator<<(std::ostream& os, TargetErrorKind k)
{
    return os << to_string(k);
}

struct PatchResult
{
    fs::path path;
    PatchStatus status = PatchStatus::skipped;
    TargetErrorKind error = TargetErrorKind::none;
    std::string reason;
};

struct BatchReport
{
    std::vector<PatchResult> results;
    size_t updated = 0;
    size_t unchanged = 0;
    size_t skipped = 0;

    void add(PatchResult result)
    {
        switch(result.status) {
        case PatchStatus::updated: ++updated; break;
        case PatchStatus::unchanged: ++unchanged; break;
        case PatchStatus::skipped: ++skipped; break;
        }
        results.push_back(std::move(result));
    }
};

// Why a stream failed to open path; streams themselves don't say.
inline std::string open_failure_reason(const fs::path& path)
{
    std::error_code ec;
    fs::status(path, ec);
    if (ec)
        return ec.message();
    return "not accessible";
}

inline std::string read_file(const fs::path& path)
{
    std::error_code ec;
    if (fs::is_directory(path, ec))
        throw io_error("could not read " + path.string() + ": is a directory");

    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw io_error("could not open " + path.string() + ": " + open_failure_reason(path));

    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad())
        throw io_error("could not read " + path.string());
    return ss.str();
}

inline fs::path temporary_path_for(const fs::path& path)
{
    fs::path tmp = path;
    tmp += ".osuvol.tmp";
    return tmp;
}

// Writes through a temporary file next to path, so a failed write never leaves
// a truncated beatmap behind. An existing target keeps its permissions. A file
// already sitting at the temporary name is left alone and the write fails.
inline void write_file(const fs::path& path, std::string_view content)
{
    struct TemporaryFile
    {
        fs::path path;
        bool created = false;
        bool keep = false;
        ~TemporaryFile()
        {
            if (!created || keep) return;
            std::error_code ec;
            fs::remove(path, ec);
        }
    };

    TemporaryFile tmp{temporary_path_for(path)};

    std::error_code ec;
    if (fs::exists(fs::symlink_status(tmp.path, ec)))
        throw io_error("could not write " + path.string() + ": " + tmp.path.string() + " is in the way");

    auto target_status = fs::status(path, ec);
    bool target_exists = !ec && fs::exists(target_status);

    {
        std::ofstream out(tmp.path, std::ios::binary | std::ios::trunc);
        if (!out)
            throw io_error("could not open " + tmp.path.string() + " for writing: " + open_failure_reason(tmp.path.parent_path()));
        tmp.created = true;

        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out)
            throw io_error("failed writing " + tmp.path.string());
    }

    if (target_exists)
    {
        fs::permissions(tmp.path, target_status.permissions(), fs::perm_options::replace, ec);
        if (ec)
            throw io_error("could not copy permissions to " + tmp.path.string() + ": " + ec.message());
    }

    fs::rename(tmp.path, path, ec);
    if (ec)
        throw io_error("could not replace " + path.string() + ": " + ec.message());
    tmp.keep = true;
}

inline bool has_beatmap_extension(const fs::path& path)
{
    std::string extension = path.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
        [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return extension == ".osu";
}

// Other difficulties of the source's mapset, sorted by path. The source itself is excluded.
inline std::vector<fs::path> find_sibling_beatmaps(const fs::path& source)
{
    fs::path directory = source.parent_path();
    if (directory.empty())
        directory = ".";

    std::error_code ec;
    std::vector<fs::path> siblings;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec))
    {
        const auto& entry = *it;
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec) || !has_beatmap_extension(entry.path()))
            continue;
        if (fs::equivalent(entry.path(), source, entry_ec))
            continue;
        siblings.push_back(entry.path());
    }
    if (ec)
        throw io_error("could not list " + directory.string() + ": " + ec.message());

    std::sort(siblings.begin(), siblings.end());
    return siblings;
}

inline VolumeProfile load_volume_profile(const fs::path& source)
{
    std::string content;
    try
    {
        content = read_file(source);
    }
    catch (const io_error& e)
    {
        throw source_error(SourceErrorKind::unreadable, e.what());
    }

    try
    {
        return extract_volume_profile(parse_beatmap(content, source.string()));
    }
    catch (const parse_error& e)
    {
        throw source_error(SourceErrorKind::malformed, e.what());
    }
}

inline PatchResult patch_beatmap_file(const fs::path& target, const VolumeProfile& profile, bool dry_run=false)
{
    PatchResult result{target};

    std::string original;
    try
    {
        original = read_file(target);
    }
    catch (const io_error& e)
    {
        result.error = TargetErrorKind::unreadable;
        result.reason = e.what();
        return result;
    }

    std::string patched;
    try
    {
        patched = serialize_beatmap(apply_volume_profile(parse_beatmap(original, target.string()), profile));
    }
    catch (const parse_error& e)
    {
        result.error = TargetErrorKind::malformed;
        result.reason = e.what();
        return result;
    }

    if (patched == original)
    {
        result.status = PatchStatus::unchanged;
        return result;
    }

    if (!dry_run)
    {
        try
        {
            write_file(target, patched);
        }
        catch (const io_error& e)
        {
            result.error = TargetErrorKind::unwritable;
            result.reason = e.what();
            return result;
        }
    }

    result.status = PatchStatus::updated;
    return result;
}

inline BatchReport patch_beatmap_files(const std::vector<fs::path>& targets, const VolumeProfile& profile, bool dry_run=false)
{
    BatchReport report;
    for (const auto& target : targets)
        report.add(patch_beatmap_file(target, profile, dry_run));
    return report;
}

}
