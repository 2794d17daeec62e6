#pragma once

#include <osuvol/line_parser.hpp>
#include <osuvol/types.hpp>

#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <tuple>


namespace osuvol
{



struct BeatmapParser : LineParser
{
    using LineParser::LineParser;

    Beatmap parse();


protected:

    // "[Name]" on its own line, surrounding whitespace allowed
    static std::optional<std::string_view> section_name(std::string_view line)
    {
        line = trim_space(line);
        if (line.size() < 2 || !line.starts_with('[') || !line.ends_with(']'))
            return {};
        return line.substr(1, line.size()-2);
    }

    static bool is_timing_point_data(std::string_view line)
    {
        line = trim_space(line);
        return !line.empty() && !line.starts_with("//");
    }

    void parse_format_version(std::string_view line)
    {
        std::string_view bom = "\xEF\xBB\xBF";
        try_take_prefix(line, bom);
        line = trim_leading_space(line);

        if (try_take_prefix(line, "osu file format v"))
            std::ignore = read_number(beatmap_.version, trim_space(line));
    }

    TimingPointLine parse_timing_point(std::string_view line)
    {
        TimingPointLine result;
        split_raw_columns(result.columns, line);
        if (result.columns.size() < 2)
            OSUVOL_RAISE_PARSE_ERROR("timing point needs at least a time and a beat length: " << debug_location(line));

        TimingPoint& t = result.point;

        auto time = std::floor(take_numeric_column<double>(line));
        // int64_t range, [-2^63, 2^63)
        constexpr double time_limit = 9223372036854775808.0;
        if (!std::isfinite(time) || time < -time_limit || time >= time_limit)
            OSUVOL_RAISE_PARSE_ERROR("invalid timing point time " << time);
        t.time = static_cast<int64_t>(time);

        take_numeric_column(t.beatLength, line);

        // columns past the beat length are optional, older format versions stop early
        std::ignore = try_take_numeric_column(t.meter, line);
        std::ignore = try_take_numeric_column(t.sampleSet, line);
        std::ignore = try_take_numeric_column(t.sampleIndex, line);
        if (auto volume = try_take_column(line))
            read_number_or_throw(t.volume, *volume);

        int uninherited;
        if (try_take_numeric_column(uninherited, line))
            t.uninherited = uninherited != 0;
        else
            t.uninherited = t.beatLength >= 0;

        std::ignore = try_take_numeric_column(t.effects, line);

        for (size_t i = KnownColumnCount; i < result.columns.size(); ++i)
            t.extra_fields.push_back(result.columns[i]);

        result.parsed = t;
        return result;
    }

    Beatmap beatmap_;

};



inline Beatmap BeatmapParser::parse()
{
    while (read_line())
    {
        auto text = current_line();
        BeatmapLine line{std::string(text), std::string(line_ending()), {}};

        if (auto name = section_name(text))
        {
            beatmap_.sections.push_back(Section{std::string(*name), std::move(line), {}});
            continue;
        }

        if (beatmap_.sections.empty())
        {
            if (beatmap_.version == 0)
                parse_format_version(text);
            beatmap_.preamble.push_back(std::move(line));
            continue;
        }

        auto& section = beatmap_.sections.back();
        if (section.is_timing_points() && is_timing_point_data(text))
            line.timing_point = parse_timing_point(text);
        section.lines.push_back(std::move(line));
    }

    return std::move(beatmap_);
}

inline Beatmap parse_beatmap(std::string_view content, std::string filename="<memory>")
{
    std::istringstream stream{std::string(content)};
    BeatmapParser parser(stream, std::move(filename));
    return parser.parse();
}

}
