#pragma once

#include <osuvol/types.hpp>

#include <array>
#include <charconv>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace osuvol {

inline std::string format_number(double value)
{
    std::array<char, 64> buffer;
    auto [end, ec] = std::to_chars(buffer.data(), buffer.data()+buffer.size(), value);
    return std::string(buffer.data(), end);
}

inline std::string format_column(const TimingPoint& t, size_t column)
{
    switch(column) {
    case TimeColumn: return std::to_string(t.time);
    case BeatLengthColumn: return format_number(t.beatLength);
    case MeterColumn: return std::to_string(t.meter);
    case SampleSetColumn: return std::to_string(t.sampleSet);
    case SampleIndexColumn: return std::to_string(t.sampleIndex);
    case VolumeColumn: return std::to_string(t.volume);
    case UninheritedColumn: return t.uninherited ? "1" : "0";
    case EffectsColumn: return std::to_string(t.effects);
    }
    return {};
}

inline bool column_changed(const TimingPoint& a, const TimingPoint& b, size_t column)
{
    switch(column) {
    case TimeColumn: return a.time != b.time;
    case BeatLengthColumn: return !TimingPoint::same_beat_length(a.beatLength, b.beatLength);
    case MeterColumn: return a.meter != b.meter;
    case SampleSetColumn: return a.sampleSet != b.sampleSet;
    case SampleIndexColumn: return a.sampleIndex != b.sampleIndex;
    case VolumeColumn: return a.volume != b.volume;
    case UninheritedColumn: return a.uninherited != b.uninherited;
    case EffectsColumn: return a.effects != b.effects;
    }
    return false;
}

// Swap the value inside a column, keeping any whitespace around it.
inline void replace_column_value(std::string& column, std::string_view value)
{
    size_t first = column.find_first_not_of(" \t");
    if (first == std::string::npos)
    {
        column = value;
        return;
    }
    size_t last = column.find_last_not_of(" \t");
    column.replace(first, last-first+1, value);
}

inline std::string serialize_timing_point(const TimingPointLine& line)
{
    const TimingPoint& t = line.point;
    std::vector<std::string> columns = line.columns;

    auto pad_to = [&](size_t count){
        while (columns.size() < count)
            columns.push_back(format_column(t, columns.size()));
    };

    for (size_t c = 0; c < KnownColumnCount; ++c)
    {
        if (!column_changed(t, line.parsed, c))
            continue;
        if (c < columns.size())
            replace_column_value(columns[c], format_column(t, c));
        else
            pad_to(c+1);
    }

    if (t.extra_fields != line.parsed.extra_fields)
    {
        pad_to(KnownColumnCount);
        columns.resize(KnownColumnCount);
        columns.insert(columns.end(), t.extra_fields.begin(), t.extra_fields.end());
    }

    std::string result;
    for (size_t i = 0; i < columns.size(); ++i)
    {
        if (i) result += ',';
        result += columns[i];
    }
    return result;
}

inline void write_line(std::ostream& os, const BeatmapLine& line)
{
    if (line.timing_point && line.timing_point->point != line.timing_point->parsed)
        os << serialize_timing_point(*line.timing_point);
    else
        os << line.text;
    os << line.ending;
}

inline void write_beatmap(std::ostream& os, const Beatmap& beatmap)
{
    for (const auto& line : beatmap.preamble)
        write_line(os, line);

    for (const auto& section : beatmap.sections)
    {
        write_line(os, section.header);
        for (const auto& line : section.lines)
            write_line(os, line);
    }
}

inline std::string serialize_beatmap(const Beatmap& beatmap)
{
    std::ostringstream ss;
    write_beatmap(ss, beatmap);
    return ss.str();
}

}
