#pragma once

#include <algorithm>
#include <cmath>
#include <compare>
#include <cstddef>
#include <iterator>
#include <stdint.h>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <iostream>

namespace osuvol {

enum TimingPointEffectFlags : uint32_t
{
    KiaiFlag=1<<0,
    OmitFirstBarLineFlag=1<<3,
};

// Column positions within a [TimingPoints] line.
enum TimingPointColumn : size_t
{
    TimeColumn,
    BeatLengthColumn,
    MeterColumn,
    SampleSetColumn,
    SampleIndexColumn,
    VolumeColumn,
    UninheritedColumn,
    EffectsColumn,
    KnownColumnCount,
};

struct TimingPoint
{
    int64_t time{};
    double beatLength{};
    int meter=4;
    int sampleSet{};
    int sampleIndex{};
    int volume=100;
    bool uninherited=true;
    uint32_t effects{};
    // columns after effects, kept as written
    std::vector<std::string> extra_fields;

    bool operator==(const TimingPoint& other) const
    {
        return time == other.time && same_beat_length(beatLength, other.beatLength) && meter == other.meter
            && sampleSet == other.sampleSet && sampleIndex == other.sampleIndex && volume == other.volume
            && uninherited == other.uninherited && effects == other.effects && extra_fields == other.extra_fields;
    }

    // aspire maps use NaN beat lengths, which still have to compare equal to themselves
    static bool same_beat_length(double a, double b)
    {
        return a == b || (std::isnan(a) && std::isnan(b));
    }
};

inline std::ostream& operator<<(std::ostream& os, const TimingPoint& t)
{
    os << "TimingPoint( time=" << t.time << " beatLength=" << t.beatLength << " meter=" << t.meter
       << " sampleSet=" << t.sampleSet << " sampleIndex=" << t.sampleIndex << " volume=" << t.volume
       << " uninherited=" << t.uninherited << " effects=" << t.effects;
    for (const auto& extra : t.extra_fields)
        os << " +" << extra;
    return os << ")";
}

struct TimingPointLine
{
    TimingPoint point;
    // the record as it was read, used to tell which columns need rewriting
    TimingPoint parsed;
    std::vector<std::string> columns;
};

struct BeatmapLine
{
    std::string text;
    std::string ending;
    std::optional<TimingPointLine> timing_point;
};

struct Section
{
    static constexpr std::string_view timing_points_name = "TimingPoints";

    std::string name;
    BeatmapLine header;
    std::vector<BeatmapLine> lines;

    bool is_timing_points() const { return name == timing_points_name; }
};

struct Beatmap
{
    // 0 when the file has no "osu file format v" line
    int version = 0;

    std::vector<BeatmapLine> preamble;
    std::vector<Section> sections;

    template <typename Func>
    void for_each_timing_point(Func&& f)
    {
        for (auto& section : sections)
        {
            if (!section.is_timing_points()) continue;
            for (auto& line : section.lines)
                if (line.timing_point) f(line.timing_point->point);
        }
    }

    template <typename Func>
    void for_each_timing_point(Func&& f) const
    {
        for (const auto& section : sections)
        {
            if (!section.is_timing_points()) continue;
            for (const auto& line : section.lines)
                if (line.timing_point) f(line.timing_point->point);
        }
    }

    std::vector<TimingPoint> timing_points() const
    {
        std::vector<TimingPoint> result;
        for_each_timing_point([&](const TimingPoint& t){ result.push_back(t); });
        return result;
    }

    const Section* find_section(std::string_view name) const
    {
        auto it = std::find_if(sections.begin(), sections.end(), [&](const Section& s){ return s.name == name; });
        return it == sections.end() ? nullptr : &*it;
    }
};

struct VolumePoint
{
    int64_t time;
    int volume;
    auto operator<=>(const VolumePoint&) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const VolumePoint& v)
{
    return os << "(" << v.time << "," << v.volume << ")";
}

struct VolumeProfile
{
    // ascending by time, equal times in file order
    std::vector<VolumePoint> points;

    bool empty() const { return points.empty(); }
    size_t size() const { return points.size(); }

    // Volume in effect at the given time: the last entry at or before it, or the
    // first entry if time precedes all of them. Empty if the profile is empty.
    //
    // occurrence is the index of the asking point among points sharing its time
    // (a red and a green line on the same tick). The n-th of those gets the n-th
    // entry at exactly that time, and any beyond the profile's run get its last one.
    std::optional<int> volume_at(int64_t time, size_t occurrence = 0) const
    {
        if (points.empty()) return {};

        auto [first, last] = std::equal_range(points.begin(), points.end(), time, TimeOrder{});
        if (first != last)
            return (first + std::min<ptrdiff_t>(occurrence, last - first - 1))->volume;

        if (first == points.begin())
            return points.front().volume;
        return std::prev(first)->volume;
    }

private:
    struct TimeOrder
    {
        bool operator()(const VolumePoint& p, int64_t t) const { return p.time < t; }
        bool operator()(int64_t t, const VolumePoint& p) const { return t < p.time; }
    };
};

}
