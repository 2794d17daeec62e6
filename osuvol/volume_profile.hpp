#pragma once

#include <osuvol/types.hpp>

#include <algorithm>
#include <map>

namespace osuvol {

inline VolumeProfile extract_volume_profile(const Beatmap& beatmap)
{
    VolumeProfile profile;
    beatmap.for_each_timing_point([&](const TimingPoint& t){
        profile.points.push_back({t.time, t.volume});
    });

    // timing points are normally already sorted, but nothing forces editors to write them that way
    std::stable_sort(profile.points.begin(), profile.points.end(),
        [](const VolumePoint& a, const VolumePoint& b){ return a.time < b.time; });
    return profile;
}

// Sets the volume of every timing point in target to the profile's volume at that
// point's time. Points sharing a time are matched to the profile's points at that
// time in file order. Nothing else in the beatmap changes.
inline Beatmap apply_volume_profile(Beatmap target, const VolumeProfile& profile)
{
    if (profile.empty())
        return target;

    std::map<int64_t, size_t> seen_at_time;
    target.for_each_timing_point([&](TimingPoint& t){
        if (auto volume = profile.volume_at(t.time, seen_at_time[t.time]++))
            t.volume = *volume;
    });
    return target;
}

}
