/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <workspace.h>

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdint>

namespace WallpaperRotate {

WorkspaceSettings::WorkspaceSettings()
    : m_number(1)
    , m_timing("1m")
    , m_interval_seconds(DEFAULT_INTERVAL_SECONDS)
    , m_mode(RANDOM)
    , m_order(NAME_ASCENDING)
    , m_scaling(SCALED)
{}

std::string WorkspaceSettings::Key() const
{
    return WorkspaceKey(m_number);
}

std::string WorkspaceSettings::RotationModeToString(const RotationMode& mode)
{
    std::string out;

    switch (mode) {
    case RANDOM:
        out = "random";
        break;
    case SEQUENTIAL:
        out = "sequential";
        break;
    }

    return out;
}

std::optional<WorkspaceSettings::RotationMode> WorkspaceSettings::StringToRotationMode(const std::string& mode_str)
{
    std::string mode = ToLower(mode_str);

    if (mode == "random") return RANDOM;
    if (mode == "sequential") return SEQUENTIAL;

    return std::nullopt;
}

std::string WorkspaceSettings::SortOrderToString(const SortOrder& order)
{
    std::string out;

    switch (order) {
    case NAME_ASCENDING:
        out = "name_az";
        break;
    case NAME_DESCENDING:
        out = "name_za";
        break;
    case OLDEST_FIRST:
        out = "name_old";
        break;
    case NEWEST_FIRST:
        out = "name_new";
        break;
    }

    return out;
}

std::optional<WorkspaceSettings::SortOrder> WorkspaceSettings::StringToSortOrder(const std::string& order_str)
{
    std::string order = ToLower(order_str);

    if (order == "name_az") return NAME_ASCENDING;
    if (order == "name_za") return NAME_DESCENDING;
    if (order == "name_old") return OLDEST_FIRST;
    if (order == "name_new") return NEWEST_FIRST;

    return std::nullopt;
}

std::string WorkspaceSettings::ScalingModeToString(const ScalingMode& scaling)
{
    std::string out;

    switch (scaling) {
    case CENTERED:
        out = "centered";
        break;
    case SCALED:
        out = "scaled";
        break;
    case ZOOMED:
        out = "zoomed";
        break;
    }

    return out;
}

std::optional<WorkspaceSettings::ScalingMode> WorkspaceSettings::StringToScalingMode(const std::string& scaling_str)
{
    std::string scaling = ToLower(scaling_str);

    if (scaling == "centered") return CENTERED;
    if (scaling == "scaled") return SCALED;
    if (scaling == "zoomed") return ZOOMED;

    return std::nullopt;
}

std::string WorkspaceKey(int number)
{
    return "ws" + ToString(number);
}

std::optional<int> ParseTiming(const std::string& timing_str)
{
    std::string timing = TrimString(timing_str);

    if (timing.size() < 2) {
        return std::nullopt;
    }

    char unit = ToLower(timing.back());
    std::string number_str = TrimString(timing.substr(0, timing.size() - 1));

    if (number_str.empty()
        || !std::all_of(number_str.begin(), number_str.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }

    int64_t multiplier = 60;

    if (unit == 's') {
        multiplier = 1;
    } else if (unit == 'h') {
        multiplier = 3600;
    }

    int64_t seconds = 0;

    try {
        seconds = static_cast<int64_t>(ParseStringToInt(number_str)) * multiplier;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }

    if (seconds < 1 || seconds > INT_MAX) {
        return std::nullopt;
    }

    return static_cast<int>(seconds);
}

} // namespace WallpaperRotate
