/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef WORKSPACE_H
#define WORKSPACE_H

#include <optional>
#include <string>

#include <util.h>

namespace WallpaperRotate {

//!
//! \brief Rotation period used when the timing value of a workspace section is absent or malformed.
//!
constexpr int DEFAULT_INTERVAL_SECONDS = 60;

//!
//! \brief The WorkspaceSettings class holds the settings of one [wsN] section of the config file in their native
//! format. The enum to string conversions here are the config file spellings. How a desktop environment represents
//! the scaling mode is the business of the backend and is not kept here.
//!
struct WorkspaceSettings
{
    enum RotationMode {
        RANDOM,
        SEQUENTIAL
    };

    enum SortOrder {
        NAME_ASCENDING,
        NAME_DESCENDING,
        OLDEST_FIRST,
        NEWEST_FIRST
    };

    enum ScalingMode {
        CENTERED,
        SCALED,
        ZOOMED
    };

    //!
    //! \brief Constructs settings for workspace 1 with the defaults of an empty section.
    //!
    WorkspaceSettings();

    //!
    //! \brief State map key and config section name of this workspace, e.g. "ws1".
    //!
    std::string Key() const;

    static std::string RotationModeToString(const RotationMode& mode);
    static std::optional<RotationMode> StringToRotationMode(const std::string& mode_str);

    static std::string SortOrderToString(const SortOrder& order);
    static std::optional<SortOrder> StringToSortOrder(const std::string& order_str);

    static std::string ScalingModeToString(const ScalingMode& scaling);
    static std::optional<ScalingMode> StringToScalingMode(const std::string& scaling_str);

    int m_number;
    fs::path m_folder;
    fs::path m_icon;
    std::string m_icon_color;

    //! Timing as written in the config file, e.g. "5m". Kept for the telemetry file.
    std::string m_timing;
    int m_interval_seconds;

    RotationMode m_mode;
    SortOrder m_order;
    ScalingMode m_scaling;

    std::optional<std::string> m_icon_theme;
    std::optional<std::string> m_gtk_theme;
    std::optional<std::string> m_cursor_theme;
    std::optional<std::string> m_desktop_theme;
    std::optional<std::string> m_wm_theme;
};

//!
//! \brief Returns the state map key and config section name for the workspace number, e.g. 3 -> "ws3".
//!
std::string WorkspaceKey(int number);

//!
//! \brief Converts a timing string such as 30s, 7m or 2h to seconds. A unit other than s, m or h counts as minutes.
//! \param timing_str
//! \return seconds, or std::nullopt if the string is malformed or does not give a positive period.
//!
std::optional<int> ParseTiming(const std::string& timing_str);

} // namespace WallpaperRotate

#endif // WORKSPACE_H
