/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <telemetry.h>

#include <fstream>

namespace WallpaperRotate {

TelemetryWriter::TelemetryWriter(const fs::path& telemetry_file)
    : m_telemetry_file(telemetry_file)
{}

std::string TelemetryWriter::Format(const WorkspaceSettings& settings, const fs::path& wallpaper,
                                    const GlobalDesktopState& global)
{
    std::string icon_color = settings.m_icon_color.empty() ? DEFAULT_ICON_COLOR : settings.m_icon_color;

    std::string out;

    out += "wallpaper_path=" + wallpaper.string() + "\n";
    out += "workspace_name=" + settings.Key() + "\n";
    out += "logo_path=" + settings.m_icon.string() + "\n";
    out += "icon_color=" + icon_color + "\n";
    out += "intv=" + settings.m_timing + "\n";
    out += "flow=" + WorkspaceSettings::RotationModeToString(settings.m_mode) + "\n";
    out += "sort=" + WorkspaceSettings::SortOrderToString(settings.m_order) + "\n";
    out += "view=" + WorkspaceSettings::ScalingModeToString(settings.m_scaling) + "\n";
    out += "blanking_timeout=" + global.BlankingToString() + "\n";
    out += "blanking_paused=" + std::string(global.m_blanking_pause ? "True" : "False") + "\n";

    return out;
}

bool TelemetryWriter::Write(const WorkspaceSettings& settings, const fs::path& wallpaper,
                            const GlobalDesktopState& global) const
{
    std::error_code ec;

    if (m_telemetry_file.has_parent_path()) {
        fs::create_directories(m_telemetry_file.parent_path(), ec);

        if (ec) {
            error_log("%s: unable to create directory %s: %s",
                      __func__,
                      m_telemetry_file.parent_path(),
                      ec.message());
            return false;
        }
    }

    std::ofstream telemetry_stream(m_telemetry_file, std::ios::out | std::ios::trunc);

    if (!telemetry_stream.is_open()) {
        error_log("%s: unable to open %s for writing.",
                  __func__,
                  m_telemetry_file);
        return false;
    }

    telemetry_stream << Format(settings, wallpaper, global);

    if (!telemetry_stream.good()) {
        error_log("%s: error writing %s",
                  __func__,
                  m_telemetry_file);
        return false;
    }

    return true;
}

const fs::path& TelemetryWriter::GetTelemetryFile() const
{
    return m_telemetry_file;
}

} // namespace WallpaperRotate
