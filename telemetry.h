/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef TELEMETRY_H
#define TELEMETRY_H

#include <string>

#include <config_store.h>
#include <util.h>
#include <workspace.h>

namespace WallpaperRotate {

//!
//! \brief Icon colour written when the workspace does not set one.
//!
const std::string DEFAULT_ICON_COLOR = "#109daf";

//!
//! \brief The TelemetryWriter class maintains the key=value status file read by the desktop conky widget. The file is
//! rewritten in full each time a wallpaper is applied.
//!
class TelemetryWriter
{
public:
    explicit TelemetryWriter(const fs::path& telemetry_file);

    //!
    //! \brief Formats the status text for the workspace and the wallpaper it is showing.
    //! \param settings
    //! \param wallpaper absolute image path, empty if the workspace has no images
    //! \param global
    //! \return ten key=value lines
    //!
    static std::string Format(const WorkspaceSettings& settings, const fs::path& wallpaper,
                              const GlobalDesktopState& global);

    //!
    //! \brief Writes Format() to the status file, creating its directory if needed.
    //! \return false if the file could not be written. The failure is logged.
    //!
    bool Write(const WorkspaceSettings& settings, const fs::path& wallpaper, const GlobalDesktopState& global) const;

    const fs::path& GetTelemetryFile() const;

private:
    fs::path m_telemetry_file;
};

} // namespace WallpaperRotate

#endif // TELEMETRY_H
