/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef CONFIG_STORE_H
#define CONFIG_STORE_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <util.h>
#include <workspace.h>

namespace WallpaperRotate {

//!
//! \brief The GlobalDesktopState class holds the [general] settings that apply to every workspace. It is built once per
//! read of the config file and passed by value to whatever needs it.
//!
struct GlobalDesktopState
{
    enum DesktopEnvironment { // Note that if this enum is expanded, the string conversions must also be updated.
        UNKNOWN,
        XFCE,
        GNOME,
        CINNAMON,
        MATE,
        GENERIC
    };

    enum SessionType {
        X11,
        WAYLAND
    };

    GlobalDesktopState();

    //!
    //! \brief Returns the blanking setting in the form used by the telemetry file: "off" when the timeout is zero or
    //! blanking is paused, otherwise e.g. "45s", "5m", "2h" or "1h30m".
    //!
    std::string BlankingToString() const;

    static std::string DesktopEnvironmentToString(const DesktopEnvironment& desktop_environment);
    static std::optional<DesktopEnvironment> StringToDesktopEnvironment(const std::string& desktop_environment_str);

    //!
    //! \brief Matches the known identifiers, in enum order, as substrings of the lowercased XDG_CURRENT_DESKTOP value.
    //! \param xdg_current_desktop
    //! \return the first identifier found, UNKNOWN if none.
    //!
    static DesktopEnvironment DetectDesktopEnvironment(const std::string& xdg_current_desktop);

    static std::string SessionTypeToString(const SessionType& session_type);

    DesktopEnvironment m_desktop_environment;
    SessionType m_session_type;
    int m_blanking_timeout;
    bool m_blanking_pause;
};

//!
//! \brief Everything the daemon needs from one read of the config file.
//!
struct ConfigSnapshot
{
    GlobalDesktopState m_global;
    std::vector<WorkspaceSettings> m_workspaces;
    bool m_telemetry_enabled = false;
};

//!
//! \brief The ConfigStore class specializes Config for the wallpaper_rotate config file. It re-reads the file whenever
//! its modification time or size has changed, so edits by the settings editor are picked up without a restart. The
//! getters are only valid after a successful Load() or Refresh().
//!
class ConfigStore : public Config
{
public:
    explicit ConfigStore(const fs::path& config_file);

    //!
    //! \brief Refreshes from disk and collects the global state and the settings of workspaces 1..N. A missing [wsN]
    //! section is skipped with a warning.
    //! \return ConfigSnapshot
    //! \throws ConfigMissingException if the config file does not exist.
    //! \throws ConfigException if [general] workspaces is missing or not a positive integer.
    //!
    ConfigSnapshot Load();

    //!
    //! \brief Re-parses the config file if it changed since the last parse.
    //! \return true if the file was parsed.
    //! \throws ConfigMissingException if the config file does not exist.
    //!
    bool Refresh();

    GlobalDesktopState GetGlobalState() const;

    //!
    //! \throws ConfigException if [general] workspaces is missing or not a positive integer.
    //!
    int GetWorkspaceCount() const;

    //!
    //! \brief Provides the settings in section [wsN] regardless of the configured workspace count.
    //! \return std::nullopt if the section does not exist.
    //!
    std::optional<WorkspaceSettings> GetWorkspaceSettings(int number) const;

    bool IsTelemetryEnabled() const;

    bool IsDebug() const;

    const fs::path& GetConfigFile() const;

private:
    //!
    //! \brief The is the ProcessArgs() implementation for the [general] and [conky] sections.
    //!
    void ProcessArgs() override;

    fs::path m_config_file;

    bool m_parsed;
    fs::file_time_type m_last_write_time;
    std::uintmax_t m_last_size;
};

//!
//! \brief $HOME/awp/awp_config.ini
//!
fs::path DefaultConfigFile();

//!
//! \brief The persisted index file, kept beside the config file.
//!
fs::path StateFileFor(const fs::path& config_file);

//!
//! \brief The telemetry status file read by the on-screen display, under the config file's directory.
//!
fs::path TelemetryFileFor(const fs::path& config_file);

} // namespace WallpaperRotate

#endif // CONFIG_STORE_H
