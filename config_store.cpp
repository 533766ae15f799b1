/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <config_store.h>

#include <algorithm>
#include <cctype>

namespace WallpaperRotate {

// Class GlobalDesktopState

GlobalDesktopState::GlobalDesktopState()
    : m_desktop_environment(UNKNOWN)
    , m_session_type(X11)
    , m_blanking_timeout(0)
    , m_blanking_pause(false)
{}

std::string GlobalDesktopState::BlankingToString() const
{
    if (m_blanking_timeout <= 0 || m_blanking_pause) {
        return "off";
    }

    if (m_blanking_timeout < 60) {
        return ToString(m_blanking_timeout) + "s";
    } else if (m_blanking_timeout < 3600) {
        return ToString(m_blanking_timeout / 60) + "m";
    }

    int hours = m_blanking_timeout / 3600;
    int minutes = (m_blanking_timeout % 3600) / 60;

    if (minutes > 0) {
        return ToString(hours) + "h" + ToString(minutes) + "m";
    }

    return ToString(hours) + "h";
}

std::string GlobalDesktopState::DesktopEnvironmentToString(const DesktopEnvironment& desktop_environment)
{
    std::string out;

    switch (desktop_environment) {
    case UNKNOWN:
        out = "unknown";
        break;
    case XFCE:
        out = "xfce";
        break;
    case GNOME:
        out = "gnome";
        break;
    case CINNAMON:
        out = "cinnamon";
        break;
    case MATE:
        out = "mate";
        break;
    case GENERIC:
        out = "generic";
        break;
    }

    return out;
}

std::optional<GlobalDesktopState::DesktopEnvironment>
GlobalDesktopState::StringToDesktopEnvironment(const std::string& desktop_environment_str)
{
    std::string desktop_environment = ToLower(TrimString(desktop_environment_str));

    for (const auto& candidate : {XFCE, GNOME, CINNAMON, MATE, GENERIC}) {
        if (desktop_environment == DesktopEnvironmentToString(candidate)) {
            return candidate;
        }
    }

    return std::nullopt;
}

GlobalDesktopState::DesktopEnvironment GlobalDesktopState::DetectDesktopEnvironment(const std::string& xdg_current_desktop)
{
    std::string desktop = ToLower(xdg_current_desktop);

    for (const auto& candidate : {XFCE, GNOME, CINNAMON, MATE, GENERIC}) {
        if (desktop.find(DesktopEnvironmentToString(candidate)) != std::string::npos) {
            return candidate;
        }
    }

    return UNKNOWN;
}

std::string GlobalDesktopState::SessionTypeToString(const SessionType& session_type)
{
    return session_type == WAYLAND ? "wayland" : "x11";
}

// Class ConfigStore

ConfigStore::ConfigStore(const fs::path& config_file)
    : m_config_file(config_file)
    , m_parsed(false)
    , m_last_write_time()
    , m_last_size(0)
{}

ConfigSnapshot ConfigStore::Load()
{
    Refresh();

    ConfigSnapshot snapshot;

    snapshot.m_global = GetGlobalState();
    snapshot.m_telemetry_enabled = IsTelemetryEnabled();

    int workspace_count = GetWorkspaceCount();

    for (int number = 1; number <= workspace_count; ++number) {
        std::optional<WorkspaceSettings> settings = GetWorkspaceSettings(number);

        if (!settings) {
            log("WARNING: %s: missing section [%s] in config, skipping.",
                __func__,
                WorkspaceKey(number));
            continue;
        }

        snapshot.m_workspaces.push_back(*settings);
    }

    return snapshot;
}

bool ConfigStore::Refresh()
{
    std::error_code ec;

    if (!fs::is_regular_file(m_config_file, ec)) {
        throw ConfigMissingException(m_config_file);
    }

    fs::file_time_type write_time = fs::last_write_time(m_config_file, ec);
    if (ec) write_time = fs::file_time_type::min();

    std::uintmax_t size = fs::file_size(m_config_file, ec);
    if (ec) size = 0;

    if (m_parsed && write_time == m_last_write_time && size == m_last_size) {
        return false;
    }

    debug_log("INFO: %s: parsing config file %s",
              __func__,
              m_config_file);

    if (!ReadAndUpdateConfig(m_config_file)) {
        // Vanished or unreadable between the check above and the open. Do not cache the stat so the next call retries.
        m_parsed = false;
        throw ConfigMissingException(m_config_file);
    }

    m_parsed = true;
    m_last_write_time = write_time;
    m_last_size = size;

    return true;
}

void ConfigStore::ProcessArgs()
{
    // debug

    std::string debug_arg = GetArgString("general.debug", "false");
    std::optional<bool> debug = ParseStringToBool(debug_arg);

    if (!debug) {
        error_log("%s: debug parameter in config file has invalid value: %s",
                  __func__,
                  debug_arg);
    }

    m_config.insert(std::make_pair("debug", debug.value_or(false)));

    // os_detected, with fallback to runtime detection

    std::string os_detected_arg = GetArgString("general.os_detected", "unknown");
    std::optional<GlobalDesktopState::DesktopEnvironment> desktop_environment =
        GlobalDesktopState::StringToDesktopEnvironment(os_detected_arg);

    if (!desktop_environment) {
        log("WARNING: %s: Invalid or missing os_detected in config (\"%s\"), falling back to runtime detection.",
            __func__,
            os_detected_arg);

        desktop_environment = GlobalDesktopState::DetectDesktopEnvironment(
            GetEnvVariable("XDG_CURRENT_DESKTOP").value_or(""));
    }

    m_config.insert(std::make_pair("os_detected",
                                   GlobalDesktopState::DesktopEnvironmentToString(*desktop_environment)));

    // session_type

    std::string session_type = ToLower(GetArgString("general.session_type", "x11"));

    if (session_type != "x11" && session_type != "wayland") {
        log("WARNING: %s: session_type parameter in config file has invalid value: %s. Assuming x11.",
            __func__,
            session_type);

        session_type = "x11";
    }

    m_config.insert(std::make_pair("session_type", session_type));

    // blanking_timeout, seconds, digits only

    std::string blanking_timeout_arg = TrimString(GetArgString("general.blanking_timeout", "0"));
    int blanking_timeout = 0;

    if (!blanking_timeout_arg.empty()
        && std::all_of(blanking_timeout_arg.begin(), blanking_timeout_arg.end(),
                       [](unsigned char c) { return std::isdigit(c); })) {
        try {
            blanking_timeout = ParseStringToInt(blanking_timeout_arg);
        } catch (std::exception& e) {
            error_log("%s: blanking_timeout parameter in config file has invalid value: %s",
                      __func__,
                      e.what());
        }
    }

    m_config.insert(std::make_pair("blanking_timeout", blanking_timeout));

    // blanking_pause

    std::string blanking_pause_arg = GetArgString("general.blanking_pause", "false");
    std::optional<bool> blanking_pause = ParseStringToBool(blanking_pause_arg);

    if (!blanking_pause) {
        error_log("%s: blanking_pause parameter in config file has invalid value: %s",
                  __func__,
                  blanking_pause_arg);
    }

    m_config.insert(std::make_pair("blanking_pause", blanking_pause.value_or(false)));

    // workspaces. Zero marks a missing or invalid value; GetWorkspaceCount() turns that into an exception.

    int workspaces = 0;
    std::optional<std::string> workspaces_arg = GetArgStringOptional("general.workspaces");

    if (workspaces_arg && !workspaces_arg->empty()
        && std::all_of(workspaces_arg->begin(), workspaces_arg->end(), [](unsigned char c) { return std::isdigit(c); })) {
        try {
            workspaces = ParseStringToInt(*workspaces_arg);
        } catch (std::exception& e) {
            error_log("%s: workspaces parameter in config file has invalid value: %s",
                      __func__,
                      e.what());
        }
    }

    m_config.insert(std::make_pair("workspaces", workspaces));

    // conky enabled

    std::string conky_enabled_arg = GetArgString("conky.enabled", "false");
    std::optional<bool> conky_enabled = ParseStringToBool(conky_enabled_arg);

    if (!conky_enabled) {
        error_log("%s: conky enabled parameter in config file has invalid value: %s",
                  __func__,
                  conky_enabled_arg);
    }

    m_config.insert(std::make_pair("conky_enabled", conky_enabled.value_or(false)));
}

GlobalDesktopState ConfigStore::GetGlobalState() const
{
    GlobalDesktopState state;

    state.m_desktop_environment = GlobalDesktopState::StringToDesktopEnvironment(
                                      std::get<std::string>(GetArg("os_detected"))).value_or(GlobalDesktopState::UNKNOWN);
    state.m_session_type = std::get<std::string>(GetArg("session_type")) == "wayland" ? GlobalDesktopState::WAYLAND
                                                                                       : GlobalDesktopState::X11;
    state.m_blanking_timeout = std::get<int>(GetArg("blanking_timeout"));
    state.m_blanking_pause = std::get<bool>(GetArg("blanking_pause"));

    return state;
}

int ConfigStore::GetWorkspaceCount() const
{
    int workspaces = std::get<int>(GetArg("workspaces"));

    if (workspaces < 1) {
        throw ConfigException("Invalid [general]::workspaces in config.");
    }

    return workspaces;
}

std::optional<WorkspaceSettings> ConfigStore::GetWorkspaceSettings(int number) const
{
    std::string section = WorkspaceKey(number);

    if (!HasSection(section)) {
        return std::nullopt;
    }

    WorkspaceSettings settings;
    settings.m_number = number;

    settings.m_folder = fs::path(GetArgString(section + ".folder", ""));
    settings.m_icon = fs::path(GetArgString(section + ".icon", ""));
    settings.m_icon_color = GetArgString(section + ".icon_color", "");

    settings.m_timing = GetArgString(section + ".timing", "1m");
    settings.m_interval_seconds = ParseTiming(settings.m_timing).value_or(DEFAULT_INTERVAL_SECONDS);

    std::string mode = GetArgString(section + ".mode", "random");
    std::optional<WorkspaceSettings::RotationMode> rotation_mode = WorkspaceSettings::StringToRotationMode(mode);

    if (!rotation_mode) {
        log("WARNING: %s: [%s] mode has invalid value \"%s\", using random.",
            __func__,
            section,
            mode);
    }

    settings.m_mode = rotation_mode.value_or(WorkspaceSettings::RANDOM);

    std::string order = GetArgString(section + ".order", "name_az");
    std::optional<WorkspaceSettings::SortOrder> sort_order = WorkspaceSettings::StringToSortOrder(order);

    if (!sort_order) {
        log("WARNING: %s: [%s] order has invalid value \"%s\", using name_az.",
            __func__,
            section,
            order);
    }

    settings.m_order = sort_order.value_or(WorkspaceSettings::NAME_ASCENDING);

    std::string scaling = GetArgString(section + ".scaling", "scaled");
    std::optional<WorkspaceSettings::ScalingMode> scaling_mode = WorkspaceSettings::StringToScalingMode(scaling);

    if (!scaling_mode) {
        log("WARNING: %s: [%s] scaling has invalid value \"%s\", using scaled.",
            __func__,
            section,
            scaling);
    }

    settings.m_scaling = scaling_mode.value_or(WorkspaceSettings::SCALED);

    // Theme keys are applied only when present and non-empty.
    auto theme = [this, &section](const std::string& key) -> std::optional<std::string> {
        std::optional<std::string> value = GetArgStringOptional(section + "." + key);

        if (value && value->empty()) {
            return std::nullopt;
        }

        return value;
    };

    settings.m_icon_theme = theme("icon_theme");
    settings.m_gtk_theme = theme("gtk_theme");
    settings.m_cursor_theme = theme("cursor_theme");
    settings.m_desktop_theme = theme("desktop_theme");
    settings.m_wm_theme = theme("wm_theme");

    return settings;
}

bool ConfigStore::IsTelemetryEnabled() const
{
    return std::get<bool>(GetArg("conky_enabled"));
}

bool ConfigStore::IsDebug() const
{
    return std::get<bool>(GetArg("debug"));
}

const fs::path& ConfigStore::GetConfigFile() const
{
    return m_config_file;
}

fs::path DefaultConfigFile()
{
    return fs::path(GetEnvVariable("HOME").value_or(".")) / "awp" / "awp_config.ini";
}

fs::path StateFileFor(const fs::path& config_file)
{
    return config_file.parent_path() / "indexes.json";
}

fs::path TelemetryFileFor(const fs::path& config_file)
{
    return config_file.parent_path() / "conky" / ".awp_conky_state.txt";
}

} // namespace WallpaperRotate
