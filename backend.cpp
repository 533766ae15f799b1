/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <backend.h>

#include <algorithm>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace WallpaperRotate {

namespace {

std::string XmlEscape(const std::string& str)
{
    std::string out;
    out.reserve(str.size());

    for (const auto& c : str) {
        switch (c) {
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        case '"':
            out += "&quot;";
            break;
        case '\'':
            out += "&apos;";
            break;
        default:
            out += c;
        }
    }

    return out;
}

//!
//! \brief Writes contents to a temporary file beside path and renames it into place.
//!
bool ReplaceFileContents(const fs::path& path, const std::string& contents)
{
    fs::path tmp_file = path;
    tmp_file += ".tmp";

    {
        std::ofstream out(tmp_file, std::ios::out | std::ios::trunc);

        if (!out.is_open()) {
            error_log("%s: unable to open %s for writing.",
                      __func__,
                      tmp_file);
            return false;
        }

        out << contents;

        if (!out.good()) {
            error_log("%s: error writing %s",
                      __func__,
                      tmp_file);
            return false;
        }
    }

    std::error_code ec;

    fs::rename(tmp_file, path, ec);

    if (ec) {
        error_log("%s: unable to replace %s: %s",
                  __func__,
                  path,
                  ec.message());

        fs::remove(tmp_file, ec);
        return false;
    }

    return true;
}

std::string FileUri(const fs::path& image)
{
    return "file://" + image.string();
}

} // anonymous namespace

// Class Backend

bool Backend::HasCapability(const Capability& capability) const
{
    return (GetCapabilities() & capability) != 0;
}

bool Backend::SetPanelIcon(const fs::path& icon)
{
    debug_log("INFO: %s: %s backend has no panel icon support, ignoring %s",
              __func__,
              GlobalDesktopState::DesktopEnvironmentToString(GetDesktopEnvironment()),
              icon);

    return false;
}

bool Backend::ApplyThemes(int number, const WorkspaceSettings& settings)
{
    return true;
}

bool Backend::DisableSingleWorkspaceMode()
{
    return true;
}

bool Backend::ConfigureScreenBlanking(const GlobalDesktopState& global)
{
    return true;
}

bool Backend::RunChecked(CommandRunner& runner, const std::vector<std::string>& argv) const
{
    CommandResult result = runner.Run(argv);

    if (!result.Succeeded()) {
        error_log("%s: command failed with exit code %i: %s",
                  __func__,
                  result.m_exit_code,
                  CommandToString(argv));
        return false;
    }

    return true;
}

// Class XfceBackend

XfceBackend::XfceBackend(CommandRunner& runner, const fs::path& home)
    : m_runner(runner)
    , m_panel_config_file(home / ".config" / "xfce4" / "xfconf" / "xfce-perchannel-xml" / "xfce4-panel.xml")
{}

GlobalDesktopState::DesktopEnvironment XfceBackend::GetDesktopEnvironment() const
{
    return GlobalDesktopState::XFCE;
}

int XfceBackend::GetCapabilities() const
{
    return WALLPAPER | PANEL_ICON | THEMES | SINGLE_WORKSPACE_MODE | SCREEN_BLANKING;
}

int XfceBackend::ImageStyle(const WorkspaceSettings::ScalingMode& scaling)
{
    switch (scaling) {
    case WorkspaceSettings::CENTERED:
        return 1;
    case WorkspaceSettings::SCALED:
        return 4;
    case WorkspaceSettings::ZOOMED:
        return 5;
    }

    return 5;
}

std::optional<std::vector<std::string>> XfceBackend::GetMonitorsForWorkspace(int workspace_index)
{
    CommandResult result = m_runner.Run({"xfconf-query", "-c", "xfce4-desktop", "-l"});

    if (!result.Succeeded()) {
        error_log("%s: unable to list xfce4-desktop properties, exit code %i",
                  __func__,
                  result.m_exit_code);
        return std::nullopt;
    }

    std::string marker = "/workspace" + ToString(workspace_index) + "/last-image";
    std::vector<std::string> monitors;

    for (const auto& line : StringSplit(result.m_output, "\n")) {
        std::string property = TrimString(line);

        if (property.find(marker) == std::string::npos) {
            continue;
        }

        // e.g. /backdrop/screen0/monitoreDP-1/workspace0/last-image
        std::vector<std::string> parts = StringSplit(property, "/");

        if (parts.size() >= 6 && parts[3].rfind("monitor", 0) == 0) {
            monitors.push_back(parts[3]);
        }
    }

    std::sort(monitors.begin(), monitors.end());
    monitors.erase(std::unique(monitors.begin(), monitors.end()), monitors.end());

    return monitors;
}

bool XfceBackend::SetWallpaper(int number, const fs::path& image, const WorkspaceSettings::ScalingMode& scaling)
{
    int workspace_index = number - 1;

    std::optional<std::vector<std::string>> monitors = GetMonitorsForWorkspace(workspace_index);

    if (!monitors) {
        return false;
    }

    if (monitors->empty()) {
        log("WARNING: %s: no monitors have a backdrop for workspace %i yet.",
            __func__,
            number);
    }

    bool success = !monitors->empty();
    std::string style = ToString(ImageStyle(scaling));

    for (const auto& monitor : *monitors) {
        std::string prefix = "/backdrop/screen0/" + monitor + "/workspace" + ToString(workspace_index);

        success &= RunChecked(m_runner, {"xfconf-query", "--channel", "xfce4-desktop",
                                         "--property", prefix + "/last-image",
                                         "--create", "--type", "string",
                                         "--set", image.string()});

        success &= RunChecked(m_runner, {"xfconf-query", "--channel", "xfce4-desktop",
                                         "--property", prefix + "/image-style",
                                         "--create", "--type", "int",
                                         "--set", style});
    }

    success &= RunChecked(m_runner, {"xfdesktop", "--reload"});

    return success;
}

std::optional<std::string> XfceBackend::EditPanelXml(const std::string& panel_xml, const fs::path& icon)
{
    const std::string plugin_marker = "<property name=\"plugin-1\" type=\"string\" value=\"whiskermenu\">";

    std::vector<std::string> lines = StringSplit(panel_xml, "\n");

    auto plugin_line = std::find_if(lines.begin(), lines.end(), [&plugin_marker](const std::string& line) {
        return line.find(plugin_marker) != std::string::npos;
    });

    if (plugin_line == lines.end()) {
        return std::nullopt;
    }

    std::string plugin_indent = plugin_line->substr(0, plugin_line->find_first_not_of(" \t"));
    std::string icon_line = plugin_indent + "  <property name=\"button-icon\" type=\"string\" value=\""
            + XmlEscape(icon.string()) + "\"/>";

    auto next_line = plugin_line + 1;

    if (next_line != lines.end() && next_line->find("name=\"button-icon\"") != std::string::npos) {
        *next_line = icon_line;
    } else {
        lines.insert(next_line, icon_line);
    }

    std::string out;

    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += "\n";
        out += lines[i];
    }

    return out;
}

bool XfceBackend::SetPanelIcon(const fs::path& icon)
{
    std::ifstream panel_stream(m_panel_config_file);

    if (!panel_stream.is_open()) {
        error_log("%s: unable to open panel config %s",
                  __func__,
                  m_panel_config_file);
        return false;
    }

    std::stringstream buffer;
    buffer << panel_stream.rdbuf();
    panel_stream.close();

    std::optional<std::string> edited = EditPanelXml(buffer.str(), icon);

    if (!edited) {
        log("WARNING: %s: no whiskermenu plugin in %s, panel icon not set.",
            __func__,
            m_panel_config_file);
        return false;
    }

    if (!ReplaceFileContents(m_panel_config_file, *edited)) {
        return false;
    }

    // xfconfd caches the channel, so it has to be restarted for the panel to see the edit. It may not be running.
    CommandResult killall = m_runner.Run({"killall", "xfconfd"});

    if (!killall.Succeeded()) {
        debug_log("INFO: %s: xfconfd was not running (killall exit code %i).",
                  __func__,
                  killall.m_exit_code);
    }

    bool success = RunChecked(m_runner, {"xfce4-panel", "-r"});

    if (success) {
        log("INFO: %s: set XFCE menu icon to %s",
            __func__,
            icon);
    }

    return success;
}

bool XfceBackend::SetChannelProperty(const std::string& channel, const std::string& property, const std::string& value)
{
    CommandResult query = m_runner.Run({"xfconf-query", "-c", channel, "-p", property});

    if (query.Succeeded()) {
        return RunChecked(m_runner, {"xfconf-query", "-c", channel, "-p", property, "--set", value});
    }

    return RunChecked(m_runner, {"xfconf-query", "-c", channel, "-p", property,
                                 "--create", "--type", "string", "--set", value});
}

bool XfceBackend::ApplyThemes(int number, const WorkspaceSettings& settings)
{
    bool success = true;

    if (settings.m_icon_theme) {
        success &= SetChannelProperty("xsettings", "/Net/IconThemeName", *settings.m_icon_theme);
    }

    if (settings.m_gtk_theme) {
        success &= SetChannelProperty("xsettings", "/Net/ThemeName", *settings.m_gtk_theme);
    }

    if (settings.m_cursor_theme) {
        success &= SetChannelProperty("xsettings", "/Gtk/CursorThemeName", *settings.m_cursor_theme);
    }

    if (settings.m_wm_theme) {
        success &= SetChannelProperty("xfwm4", "/general/theme", *settings.m_wm_theme);
    }

    debug_log("INFO: %s: applied XFCE themes for workspace %i",
              __func__,
              number);

    return success;
}

bool XfceBackend::DisableSingleWorkspaceMode()
{
    return RunChecked(m_runner, {"xfconf-query", "-c", "xfce4-desktop", "-p", "/backdrop/single-workspace-mode",
                                 "--create", "--type", "bool", "--set", "false"});
}

bool XfceBackend::ConfigureScreenBlanking(const GlobalDesktopState& global)
{
    if (global.m_session_type != GlobalDesktopState::X11) {
        log("INFO: %s: screen blanking is only managed on x11 sessions.",
            __func__);
        return true;
    }

    bool success = true;

    if (global.m_blanking_timeout <= 0 || global.m_blanking_pause) {
        success &= RunChecked(m_runner, {"xset", "s", "off"});
        success &= RunChecked(m_runner, {"xset", "-dpms"});

        log("INFO: %s: screen blanking disabled (paused = %s, timeout = %is)",
            __func__,
            global.m_blanking_pause ? "true" : "false",
            global.m_blanking_timeout);
    } else {
        std::string timeout = ToString(global.m_blanking_timeout);

        success &= RunChecked(m_runner, {"xset", "s", timeout});
        success &= RunChecked(m_runner, {"xset", "+dpms"});
        success &= RunChecked(m_runner, {"xset", "dpms", timeout, timeout, timeout});

        log("INFO: %s: screen blanking set to %ss",
            __func__,
            timeout);
    }

    return success;
}

// Class GnomeBackend

GnomeBackend::GnomeBackend(SettingsWriter& writer)
    : m_writer(writer)
{}

GlobalDesktopState::DesktopEnvironment GnomeBackend::GetDesktopEnvironment() const
{
    return GlobalDesktopState::GNOME;
}

int GnomeBackend::GetCapabilities() const
{
    return WALLPAPER | THEMES;
}

bool GnomeBackend::SetWallpaper(int number, const fs::path& image, const WorkspaceSettings::ScalingMode& scaling)
{
    std::string uri = FileUri(image);
    bool success = true;

    success &= m_writer.SetString("org.gnome.desktop.background", "picture-uri", uri);
    success &= m_writer.SetString("org.gnome.desktop.background", "picture-uri-dark", uri);
    success &= m_writer.SetString("org.gnome.desktop.background", "picture-options", PictureOptions(scaling));

    return success;
}

bool GnomeBackend::ApplyThemes(int number, const WorkspaceSettings& settings)
{
    bool success = true;

    if (settings.m_icon_theme) {
        success &= m_writer.SetString("org.gnome.desktop.interface", "icon-theme", *settings.m_icon_theme);
    }

    if (settings.m_gtk_theme) {
        success &= m_writer.SetString("org.gnome.desktop.interface", "gtk-theme", *settings.m_gtk_theme);
    }

    if (settings.m_cursor_theme) {
        success &= m_writer.SetString("org.gnome.desktop.interface", "cursor-theme", *settings.m_cursor_theme);
    }

    return success;
}

// Class CinnamonBackend

CinnamonBackend::CinnamonBackend(SettingsWriter& writer, const fs::path& home)
    : m_writer(writer)
    , m_menu_config_file(home / ".config" / "cinnamon" / "spices" / "menu@cinnamon.org" / "0.json")
{}

GlobalDesktopState::DesktopEnvironment CinnamonBackend::GetDesktopEnvironment() const
{
    return GlobalDesktopState::CINNAMON;
}

int CinnamonBackend::GetCapabilities() const
{
    return WALLPAPER | PANEL_ICON | THEMES;
}

bool CinnamonBackend::SetWallpaper(int number, const fs::path& image, const WorkspaceSettings::ScalingMode& scaling)
{
    bool success = true;

    success &= m_writer.SetString("org.cinnamon.desktop.background", "picture-uri", FileUri(image));
    success &= m_writer.SetString("org.cinnamon.desktop.background", "picture-options", PictureOptions(scaling));

    return success;
}

bool CinnamonBackend::SetPanelIcon(const fs::path& icon)
{
    std::ifstream menu_stream(m_menu_config_file);

    if (!menu_stream.is_open()) {
        error_log("%s: unable to open menu applet config %s",
                  __func__,
                  m_menu_config_file);
        return false;
    }

    json root = json::parse(menu_stream, nullptr, false);
    menu_stream.close();

    if (root.is_discarded() || !root.is_object()) {
        error_log("%s: menu applet config %s is not a json object.",
                  __func__,
                  m_menu_config_file);
        return false;
    }

    json& menu_icon = root["menu-icon"];

    if (!menu_icon.is_object()) {
        menu_icon = json::object();
    }

    menu_icon["value"] = icon.string();

    std::string contents;

    // dump() throws on a path that is not valid UTF-8.
    try {
        contents = root.dump(4);
    } catch (const json::exception& e) {
        error_log("%s: unable to encode menu icon %s: %s",
                  __func__,
                  icon,
                  e.what());
        return false;
    }

    if (!ReplaceFileContents(m_menu_config_file, contents)) {
        return false;
    }

    log("INFO: %s: set Cinnamon menu icon to %s",
        __func__,
        icon);

    return true;
}

bool CinnamonBackend::ApplyThemes(int number, const WorkspaceSettings& settings)
{
    bool success = true;

    if (settings.m_icon_theme) {
        success &= m_writer.SetString("org.cinnamon.desktop.interface", "icon-theme", *settings.m_icon_theme);
    }

    if (settings.m_gtk_theme) {
        success &= m_writer.SetString("org.cinnamon.desktop.interface", "gtk-theme", *settings.m_gtk_theme);
    }

    if (settings.m_cursor_theme) {
        success &= m_writer.SetString("org.cinnamon.desktop.interface", "cursor-theme", *settings.m_cursor_theme);
    }

    if (settings.m_desktop_theme) {
        success &= m_writer.SetString("org.cinnamon.theme", "name", *settings.m_desktop_theme);
    }

    if (settings.m_wm_theme) {
        success &= m_writer.SetString("org.cinnamon.desktop.wm.preferences", "theme", *settings.m_wm_theme);
    }

    debug_log("INFO: %s: applied Cinnamon themes for workspace %i",
              __func__,
              number);

    return success;
}

// Class MateBackend

MateBackend::MateBackend(SettingsWriter& writer)
    : m_writer(writer)
{}

GlobalDesktopState::DesktopEnvironment MateBackend::GetDesktopEnvironment() const
{
    return GlobalDesktopState::MATE;
}

int MateBackend::GetCapabilities() const
{
    return WALLPAPER | THEMES;
}

bool MateBackend::SetWallpaper(int number, const fs::path& image, const WorkspaceSettings::ScalingMode& scaling)
{
    bool success = true;

    // MATE takes a plain path, not a URI.
    success &= m_writer.SetString("org.mate.background", "picture-filename", image.string());
    success &= m_writer.SetString("org.mate.background", "picture-options", PictureOptions(scaling));

    return success;
}

bool MateBackend::ApplyThemes(int number, const WorkspaceSettings& settings)
{
    bool success = true;

    if (settings.m_icon_theme) {
        success &= m_writer.SetString("org.mate.interface", "icon-theme", *settings.m_icon_theme);
    }

    if (settings.m_gtk_theme) {
        success &= m_writer.SetString("org.mate.interface", "gtk-theme", *settings.m_gtk_theme);
    }

    if (settings.m_cursor_theme) {
        success &= m_writer.SetString("org.mate.peripherals-mouse", "cursor-theme", *settings.m_cursor_theme);
    }

    if (settings.m_wm_theme) {
        success &= m_writer.SetString("org.mate.Marco.general", "theme", *settings.m_wm_theme);
    }

    return success;
}

// Class GenericBackend

GenericBackend::GenericBackend(CommandRunner& runner)
    : m_runner(runner)
{}

GlobalDesktopState::DesktopEnvironment GenericBackend::GetDesktopEnvironment() const
{
    return GlobalDesktopState::GENERIC;
}

int GenericBackend::GetCapabilities() const
{
    return WALLPAPER;
}

bool GenericBackend::SetWallpaper(int number, const fs::path& image, const WorkspaceSettings::ScalingMode& scaling)
{
    std::string option;

    switch (scaling) {
    case WorkspaceSettings::CENTERED:
        option = "--bg-center";
        break;
    case WorkspaceSettings::SCALED:
        option = "--bg-scale";
        break;
    case WorkspaceSettings::ZOOMED:
        option = "--bg-fill";
        break;
    }

    return RunChecked(m_runner, {"feh", option, image.string()});
}

bool GenericBackend::ApplyThemes(int number, const WorkspaceSettings& settings)
{
    if (settings.m_gtk_theme) {
        log("INFO: %s: generic window manager, GTK theme for workspace %i would be %s",
            __func__,
            number,
            *settings.m_gtk_theme);
    }

    return true;
}

// Class NullBackend

GlobalDesktopState::DesktopEnvironment NullBackend::GetDesktopEnvironment() const
{
    return GlobalDesktopState::UNKNOWN;
}

int NullBackend::GetCapabilities() const
{
    return 0;
}

bool NullBackend::SetWallpaper(int number, const fs::path& image, const WorkspaceSettings::ScalingMode& scaling)
{
    debug_log("INFO: %s: unknown desktop environment, not setting %s for workspace %i",
              __func__,
              image,
              number);

    return true;
}

std::string PictureOptions(const WorkspaceSettings::ScalingMode& scaling)
{
    std::string out;

    switch (scaling) {
    case WorkspaceSettings::CENTERED:
        out = "centered";
        break;
    case WorkspaceSettings::SCALED:
        out = "scaled";
        break;
    case WorkspaceSettings::ZOOMED:
        out = "zoom";
        break;
    }

    return out;
}

std::unique_ptr<Backend> CreateBackend(const GlobalDesktopState& global,
                                       CommandRunner& runner,
                                       SettingsWriter& writer,
                                       const fs::path& home)
{
    switch (global.m_desktop_environment) {
    case GlobalDesktopState::XFCE:
        return std::make_unique<XfceBackend>(runner, home);
    case GlobalDesktopState::GNOME:
        return std::make_unique<GnomeBackend>(writer);
    case GlobalDesktopState::CINNAMON:
        return std::make_unique<CinnamonBackend>(writer, home);
    case GlobalDesktopState::MATE:
        return std::make_unique<MateBackend>(writer);
    case GlobalDesktopState::GENERIC:
        return std::make_unique<GenericBackend>(runner);
    case GlobalDesktopState::UNKNOWN:
        break;
    }

    log("WARNING: %s: unknown desktop environment, wallpapers will not be changed.",
        __func__);

    return std::make_unique<NullBackend>();
}

} // namespace WallpaperRotate
