/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef BACKEND_H
#define BACKEND_H

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <command.h>
#include <config_store.h>
#include <gsettings.h>
#include <util.h>
#include <workspace.h>

namespace WallpaperRotate {

//!
//! \brief The Backend class is the interface to the desktop environment. There is one concrete class per supported
//! environment, chosen once at startup by CreateBackend(). Every operation returns true on success. Failures are logged
//! by the backend and are never fatal to the caller.
//!
class Backend
{
public:
    enum Capability {
        WALLPAPER = 1,
        PANEL_ICON = 2,
        THEMES = 4,
        SINGLE_WORKSPACE_MODE = 8,
        SCREEN_BLANKING = 16
    };

    virtual ~Backend() = default;

    virtual GlobalDesktopState::DesktopEnvironment GetDesktopEnvironment() const = 0;

    //!
    //! \brief Bitwise or of the Capability values this backend implements.
    //!
    virtual int GetCapabilities() const = 0;

    bool HasCapability(const Capability& capability) const;

    //!
    //! \brief Shows the image on the given workspace.
    //! \param number workspace number, 1 based
    //! \param image absolute path of the image
    //! \param scaling
    //!
    virtual bool SetWallpaper(int number, const fs::path& image, const WorkspaceSettings::ScalingMode& scaling) = 0;

    //!
    //! \brief Replaces the application menu button icon of the panel. Only meaningful with PANEL_ICON.
    //!
    virtual bool SetPanelIcon(const fs::path& icon);

    //!
    //! \brief Applies the theme fields that are present in settings. Absent fields are left alone.
    //!
    virtual bool ApplyThemes(int number, const WorkspaceSettings& settings);

    //!
    //! \brief Turns off any desktop setting that shows the same wallpaper on every workspace.
    //!
    virtual bool DisableSingleWorkspaceMode();

    //!
    //! \brief Applies the blanking timeout and pause setting. Called once at startup.
    //!
    virtual bool ConfigureScreenBlanking(const GlobalDesktopState& global);

protected:
    //!
    //! \brief Runs the command and logs a failure.
    //! \return true if the command exited 0.
    //!
    bool RunChecked(CommandRunner& runner, const std::vector<std::string>& argv) const;
};

//!
//! \brief XFCE: xfconf-query for the desktop, xsettings and xfwm4 channels, the whiskermenu button in the panel XML
//! config, and xset for blanking.
//!
class XfceBackend : public Backend
{
public:
    XfceBackend(CommandRunner& runner, const fs::path& home);

    GlobalDesktopState::DesktopEnvironment GetDesktopEnvironment() const override;
    int GetCapabilities() const override;

    bool SetWallpaper(int number, const fs::path& image, const WorkspaceSettings::ScalingMode& scaling) override;
    bool SetPanelIcon(const fs::path& icon) override;
    bool ApplyThemes(int number, const WorkspaceSettings& settings) override;
    bool DisableSingleWorkspaceMode() override;
    bool ConfigureScreenBlanking(const GlobalDesktopState& global) override;

    //!
    //! \brief Returns the xfdesktop image-style code for the scaling mode.
    //!
    static int ImageStyle(const WorkspaceSettings::ScalingMode& scaling);

    //!
    //! \brief Monitor names that have a last-image property for the workspace, sorted and without duplicates.
    //! \param workspace_index 0 based, as xfdesktop numbers workspaces.
    //! \return std::nullopt if the property list could not be read.
    //!
    std::optional<std::vector<std::string>> GetMonitorsForWorkspace(int workspace_index);

    //!
    //! \brief Replaces (or inserts) the button-icon property that follows the whiskermenu plugin line.
    //! \param panel_xml contents of xfce4-panel.xml
    //! \param icon
    //! \return the edited contents, or std::nullopt if there is no whiskermenu plugin.
    //!
    static std::optional<std::string> EditPanelXml(const std::string& panel_xml, const fs::path& icon);

private:
    bool SetChannelProperty(const std::string& channel, const std::string& property, const std::string& value);

    CommandRunner& m_runner;
    fs::path m_panel_config_file;
};

//!
//! \brief GNOME: org.gnome.desktop.background and org.gnome.desktop.interface through GSettings.
//!
class GnomeBackend : public Backend
{
public:
    explicit GnomeBackend(SettingsWriter& writer);

    GlobalDesktopState::DesktopEnvironment GetDesktopEnvironment() const override;
    int GetCapabilities() const override;

    bool SetWallpaper(int number, const fs::path& image, const WorkspaceSettings::ScalingMode& scaling) override;
    bool ApplyThemes(int number, const WorkspaceSettings& settings) override;

private:
    SettingsWriter& m_writer;
};

//!
//! \brief Cinnamon: org.cinnamon.* through GSettings and the menu applet json config for the panel icon.
//!
class CinnamonBackend : public Backend
{
public:
    CinnamonBackend(SettingsWriter& writer, const fs::path& home);

    GlobalDesktopState::DesktopEnvironment GetDesktopEnvironment() const override;
    int GetCapabilities() const override;

    bool SetWallpaper(int number, const fs::path& image, const WorkspaceSettings::ScalingMode& scaling) override;
    bool SetPanelIcon(const fs::path& icon) override;
    bool ApplyThemes(int number, const WorkspaceSettings& settings) override;

private:
    SettingsWriter& m_writer;
    fs::path m_menu_config_file;
};

//!
//! \brief MATE: org.mate.* through GSettings.
//!
class MateBackend : public Backend
{
public:
    explicit MateBackend(SettingsWriter& writer);

    GlobalDesktopState::DesktopEnvironment GetDesktopEnvironment() const override;
    int GetCapabilities() const override;

    bool SetWallpaper(int number, const fs::path& image, const WorkspaceSettings::ScalingMode& scaling) override;
    bool ApplyThemes(int number, const WorkspaceSettings& settings) override;

private:
    SettingsWriter& m_writer;
};

//!
//! \brief Any other window manager: feh sets the root window background. Themes are only logged.
//!
class GenericBackend : public Backend
{
public:
    explicit GenericBackend(CommandRunner& runner);

    GlobalDesktopState::DesktopEnvironment GetDesktopEnvironment() const override;
    int GetCapabilities() const override;

    bool SetWallpaper(int number, const fs::path& image, const WorkspaceSettings::ScalingMode& scaling) override;
    bool ApplyThemes(int number, const WorkspaceSettings& settings) override;

private:
    CommandRunner& m_runner;
};

//!
//! \brief Unknown desktop environment. Every operation is a successful no-op.
//!
class NullBackend : public Backend
{
public:
    GlobalDesktopState::DesktopEnvironment GetDesktopEnvironment() const override;
    int GetCapabilities() const override;

    bool SetWallpaper(int number, const fs::path& image, const WorkspaceSettings::ScalingMode& scaling) override;
};

//!
//! \brief GNOME, Cinnamon and MATE spelling of the scaling mode for picture-options.
//!
std::string PictureOptions(const WorkspaceSettings::ScalingMode& scaling);

//!
//! \brief Selects the backend for the desktop environment. The runner and writer must outlive the backend.
//!
std::unique_ptr<Backend> CreateBackend(const GlobalDesktopState& global,
                                       CommandRunner& runner,
                                       SettingsWriter& writer,
                                       const fs::path& home);

} // namespace WallpaperRotate

#endif // BACKEND_H
