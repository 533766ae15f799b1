/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <gtest/gtest.h>
#include <backend.h>

#include "test_fakes.h"

#include <filesystem>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

using namespace WallpaperRotate;

namespace {

typedef std::vector<std::string> Argv;

const std::string XFCE_PROPERTY_LIST =
    "/backdrop/screen0/monitorHDMI-1/workspace0/last-image\n"
    "/backdrop/screen0/monitorHDMI-1/workspace1/last-image\n"
    "/backdrop/screen0/monitoreDP-1/workspace1/image-style\n"
    "/backdrop/screen0/monitoreDP-1/workspace1/last-image\n"
    "/backdrop/screen0/monitorHDMI-1/workspace1/last-image\n"
    "/backdrop/single-workspace-mode\n";

std::string ReadFile(const fs::path& path)
{
    std::ifstream f(path);
    std::stringstream buffer;
    buffer << f.rdbuf();
    return buffer.str();
}

} // anonymous namespace

class BackendTest : public ::testing::Test
{
protected:
    fs::path m_home;
    RecordingCommandRunner m_runner;
    RecordingSettingsWriter m_writer;

    void SetUp() override
    {
        m_home = fs::temp_directory_path() / "wallpaper_rotate_test_backend_home";
        fs::remove_all(m_home);
        fs::create_directories(m_home);
    }

    void TearDown() override
    {
        fs::remove_all(m_home);
    }

    fs::path PanelXml() const
    {
        return m_home / ".config" / "xfce4" / "xfconf" / "xfce-perchannel-xml" / "xfce4-panel.xml";
    }

    fs::path MenuJson() const
    {
        return m_home / ".config" / "cinnamon" / "spices" / "menu@cinnamon.org" / "0.json";
    }

    static void WriteFile(const fs::path& path, const std::string& content)
    {
        fs::create_directories(path.parent_path());
        std::ofstream f(path, std::ios::trunc);
        f << content;
    }
};

// ============================================================================
// CreateBackend
// ============================================================================

TEST_F(BackendTest, FactorySelectsByDesktop)
{
    GlobalDesktopState global;

    for (const auto& desktop : {GlobalDesktopState::XFCE, GlobalDesktopState::GNOME, GlobalDesktopState::CINNAMON,
                                GlobalDesktopState::MATE, GlobalDesktopState::GENERIC, GlobalDesktopState::UNKNOWN}) {
        global.m_desktop_environment = desktop;

        std::unique_ptr<Backend> backend = CreateBackend(global, m_runner, m_writer, m_home);

        ASSERT_NE(backend, nullptr);
        EXPECT_EQ(backend->GetDesktopEnvironment(), desktop);
    }
}

TEST_F(BackendTest, Capabilities)
{
    XfceBackend xfce(m_runner, m_home);
    GnomeBackend gnome(m_writer);
    CinnamonBackend cinnamon(m_writer, m_home);
    MateBackend mate(m_writer);
    NullBackend null_backend;

    EXPECT_TRUE(xfce.HasCapability(Backend::PANEL_ICON));
    EXPECT_TRUE(xfce.HasCapability(Backend::SCREEN_BLANKING));
    EXPECT_FALSE(gnome.HasCapability(Backend::PANEL_ICON));
    EXPECT_TRUE(cinnamon.HasCapability(Backend::PANEL_ICON));
    EXPECT_FALSE(mate.HasCapability(Backend::PANEL_ICON));
    EXPECT_FALSE(null_backend.HasCapability(Backend::WALLPAPER));
}

// ============================================================================
// XFCE
// ============================================================================

TEST_F(BackendTest, XfceMonitorsForWorkspace)
{
    m_runner.SetResult({"xfconf-query", "-c", "xfce4-desktop", "-l"}, 0, XFCE_PROPERTY_LIST);

    XfceBackend backend(m_runner, m_home);

    std::optional<std::vector<std::string>> monitors = backend.GetMonitorsForWorkspace(1);

    ASSERT_TRUE(monitors.has_value());
    EXPECT_EQ(*monitors, (std::vector<std::string>{"monitorHDMI-1", "monitoreDP-1"}));
}

TEST_F(BackendTest, XfceSetWallpaperPerMonitor)
{
    m_runner.SetResult({"xfconf-query", "-c", "xfce4-desktop", "-l"}, 0, XFCE_PROPERTY_LIST);

    XfceBackend backend(m_runner, m_home);

    EXPECT_TRUE(backend.SetWallpaper(2, "/pics/a.jpg", WorkspaceSettings::ZOOMED));

    std::vector<Argv> expected = {
        {"xfconf-query", "-c", "xfce4-desktop", "-l"},
        {"xfconf-query", "--channel", "xfce4-desktop",
         "--property", "/backdrop/screen0/monitorHDMI-1/workspace1/last-image",
         "--create", "--type", "string", "--set", "/pics/a.jpg"},
        {"xfconf-query", "--channel", "xfce4-desktop",
         "--property", "/backdrop/screen0/monitorHDMI-1/workspace1/image-style",
         "--create", "--type", "int", "--set", "5"},
        {"xfconf-query", "--channel", "xfce4-desktop",
         "--property", "/backdrop/screen0/monitoreDP-1/workspace1/last-image",
         "--create", "--type", "string", "--set", "/pics/a.jpg"},
        {"xfconf-query", "--channel", "xfce4-desktop",
         "--property", "/backdrop/screen0/monitoreDP-1/workspace1/image-style",
         "--create", "--type", "int", "--set", "5"},
        {"xfdesktop", "--reload"}
    };

    EXPECT_EQ(m_runner.m_commands, expected);
}

TEST_F(BackendTest, XfceImageStyles)
{
    EXPECT_EQ(XfceBackend::ImageStyle(WorkspaceSettings::CENTERED), 1);
    EXPECT_EQ(XfceBackend::ImageStyle(WorkspaceSettings::SCALED), 4);
    EXPECT_EQ(XfceBackend::ImageStyle(WorkspaceSettings::ZOOMED), 5);
}

TEST_F(BackendTest, XfceSetWallpaperFailsWhenListingFails)
{
    m_runner.SetResult({"xfconf-query", "-c", "xfce4-desktop", "-l"}, 1);

    XfceBackend backend(m_runner, m_home);

    EXPECT_FALSE(backend.SetWallpaper(1, "/pics/a.jpg", WorkspaceSettings::SCALED));
    EXPECT_EQ(m_runner.m_commands.size(), 1u);
}

TEST_F(BackendTest, XfceSetWallpaperReportsCommandFailure)
{
    m_runner.SetResult({"xfconf-query", "-c", "xfce4-desktop", "-l"}, 0, XFCE_PROPERTY_LIST);
    m_runner.SetProgramResult("xfdesktop", 1);

    XfceBackend backend(m_runner, m_home);

    EXPECT_FALSE(backend.SetWallpaper(2, "/pics/a.jpg", WorkspaceSettings::SCALED));
}

TEST_F(BackendTest, XfceThemesSetExistingAndCreateMissing)
{
    // /Net/IconThemeName exists, /Net/ThemeName does not.
    m_runner.SetResult({"xfconf-query", "-c", "xsettings", "-p", "/Net/ThemeName"}, 1);

    WorkspaceSettings settings;
    settings.m_icon_theme = "Papirus";
    settings.m_gtk_theme = "Greybird";

    XfceBackend backend(m_runner, m_home);

    EXPECT_TRUE(backend.ApplyThemes(1, settings));

    std::vector<Argv> expected = {
        {"xfconf-query", "-c", "xsettings", "-p", "/Net/IconThemeName"},
        {"xfconf-query", "-c", "xsettings", "-p", "/Net/IconThemeName", "--set", "Papirus"},
        {"xfconf-query", "-c", "xsettings", "-p", "/Net/ThemeName"},
        {"xfconf-query", "-c", "xsettings", "-p", "/Net/ThemeName", "--create", "--type", "string", "--set", "Greybird"}
    };

    EXPECT_EQ(m_runner.m_commands, expected);
}

TEST_F(BackendTest, XfceThemesAbsentFieldsUntouched)
{
    XfceBackend backend(m_runner, m_home);

    EXPECT_TRUE(backend.ApplyThemes(1, WorkspaceSettings()));
    EXPECT_TRUE(m_runner.m_commands.empty());
}

TEST_F(BackendTest, XfceWmTheme)
{
    WorkspaceSettings settings;
    settings.m_wm_theme = "Default";
    settings.m_desktop_theme = "ignored";

    XfceBackend backend(m_runner, m_home);

    EXPECT_TRUE(backend.ApplyThemes(1, settings));
    ASSERT_EQ(m_runner.m_commands.size(), 2u);
    EXPECT_EQ(m_runner.m_commands[1], (Argv{"xfconf-query", "-c", "xfwm4", "-p", "/general/theme", "--set", "Default"}));
}

TEST_F(BackendTest, XfceDisableSingleWorkspaceMode)
{
    XfceBackend backend(m_runner, m_home);

    EXPECT_TRUE(backend.DisableSingleWorkspaceMode());
    EXPECT_EQ(m_runner.m_commands,
              (std::vector<Argv>{{"xfconf-query", "-c", "xfce4-desktop", "-p", "/backdrop/single-workspace-mode",
                                  "--create", "--type", "bool", "--set", "false"}}));
}

TEST_F(BackendTest, XfceBlankingEnabled)
{
    GlobalDesktopState global;
    global.m_blanking_timeout = 600;

    XfceBackend backend(m_runner, m_home);

    EXPECT_TRUE(backend.ConfigureScreenBlanking(global));
    EXPECT_EQ(m_runner.m_commands, (std::vector<Argv>{{"xset", "s", "600"},
                                                      {"xset", "+dpms"},
                                                      {"xset", "dpms", "600", "600", "600"}}));
}

TEST_F(BackendTest, XfceBlankingPausedIsOff)
{
    GlobalDesktopState global;
    global.m_blanking_timeout = 600;
    global.m_blanking_pause = true;

    XfceBackend backend(m_runner, m_home);

    EXPECT_TRUE(backend.ConfigureScreenBlanking(global));
    EXPECT_EQ(m_runner.m_commands, (std::vector<Argv>{{"xset", "s", "off"}, {"xset", "-dpms"}}));
}

TEST_F(BackendTest, XfceBlankingSkippedOnWayland)
{
    GlobalDesktopState global;
    global.m_session_type = GlobalDesktopState::WAYLAND;
    global.m_blanking_timeout = 600;

    XfceBackend backend(m_runner, m_home);

    EXPECT_TRUE(backend.ConfigureScreenBlanking(global));
    EXPECT_TRUE(m_runner.m_commands.empty());
}

TEST_F(BackendTest, XfcePanelXmlReplacesButtonIcon)
{
    std::string xml =
        "<channel name=\"xfce4-panel\" version=\"1.0\">\n"
        "  <property name=\"plugins\" type=\"empty\">\n"
        "    <property name=\"plugin-1\" type=\"string\" value=\"whiskermenu\">\n"
        "      <property name=\"button-icon\" type=\"string\" value=\"old.png\"/>\n"
        "    </property>\n"
        "  </property>\n"
        "</channel>\n";

    std::optional<std::string> edited = XfceBackend::EditPanelXml(xml, "/icons/a&b.png");

    ASSERT_TRUE(edited.has_value());
    EXPECT_EQ(*edited,
              "<channel name=\"xfce4-panel\" version=\"1.0\">\n"
              "  <property name=\"plugins\" type=\"empty\">\n"
              "    <property name=\"plugin-1\" type=\"string\" value=\"whiskermenu\">\n"
              "      <property name=\"button-icon\" type=\"string\" value=\"/icons/a&amp;b.png\"/>\n"
              "    </property>\n"
              "  </property>\n"
              "</channel>\n");
}

TEST_F(BackendTest, XfcePanelXmlInsertsButtonIcon)
{
    std::string xml =
        "    <property name=\"plugin-1\" type=\"string\" value=\"whiskermenu\">\n"
        "      <property name=\"show-button-title\" type=\"bool\" value=\"false\"/>\n"
        "    </property>\n";

    std::optional<std::string> edited = XfceBackend::EditPanelXml(xml, "/icons/new.png");

    ASSERT_TRUE(edited.has_value());
    EXPECT_EQ(*edited,
              "    <property name=\"plugin-1\" type=\"string\" value=\"whiskermenu\">\n"
              "      <property name=\"button-icon\" type=\"string\" value=\"/icons/new.png\"/>\n"
              "      <property name=\"show-button-title\" type=\"bool\" value=\"false\"/>\n"
              "    </property>\n");
}

TEST_F(BackendTest, XfcePanelXmlWithoutWhiskermenu)
{
    EXPECT_FALSE(XfceBackend::EditPanelXml("<channel/>\n", "/icons/new.png").has_value());
}

TEST_F(BackendTest, XfceSetPanelIconEditsFileAndRestartsPanel)
{
    WriteFile(PanelXml(),
              "<property name=\"plugin-1\" type=\"string\" value=\"whiskermenu\">\n"
              "  <property name=\"button-icon\" type=\"string\" value=\"old.png\"/>\n"
              "</property>\n");

    XfceBackend backend(m_runner, m_home);

    EXPECT_TRUE(backend.SetPanelIcon("/icons/ws2.png"));
    EXPECT_NE(ReadFile(PanelXml()).find("value=\"/icons/ws2.png\""), std::string::npos);
    EXPECT_EQ(m_runner.m_commands, (std::vector<Argv>{{"killall", "xfconfd"}, {"xfce4-panel", "-r"}}));
}

TEST_F(BackendTest, XfceSetPanelIconMissingFile)
{
    XfceBackend backend(m_runner, m_home);

    EXPECT_FALSE(backend.SetPanelIcon("/icons/ws2.png"));
    EXPECT_TRUE(m_runner.m_commands.empty());
}

// ============================================================================
// GNOME
// ============================================================================

TEST_F(BackendTest, GnomeSetWallpaper)
{
    GnomeBackend backend(m_writer);

    EXPECT_TRUE(backend.SetWallpaper(1, "/pics/a b.jpg", WorkspaceSettings::ZOOMED));

    std::vector<RecordingSettingsWriter::Write> expected = {
        {"org.gnome.desktop.background", "picture-uri", "file:///pics/a b.jpg"},
        {"org.gnome.desktop.background", "picture-uri-dark", "file:///pics/a b.jpg"},
        {"org.gnome.desktop.background", "picture-options", "zoom"}
    };

    EXPECT_EQ(m_writer.m_writes, expected);
}

TEST_F(BackendTest, GnomeThemesOnlyPresentFields)
{
    WorkspaceSettings settings;
    settings.m_cursor_theme = "DMZ-White";

    GnomeBackend backend(m_writer);

    EXPECT_TRUE(backend.ApplyThemes(1, settings));
    EXPECT_EQ(m_writer.m_writes, (std::vector<RecordingSettingsWriter::Write>{
                                     {"org.gnome.desktop.interface", "cursor-theme", "DMZ-White"}}));
}

TEST_F(BackendTest, GnomeRejectedKeyIsFailure)
{
    m_writer.m_rejected.insert("org.gnome.desktop.background picture-uri-dark");

    GnomeBackend backend(m_writer);

    EXPECT_FALSE(backend.SetWallpaper(1, "/pics/a.jpg", WorkspaceSettings::SCALED));
    EXPECT_EQ(m_writer.m_writes.size(), 3u);
}

TEST_F(BackendTest, GnomeHasNoPanelIcon)
{
    GnomeBackend backend(m_writer);

    EXPECT_FALSE(backend.SetPanelIcon("/icons/a.png"));
    EXPECT_TRUE(backend.DisableSingleWorkspaceMode());
    EXPECT_TRUE(m_writer.m_writes.empty());
}

// ============================================================================
// Cinnamon
// ============================================================================

TEST_F(BackendTest, CinnamonSetWallpaper)
{
    CinnamonBackend backend(m_writer, m_home);

    EXPECT_TRUE(backend.SetWallpaper(3, "/pics/c.png", WorkspaceSettings::CENTERED));
    EXPECT_EQ(m_writer.m_writes, (std::vector<RecordingSettingsWriter::Write>{
                                     {"org.cinnamon.desktop.background", "picture-uri", "file:///pics/c.png"},
                                     {"org.cinnamon.desktop.background", "picture-options", "centered"}}));
}

TEST_F(BackendTest, CinnamonThemes)
{
    WorkspaceSettings settings;
    settings.m_icon_theme = "Mint-Y";
    settings.m_desktop_theme = "Mint-Y-Dark";
    settings.m_wm_theme = "Mint-Y";

    CinnamonBackend backend(m_writer, m_home);

    EXPECT_TRUE(backend.ApplyThemes(1, settings));
    EXPECT_EQ(m_writer.m_writes, (std::vector<RecordingSettingsWriter::Write>{
                                     {"org.cinnamon.desktop.interface", "icon-theme", "Mint-Y"},
                                     {"org.cinnamon.theme", "name", "Mint-Y-Dark"},
                                     {"org.cinnamon.desktop.wm.preferences", "theme", "Mint-Y"}}));
}

TEST_F(BackendTest, CinnamonSetPanelIcon)
{
    WriteFile(MenuJson(), "{\"menu-icon\": {\"type\": \"iconfilechooser\", \"value\": \"old\"}, \"other\": 1}");

    CinnamonBackend backend(m_writer, m_home);

    EXPECT_TRUE(backend.SetPanelIcon("/icons/ws1.svg"));

    nlohmann::json root = nlohmann::json::parse(ReadFile(MenuJson()));

    EXPECT_EQ(root["menu-icon"]["value"], "/icons/ws1.svg");
    EXPECT_EQ(root["menu-icon"]["type"], "iconfilechooser");
    EXPECT_EQ(root["other"], 1);
}

TEST_F(BackendTest, CinnamonSetPanelIconNonUtf8Path)
{
    const std::string original = "{\"menu-icon\": {\"value\": \"old\"}}";
    WriteFile(MenuJson(), original);

    CinnamonBackend backend(m_writer, m_home);

    // Latin-1 e-acute, a legal byte in a Linux file name.
    bool result = true;
    EXPECT_NO_THROW(result = backend.SetPanelIcon("/home/u/ic\xe9ne.png"));
    EXPECT_FALSE(result);
    EXPECT_EQ(ReadFile(MenuJson()), original);
}

TEST_F(BackendTest, CinnamonSetPanelIconCorruptFile)
{
    WriteFile(MenuJson(), "{not json");

    CinnamonBackend backend(m_writer, m_home);

    EXPECT_FALSE(backend.SetPanelIcon("/icons/ws1.svg"));
    EXPECT_EQ(ReadFile(MenuJson()), "{not json");
}

// ============================================================================
// MATE
// ============================================================================

TEST_F(BackendTest, MateSetWallpaperUsesPlainPath)
{
    MateBackend backend(m_writer);

    EXPECT_TRUE(backend.SetWallpaper(1, "/pics/m.jpg", WorkspaceSettings::SCALED));
    EXPECT_EQ(m_writer.m_writes, (std::vector<RecordingSettingsWriter::Write>{
                                     {"org.mate.background", "picture-filename", "/pics/m.jpg"},
                                     {"org.mate.background", "picture-options", "scaled"}}));
}

TEST_F(BackendTest, MateThemes)
{
    WorkspaceSettings settings;
    settings.m_gtk_theme = "TraditionalOk";
    settings.m_cursor_theme = "mate-black";
    settings.m_wm_theme = "Menta";

    MateBackend backend(m_writer);

    EXPECT_TRUE(backend.ApplyThemes(1, settings));
    EXPECT_EQ(m_writer.m_writes, (std::vector<RecordingSettingsWriter::Write>{
                                     {"org.mate.interface", "gtk-theme", "TraditionalOk"},
                                     {"org.mate.peripherals-mouse", "cursor-theme", "mate-black"},
                                     {"org.mate.Marco.general", "theme", "Menta"}}));
}

// ============================================================================
// Generic and unknown
// ============================================================================

TEST_F(BackendTest, GenericUsesFeh)
{
    GenericBackend backend(m_runner);

    EXPECT_TRUE(backend.SetWallpaper(1, "/pics/a.jpg", WorkspaceSettings::CENTERED));
    EXPECT_TRUE(backend.SetWallpaper(1, "/pics/a.jpg", WorkspaceSettings::SCALED));
    EXPECT_TRUE(backend.SetWallpaper(1, "/pics/a.jpg", WorkspaceSettings::ZOOMED));

    EXPECT_EQ(m_runner.m_commands, (std::vector<Argv>{{"feh", "--bg-center", "/pics/a.jpg"},
                                                      {"feh", "--bg-scale", "/pics/a.jpg"},
                                                      {"feh", "--bg-fill", "/pics/a.jpg"}}));
}

TEST_F(BackendTest, GenericFehMissing)
{
    m_runner.SetProgramResult("feh", 127);

    GenericBackend backend(m_runner);

    EXPECT_FALSE(backend.SetWallpaper(1, "/pics/a.jpg", WorkspaceSettings::SCALED));
}

TEST_F(BackendTest, NullBackendDoesNothing)
{
    NullBackend backend;

    EXPECT_TRUE(backend.SetWallpaper(1, "/pics/a.jpg", WorkspaceSettings::SCALED));
    EXPECT_TRUE(backend.ApplyThemes(1, WorkspaceSettings()));
    EXPECT_TRUE(backend.DisableSingleWorkspaceMode());
}

TEST(PictureOptions, Mapping)
{
    EXPECT_EQ(PictureOptions(WorkspaceSettings::CENTERED), "centered");
    EXPECT_EQ(PictureOptions(WorkspaceSettings::SCALED), "scaled");
    EXPECT_EQ(PictureOptions(WorkspaceSettings::ZOOMED), "zoom");
}

// ============================================================================
// ProcessCommandRunner
// ============================================================================

TEST(ProcessCommandRunner, CapturesOutputAndExitCode)
{
    ProcessCommandRunner runner;

    CommandResult result = runner.Run({"sh", "-c", "printf 'hello'; exit 3"});

    EXPECT_EQ(result.m_exit_code, 3);
    EXPECT_EQ(result.m_output, "hello");
    EXPECT_FALSE(result.Succeeded());
}

TEST(ProcessCommandRunner, StderrIsNotCaptured)
{
    ProcessCommandRunner runner;

    CommandResult result = runner.Run({"sh", "-c", "printf 'out'; printf 'err' 1>&2"});

    EXPECT_TRUE(result.Succeeded());
    EXPECT_EQ(result.m_output, "out");
}

TEST(ProcessCommandRunner, MissingProgram)
{
    ProcessCommandRunner runner;

    CommandResult result = runner.Run({"wallpaper_rotate_no_such_program_xyz"});

    EXPECT_EQ(result.m_exit_code, 127);
}

TEST(ProcessCommandRunner, EmptyCommand)
{
    ProcessCommandRunner runner;

    EXPECT_EQ(runner.Run({}).m_exit_code, -1);
}

TEST(CommandToString, JoinsWithSpaces)
{
    EXPECT_EQ(CommandToString({"xset", "s", "off"}), "xset s off");
    EXPECT_EQ(CommandToString({}), "");
}
