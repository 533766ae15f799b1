/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <atomic>
#include <cerrno>      // For errno
#include <csignal>     // For signal handling (sigaction etc)
#include <cstring>     // For strerror, memset
#include <map>
#include <memory>

#include <backend.h>
#include <command.h>
#include <config_store.h>
#include <desktop_probe.h>
#include <gsettings.h>
#include <release.h>
#include <scheduler.h>
#include <state_store.h>
#include <telemetry.h>
#include <util.h>
#include <workspace_controller.h>

using namespace WallpaperRotate;

//! Global flag for signal handling
std::atomic<bool> g_shutdown_requested = false;

//!
//! \brief Signal handler
//! \param signum
//!
void HandleSignal(int signum) {
    if (signum == SIGINT || signum == SIGTERM) {
        // Use log() here as it's presumably safe enough during shutdown signal
        log("INFO: %s: Received signal %d. Requesting shutdown.",
            __func__,
            signum);
        g_shutdown_requested.store(true);
    } else {
        log("INFO: %s: Received unexpected signal %d.",
            __func__,
            signum);
    }
}

//!
//! \brief main
//! \param argc
//! \param argv. One optional argument, the config file path. Defaults to $HOME/awp/awp_config.ini.
//! \return exit code, 0 for normal, non-zero otherwise.
//!
int main(int argc, char* argv[])
{
    const char* journal_stream = getenv("JOURNAL_STREAM");
    if (journal_stream != nullptr && strlen(journal_stream) > 0) {
        // If JOURNAL_STREAM is set, assume output is handled by journald
        g_log_timestamps.store(false);
    } else {
        g_log_timestamps.store(true);
    }

    // --- Configuration Loading ---
    //
    // We can safely use error_log and log before reading config.
    if (argc > 2) {
        error_log("%s: Usage: wallpaper_rotate [config_file]",
                  __func__);
        return 1;
    }

    fs::path config_file_path = (argc == 2) ? fs::path(argv[1]) : DefaultConfigFile();

    log("INFO: %s: wallpaper_rotate %s, using config from %s",
        __func__,
        g_version,
        config_file_path);

    ConfigStore config_store(config_file_path);
    ConfigSnapshot snapshot;

    try {
        snapshot = config_store.Load();
    } catch (const ConfigMissingException& e) {
        error_log("%s: %s Run the setup tool first.",
                  __func__,
                  e.what());
        return 1;
    } catch (const ConfigException& e) {
        error_log("%s: %s",
                  __func__,
                  e.what());
        return 1;
    }

    g_debug = config_store.IsDebug();

    debug_log("INFO: %s: desktop environment %s, session %s, blanking %s",
              __func__,
              GlobalDesktopState::DesktopEnvironmentToString(snapshot.m_global.m_desktop_environment),
              GlobalDesktopState::SessionTypeToString(snapshot.m_global.m_session_type),
              snapshot.m_global.BlankingToString());

    // --- Signal Handling Setup ---
    g_shutdown_requested = false;
    struct sigaction action;
    memset(&action, 0, sizeof(struct sigaction));
    action.sa_handler = HandleSignal;
    action.sa_flags = 0;
    sigemptyset(&action.sa_mask);
    if (sigaction(SIGINT, &action, nullptr) == -1 || sigaction(SIGTERM, &action, nullptr) == -1) {
        error_log("%s: Failed to set signal handlers: %s",
                  __func__,
                  strerror(errno));
        return 1;
    }

    // --- Desktop backend ---
    ProcessCommandRunner command_runner;
    GioSettingsWriter settings_writer;

    std::unique_ptr<Backend> backend = CreateBackend(snapshot.m_global,
                                                     command_runner,
                                                     settings_writer,
                                                     fs::path(GetEnvVariable("HOME").value_or(".")));

    if (backend->HasCapability(Backend::SCREEN_BLANKING)
        && !backend->ConfigureScreenBlanking(snapshot.m_global)) {
        error_log("%s: screen blanking could not be configured.",
                  __func__);
    }

    if (!backend->DisableSingleWorkspaceMode()) {
        error_log("%s: unable to disable single workspace mode.",
                  __func__);
    }

    // --- Workspaces ---
    StateStore state_store(StateFileFor(config_file_path));
    TelemetryWriter telemetry(TelemetryFileFor(config_file_path));

    std::map<int, std::unique_ptr<WorkspaceController>> controllers;

    for (const auto& settings : snapshot.m_workspaces) {
        controllers[settings.m_number] = std::make_unique<WorkspaceController>(settings,
                                                                               config_store,
                                                                               state_store,
                                                                               *backend,
                                                                               &telemetry);
    }

    if (controllers.empty()) {
        error_log("%s: no workspace sections found in %s",
                  __func__,
                  config_file_path);
        return 1;
    }

    log("INFO: %s: Loaded %u workspaces. State: %s",
        __func__,
        controllers.size(),
        state_store.GetStateFile());

    // --- Main loop ---
    X11DesktopProbe probe;
    Scheduler scheduler(probe, *backend, std::move(controllers));

    scheduler.Run(g_shutdown_requested);

    log("INFO: %s: Shutdown requested. Exiting.",
        __func__);

    return 0;
}
