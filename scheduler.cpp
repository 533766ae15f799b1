/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <scheduler.h>

#include <thread>

namespace WallpaperRotate {

Scheduler::Scheduler(DesktopProbe& probe,
                     Backend& backend,
                     std::map<int, std::unique_ptr<WorkspaceController>> controllers)
    : m_probe(probe)
    , m_backend(backend)
    , m_controllers(std::move(controllers))
{}

void Scheduler::Tick(const std::chrono::steady_clock::time_point& now)
{
    std::optional<int> number = m_probe.CurrentWorkspaceNumber();

    if (!number) {
        return;
    }

    WorkspaceController* controller = GetController(*number);

    if (!controller) {
        return;
    }

    // The desktop can turn this back on behind our back, e.g. from its settings dialog.
    if (!m_backend.DisableSingleWorkspaceMode()) {
        debug_log("WARNING: %s: unable to disable single workspace mode.",
                  __func__);
    }

    if (number != m_last_workspace) {
        debug_log("INFO: %s: switched to workspace %i",
                  __func__,
                  *number);

        controller->Reload();
        controller->ApplyIndex(controller->GetCurrentIndex());
        controller->ResetSwitchTimer(now);

        // Set before the icon and themes. A failure there must not count as a new switch on the next tick.
        m_last_workspace = number;

        const WorkspaceSettings& settings = controller->GetSettings();

        if (!settings.m_icon.empty() && m_backend.HasCapability(Backend::PANEL_ICON)) {
            if (!m_backend.SetPanelIcon(settings.m_icon)) {
                error_log("%s: WS%i: failed to set panel icon %s",
                          __func__,
                          *number,
                          settings.m_icon);
            }
        }

        if (!m_backend.ApplyThemes(*number, settings)) {
            error_log("%s: WS%i: one or more themes could not be applied.",
                      __func__,
                      *number);
        }
    } else if (controller->IsSwitchDue(now)) {
        controller->Reload();

        if (!controller->GetImages().empty()) {
            controller->ApplyIndex(controller->PickNextIndex());

            log("INFO: %s: WS%i: index -> %i",
                __func__,
                *number,
                controller->GetCurrentIndex());
        }

        controller->ResetSwitchTimer(now);
    }
}

void Scheduler::Run(const std::atomic<bool>& shutdown_requested)
{
    while (!shutdown_requested.load()) {
        try {
            Tick(std::chrono::steady_clock::now());
        } catch (std::exception& e) {
            error_log("%s: unexpected error during tick: %s",
                      __func__,
                      e.what());
        }

        // Sleep for the tick interval, but check for shutdown periodically
        auto wake_up_time = std::chrono::steady_clock::now() + SCHEDULER_TICK;
        while (std::chrono::steady_clock::now() < wake_up_time) {
            if (shutdown_requested.load()) {
                debug_log("INFO: %s: Shutdown requested during sleep interval.",
                          __func__);
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }
}

std::optional<int> Scheduler::GetLastWorkspace() const
{
    return m_last_workspace;
}

WorkspaceController* Scheduler::GetController(int number) const
{
    auto iter = m_controllers.find(number);

    if (iter == m_controllers.end()) {
        return nullptr;
    }

    return iter->second.get();
}

} // namespace WallpaperRotate
