/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef SCHEDULER_H
#define SCHEDULER_H

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>

#include <backend.h>
#include <desktop_probe.h>
#include <workspace_controller.h>

namespace WallpaperRotate {

//!
//! \brief Interval between polls of the current workspace.
//!
constexpr std::chrono::milliseconds SCHEDULER_TICK = std::chrono::milliseconds(500);

//!
//! \brief The Scheduler class drives the controllers from a single thread. Each tick it asks the probe for the current
//! workspace. A change of workspace restores that workspace's wallpaper, icon and themes. Otherwise the current
//! workspace rotates when its interval has elapsed.
//!
class Scheduler
{
public:
    Scheduler(DesktopProbe& probe,
              Backend& backend,
              std::map<int, std::unique_ptr<WorkspaceController>> controllers);

    //!
    //! \brief Performs one poll.
    //! \param now
    //!
    void Tick(const std::chrono::steady_clock::time_point& now);

    //!
    //! \brief Calls Tick() every SCHEDULER_TICK until shutdown_requested is set. The flag is checked every 100 ms.
    //!
    void Run(const std::atomic<bool>& shutdown_requested);

    //!
    //! \brief The workspace number seen on the last switch event.
    //!
    std::optional<int> GetLastWorkspace() const;

    //!
    //! \return nullptr if no controller is registered for the workspace number.
    //!
    WorkspaceController* GetController(int number) const;

private:
    DesktopProbe& m_probe;
    Backend& m_backend;
    std::map<int, std::unique_ptr<WorkspaceController>> m_controllers;

    std::optional<int> m_last_workspace;
};

} // namespace WallpaperRotate

#endif // SCHEDULER_H
