/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef WORKSPACE_CONTROLLER_H
#define WORKSPACE_CONTROLLER_H

#include <chrono>
#include <random>
#include <vector>

#include <backend.h>
#include <config_store.h>
#include <state_store.h>
#include <telemetry.h>
#include <util.h>
#include <workspace.h>

namespace WallpaperRotate {

//!
//! \brief The WorkspaceController class owns the rotation state of one workspace: its settings, its ordered image list,
//! the index of the image showing and the time of the next rotation. The referenced store, backend and telemetry
//! writer are owned by the caller and must outlive the controller.
//!
class WorkspaceController
{
public:
    //!
    //! \brief Constructs the controller and performs an initial Reload(). The first rotation is due one interval from
    //! now.
    //! \param settings settings from the initial config load
    //! \param config_store
    //! \param state_store
    //! \param backend
    //! \param telemetry nullptr to never write the status file
    //!
    WorkspaceController(const WorkspaceSettings& settings,
                        ConfigStore& config_store,
                        const StateStore& state_store,
                        Backend& backend,
                        const TelemetryWriter* telemetry);

    //!
    //! \brief Picks up the latest settings for this workspace, re-scans the folder and re-reads the persisted index.
    //! The previous settings are kept if the config file has disappeared or no longer has this workspace's section. The
    //! index is reset to 0 if it is out of range for the new image list.
    //!
    void Reload();

    //!
    //! \brief Chooses the index for a rotation event. Random mode never repeats the current image when there is more
    //! than one. Sequential mode advances and wraps.
    //! \return index into GetImages(), 0 if there are no images
    //!
    int PickNextIndex();

    //!
    //! \brief Makes index current, persists it and shows the image. Backend, state file and telemetry failures are
    //! logged and do not undo the new index.
    //! \param index clamped to 0 if out of range
    //!
    void ApplyIndex(int index);

    //!
    //! \brief Sets the next rotation to one interval after now.
    //!
    void ResetSwitchTimer(const std::chrono::steady_clock::time_point& now);

    bool IsSwitchDue(const std::chrono::steady_clock::time_point& now) const;

    int GetNumber() const;
    const WorkspaceSettings& GetSettings() const;
    const std::vector<fs::path>& GetImages() const;
    int GetCurrentIndex() const;
    std::chrono::steady_clock::time_point GetNextSwitchTime() const;

private:
    WorkspaceSettings m_settings;

    ConfigStore& m_config_store;
    const StateStore& m_state_store;
    Backend& m_backend;
    const TelemetryWriter* m_telemetry;

    std::vector<fs::path> m_images;
    int m_current_index;
    std::chrono::steady_clock::time_point m_next_switch_time;

    std::mt19937 m_rng;
};

} // namespace WallpaperRotate

#endif // WORKSPACE_CONTROLLER_H
