/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <workspace_controller.h>

#include <image_catalog.h>

namespace WallpaperRotate {

WorkspaceController::WorkspaceController(const WorkspaceSettings& settings,
                                         ConfigStore& config_store,
                                         const StateStore& state_store,
                                         Backend& backend,
                                         const TelemetryWriter* telemetry)
    : m_settings(settings)
    , m_config_store(config_store)
    , m_state_store(state_store)
    , m_backend(backend)
    , m_telemetry(telemetry)
    , m_current_index(0)
    , m_next_switch_time()
    , m_rng(std::random_device{}())
{
    Reload();
    ResetSwitchTimer(std::chrono::steady_clock::now());
}

void WorkspaceController::Reload()
{
    try {
        m_config_store.Refresh();

        std::optional<WorkspaceSettings> settings = m_config_store.GetWorkspaceSettings(m_settings.m_number);

        if (settings) {
            m_settings = *settings;
        } else {
            log("WARNING: %s: section [%s] is no longer in the config file, keeping previous settings.",
                __func__,
                m_settings.Key());
        }
    } catch (ConfigMissingException& e) {
        log("WARNING: %s: %s Keeping previous settings for %s.",
            __func__,
            e.what(),
            m_settings.Key());
    }

    m_images = ImageCatalog::Catalog(m_settings.m_folder, m_settings.m_mode, m_settings.m_order);

    PersistedIndexMap index_map = m_state_store.Load();

    auto iter = index_map.find(m_settings.Key());
    m_current_index = (iter != index_map.end()) ? iter->second : 0;

    if (m_images.empty() || m_current_index < 0 || m_current_index >= static_cast<int>(m_images.size())) {
        m_current_index = 0;
    }

    debug_log("INFO: %s: %s: %u images in %s, index %i",
              __func__,
              m_settings.Key(),
              m_images.size(),
              m_settings.m_folder,
              m_current_index);
}

int WorkspaceController::PickNextIndex()
{
    int image_count = static_cast<int>(m_images.size());

    if (image_count == 0) {
        return 0;
    }

    if (m_settings.m_mode == WorkspaceSettings::SEQUENTIAL) {
        return (m_current_index + 1) % image_count;
    }

    if (image_count == 1) {
        return 0;
    }

    // Draw from the other image_count - 1 indices and step over the current one.
    std::uniform_int_distribution<int> distribution(0, image_count - 2);

    int next_index = distribution(m_rng);

    if (next_index >= m_current_index) {
        ++next_index;
    }

    return next_index;
}

void WorkspaceController::ApplyIndex(int index)
{
    if (m_images.empty() || index < 0 || index >= static_cast<int>(m_images.size())) {
        index = 0;
    }

    m_current_index = index;

    try {
        PersistedIndexMap index_map = m_state_store.Load();
        index_map[m_settings.Key()] = m_current_index;
        m_state_store.Save(index_map);
    } catch (StateStoreException& e) {
        error_log("%s: %s: unable to persist index: %s",
                  __func__,
                  m_settings.Key(),
                  e.what());
    }

    fs::path wallpaper;

    if (!m_images.empty()) {
        std::error_code ec;

        wallpaper = fs::absolute(m_images[m_current_index], ec);

        if (ec) {
            wallpaper = m_images[m_current_index];
        }

        if (!m_backend.SetWallpaper(m_settings.m_number, wallpaper, m_settings.m_scaling)) {
            error_log("%s: %s: failed to set wallpaper %s",
                      __func__,
                      m_settings.Key(),
                      wallpaper);
        }
    }

    if (m_telemetry && m_config_store.IsTelemetryEnabled()) {
        if (!m_telemetry->Write(m_settings, wallpaper, m_config_store.GetGlobalState())) {
            debug_log("WARNING: %s: %s: status file not updated.",
                      __func__,
                      m_settings.Key());
        }
    }
}

void WorkspaceController::ResetSwitchTimer(const std::chrono::steady_clock::time_point& now)
{
    m_next_switch_time = now + std::chrono::seconds(m_settings.m_interval_seconds);
}

bool WorkspaceController::IsSwitchDue(const std::chrono::steady_clock::time_point& now) const
{
    return now >= m_next_switch_time;
}

int WorkspaceController::GetNumber() const
{
    return m_settings.m_number;
}

const WorkspaceSettings& WorkspaceController::GetSettings() const
{
    return m_settings;
}

const std::vector<fs::path>& WorkspaceController::GetImages() const
{
    return m_images;
}

int WorkspaceController::GetCurrentIndex() const
{
    return m_current_index;
}

std::chrono::steady_clock::time_point WorkspaceController::GetNextSwitchTime() const
{
    return m_next_switch_time;
}

} // namespace WallpaperRotate
