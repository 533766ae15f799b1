/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef RELEASE_H
#define RELEASE_H

#include <string>

#define WALLPAPER_ROTATE_VERSION_MAJOR 0
#define WALLPAPER_ROTATE_VERSION_MINOR 3
#define WALLPAPER_ROTATE_VERSION_PATCH 1
#define WALLPAPER_ROTATE_VERSION_TWEAK 0

#define WR__STRINGIFY(x) #x
#define WR_STRINGIFY(x) WR__STRINGIFY(x)

#define WALLPAPER_ROTATE_VERSION_STRING \
WR_STRINGIFY(WALLPAPER_ROTATE_VERSION_MAJOR) "." \
    WR_STRINGIFY(WALLPAPER_ROTATE_VERSION_MINOR) "." \
    WR_STRINGIFY(WALLPAPER_ROTATE_VERSION_PATCH) "." \
    WR_STRINGIFY(WALLPAPER_ROTATE_VERSION_TWEAK)

const std::string g_version_datetime = "20261019";

const std::string g_version = std::string("version ") + std::string(WALLPAPER_ROTATE_VERSION_STRING) + " - " + g_version_datetime;

#endif // RELEASE_H
