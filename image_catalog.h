/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef IMAGE_CATALOG_H
#define IMAGE_CATALOG_H

#include <vector>

#include <util.h>
#include <workspace.h>

namespace WallpaperRotate {

//!
//! \brief The ImageCatalog namespace holds the functions that turn a workspace folder into the ordered image list the
//! rotation indexes into.
//!
namespace ImageCatalog {

//!
//! \brief Lists the regular files in folder whose extension is jpg, jpeg or png, ignoring case. Subdirectories are not
//! searched.
//! \param folder
//! \return paths in name-ascending order. Empty if the folder is missing, is not a directory or cannot be read.
//!
std::vector<fs::path> Scan(const fs::path& folder);

//!
//! \brief Stable sort of images by lowercase filename or by modification time. A file whose modification time cannot
//! be read sorts as the oldest.
//!
void Sort(std::vector<fs::path>& images, const WorkspaceSettings::SortOrder& order);

//!
//! \brief Scan() followed by Sort(). In random mode the order is always name-ascending.
//!
std::vector<fs::path> Catalog(const fs::path& folder,
                              const WorkspaceSettings::RotationMode& mode,
                              const WorkspaceSettings::SortOrder& order);

} // namespace ImageCatalog

} // namespace WallpaperRotate

#endif // IMAGE_CATALOG_H
