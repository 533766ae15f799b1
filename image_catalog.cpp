/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <image_catalog.h>

#include <algorithm>

namespace WallpaperRotate {

namespace ImageCatalog {

namespace {

fs::file_time_type WriteTimeOrOldest(const fs::path& path)
{
    std::error_code ec;

    fs::file_time_type write_time = fs::last_write_time(path, ec);

    if (ec) {
        return fs::file_time_type::min();
    }

    return write_time;
}

} // anonymous namespace

std::vector<fs::path> Scan(const fs::path& folder)
{
    std::vector<fs::path> images;

    if (folder.empty()) {
        return images;
    }

    for (const auto& entry : FindDirEntriesWithWildcard(folder, ".*\\.(jpe?g|png)", true)) {
        std::error_code ec;

        // Follows symlinks, so a link to an image counts and a dangling link does not.
        if (fs::is_regular_file(entry, ec)) {
            images.push_back(entry);
        }
    }

    std::sort(images.begin(), images.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });

    return images;
}

void Sort(std::vector<fs::path>& images, const WorkspaceSettings::SortOrder& order)
{
    switch (order) {
    case WorkspaceSettings::NAME_ASCENDING:
        std::stable_sort(images.begin(), images.end(), [](const fs::path& a, const fs::path& b) {
            return ToLower(a.filename().string()) < ToLower(b.filename().string());
        });
        break;
    case WorkspaceSettings::NAME_DESCENDING:
        std::stable_sort(images.begin(), images.end(), [](const fs::path& a, const fs::path& b) {
            return ToLower(a.filename().string()) > ToLower(b.filename().string());
        });
        break;
    case WorkspaceSettings::OLDEST_FIRST:
    case WorkspaceSettings::NEWEST_FIRST:
    {
        // Read each mtime once rather than on every comparison.
        std::vector<std::pair<fs::file_time_type, fs::path>> timed;
        timed.reserve(images.size());

        for (const auto& image : images) {
            timed.emplace_back(WriteTimeOrOldest(image), image);
        }

        bool newest_first = (order == WorkspaceSettings::NEWEST_FIRST);

        std::stable_sort(timed.begin(), timed.end(), [newest_first](const auto& a, const auto& b) {
            return newest_first ? a.first > b.first : a.first < b.first;
        });

        for (size_t i = 0; i < images.size(); ++i) {
            images[i] = timed[i].second;
        }

        break;
    }
    }
}

std::vector<fs::path> Catalog(const fs::path& folder,
                              const WorkspaceSettings::RotationMode& mode,
                              const WorkspaceSettings::SortOrder& order)
{
    std::vector<fs::path> images = Scan(folder);

    Sort(images, mode == WorkspaceSettings::RANDOM ? WorkspaceSettings::NAME_ASCENDING : order);

    return images;
}

} // namespace ImageCatalog

} // namespace WallpaperRotate
