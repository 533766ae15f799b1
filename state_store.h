/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef STATE_STORE_H
#define STATE_STORE_H

#include <map>
#include <string>

#include <util.h>

namespace WallpaperRotate {

//!
//! \brief Workspace key ("wsN") to the index of its current image.
//!
typedef std::map<std::string, int> PersistedIndexMap;

//!
//! \brief The StateStore class reads and writes the persisted index file, a flat JSON object. There is no locking. If
//! two processes write the file the last writer wins.
//!
class StateStore
{
public:
    explicit StateStore(const fs::path& state_file);

    //!
    //! \brief Reads the index file. A missing or corrupt file, or a root that is not an object, gives an empty map.
    //! Entries whose value is not a non-negative integer are dropped.
    //! \return PersistedIndexMap
    //!
    PersistedIndexMap Load() const;

    //!
    //! \brief Writes the map to <file>.tmp in the same directory and renames it over the index file, so a reader never
    //! sees a partial file. Creates the parent directory if needed.
    //! \throws StateStoreException on failure.
    //!
    void Save(const PersistedIndexMap& index_map) const;

    const fs::path& GetStateFile() const;

private:
    fs::path m_state_file;
};

} // namespace WallpaperRotate

#endif // STATE_STORE_H
