/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <state_store.h>

#include <fstream>
#include <limits>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace WallpaperRotate {

StateStore::StateStore(const fs::path& state_file)
    : m_state_file(state_file)
{}

PersistedIndexMap StateStore::Load() const
{
    PersistedIndexMap index_map;

    std::ifstream state_stream(m_state_file);

    if (!state_stream.is_open()) {
        return index_map;
    }

    json root = json::parse(state_stream, nullptr, false);

    if (root.is_discarded() || !root.is_object()) {
        debug_log("WARNING: %s: ignoring unusable index file %s",
                  __func__,
                  m_state_file);

        return index_map;
    }

    for (const auto& item : root.items()) {
        const json& value = item.value();

        if (value.is_number_unsigned()
            && value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            index_map[item.key()] = static_cast<int>(value.get<uint64_t>());
        } else if (value.is_number_integer() && !value.is_number_unsigned()
                   && value.get<int64_t>() >= 0
                   && value.get<int64_t>() <= std::numeric_limits<int>::max()) {
            index_map[item.key()] = static_cast<int>(value.get<int64_t>());
        } else {
            debug_log("WARNING: %s: dropping entry \"%s\" with invalid index %s",
                      __func__,
                      item.key(),
                      value.dump());
        }
    }

    return index_map;
}

void StateStore::Save(const PersistedIndexMap& index_map) const
{
    std::error_code ec;

    fs::path parent = m_state_file.parent_path();

    if (!parent.empty()) {
        fs::create_directories(parent, ec);

        if (ec) {
            throw StateStoreException("Unable to create directory for index file: " + ec.message(), parent);
        }
    }

    json root = json::object();

    for (const auto& [key, index] : index_map) {
        root[key] = index;
    }

    fs::path tmp_file = m_state_file;
    tmp_file += ".tmp";

    {
        std::ofstream tmp_stream(tmp_file, std::ios::out | std::ios::trunc);

        if (!tmp_stream.is_open()) {
            throw StateStoreException("Unable to open temporary index file for writing.", tmp_file);
        }

        tmp_stream << root.dump(2) << std::endl;

        if (!tmp_stream.good()) {
            throw StateStoreException("Error writing temporary index file.", tmp_file);
        }
    }

    fs::rename(tmp_file, m_state_file, ec);

    if (ec) {
        std::string message = "Unable to replace index file: " + ec.message();

        fs::remove(tmp_file, ec);
        throw StateStoreException(message, m_state_file);
    }
}

const fs::path& StateStore::GetStateFile() const
{
    return m_state_file;
}

} // namespace WallpaperRotate
