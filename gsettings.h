/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef GSETTINGS_H
#define GSETTINGS_H

#include <string>

namespace WallpaperRotate {

//!
//! \brief The SettingsWriter class writes string keys of the dconf settings database used by the GNOME family of
//! desktops.
//!
class SettingsWriter
{
public:
    virtual ~SettingsWriter() = default;

    //!
    //! \brief Sets a string key.
    //! \param schema e.g. org.gnome.desktop.background
    //! \param key e.g. picture-uri
    //! \param value
    //! \return false if the schema is not installed, the key does not exist or is not a string, or the value is
    //! rejected.
    //!
    virtual bool SetString(const std::string& schema, const std::string& key, const std::string& value) = 0;
};

//!
//! \brief SettingsWriter implemented with gio GSettings. The schema and key are checked before g_settings_new(), which
//! aborts the process on an unknown schema.
//!
class GioSettingsWriter : public SettingsWriter
{
public:
    bool SetString(const std::string& schema, const std::string& key, const std::string& value) override;
};

} // namespace WallpaperRotate

#endif // GSETTINGS_H
