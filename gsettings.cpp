/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <gsettings.h>

#include <gio/gio.h>

#include <util.h>

namespace WallpaperRotate {

bool GioSettingsWriter::SetString(const std::string& schema, const std::string& key, const std::string& value)
{
    debug_log("INFO: %s: %s %s = %s",
              __func__,
              schema,
              key,
              value);

    GSettingsSchemaSource* source = g_settings_schema_source_get_default();

    if (!source) {
        error_log("%s: no GSettings schemas are installed.",
                  __func__);
        return false;
    }

    GSettingsSchema* settings_schema = g_settings_schema_source_lookup(source, schema.c_str(), TRUE);

    if (!settings_schema) {
        error_log("%s: GSettings schema %s is not installed.",
                  __func__,
                  schema);
        return false;
    }

    bool key_ok = false;

    if (g_settings_schema_has_key(settings_schema, key.c_str())) {
        GSettingsSchemaKey* schema_key = g_settings_schema_get_key(settings_schema, key.c_str());

        if (g_variant_type_equal(g_settings_schema_key_get_value_type(schema_key), G_VARIANT_TYPE_STRING)) {
            GVariant* candidate = g_variant_ref_sink(g_variant_new_string(value.c_str()));

            key_ok = g_settings_schema_key_range_check(schema_key, candidate);

            if (!key_ok) {
                error_log("%s: value \"%s\" is out of range for %s %s",
                          __func__,
                          value,
                          schema,
                          key);
            }

            g_variant_unref(candidate);
        } else {
            error_log("%s: GSettings key %s %s is not a string key.",
                      __func__,
                      schema,
                      key);
        }

        g_settings_schema_key_unref(schema_key);
    } else {
        error_log("%s: GSettings schema %s has no key %s",
                  __func__,
                  schema,
                  key);
    }

    g_settings_schema_unref(settings_schema);

    if (!key_ok) {
        return false;
    }

    GSettings* settings = g_settings_new(schema.c_str());

    bool written = g_settings_set_string(settings, key.c_str(), value.c_str());

    if (!written) {
        error_log("%s: failed to write %s %s (key may be locked down).",
                  __func__,
                  schema,
                  key);
    }

    g_settings_sync();
    g_object_unref(settings);

    return written;
}

} // namespace WallpaperRotate
