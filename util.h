/*
 * Copyright (C) 2025 James C. Owens
 * Portions Copyright (c) 2019 The Bitcoin Core developers
 * Portions Copyright (c) 2025 The Gridcoin developers
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef UTIL_H
#define UTIL_H

#include <atomic>
#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <tinyformat.h>
#include <variant>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

extern std::atomic<bool> g_debug;
extern std::atomic<bool> g_log_timestamps;

//!
//! /brief Locale-independent version of std::to_string
//!
template <typename T>
std::string ToString(const T& t)
{
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << t;
    return oss.str();
}

//!
//! \brief Utility function to split string by the provided delimiter. Note that no trimming is done to remove white space.
//! \param s: the string to split
//! \param delim: the delimiter string
//! \return std::vector of string parts
//!
[[nodiscard]] std::vector<std::string> StringSplit(const std::string& s, const std::string& delim);

//!
//! \brief Utility function to trim whitespace from the beginning and end of a string.
//! \param str: the string to trim
//! \param pattern: the pattern to trim, defaulting to " \f\n\r\t\v"
//! \return trimmed string
//!
[[nodiscard]] std::string TrimString(const std::string& str, const std::string& pattern = " \f\n\r\t\v");

//!
//! \brief Utility function to remove enclosing single or double quotes from a string. This is especially useful when
//! dealing with quoted values in a config file.
//! \param str: the input string with potential quotes to remove
//! \return the string with any enclosing quotes removed
//!
[[nodiscard]] std::string StripQuotes(const std::string& str);

/**
 * Converts the given character to its lowercase equivalent.
 * This function is locale independent. It only converts uppercase
 * characters in the standard 7-bit ASCII range.
 *
 * @param[in] c     the character to convert to lowercase.
 * @return          the lowercase equivalent of c; or the argument
 *                  if no conversion is possible.
 */
constexpr char ToLower(char c)
{
    return (c >= 'A' && c <= 'Z' ? (c - 'A') + 'a' : c);
}

/**
 * Returns the lowercase equivalent of the given string.
 * This function is locale independent. It only converts uppercase
 * characters in the standard 7-bit ASCII range.
 *
 * @param[in] str   the string to convert to lowercase.
 * @returns         lowercased equivalent of str
 */
std::string ToLower(const std::string& str);

//!
//! \brief Returns number of seconds since the beginning of the Unix Epoch.
//! \return int64_t seconds.
//!
int64_t GetUnixEpochTime();

//!
//! \brief Formats input unix epoch time in human readable format.
//! \param int64_t seconds.
//! \return ISO8601 conformant datetime string.
//!
std::string FormatISO8601DateTime(int64_t time);

template <typename... Args>
//!
//! \brief Creates a string with fmt specifier and variadic args.
//! \param fmt specifier
//! \param args... variadic
//! \return formatted std::string
//!
static inline std::string LogPrintStr(const char* fmt, const Args&... args)
{
    std::string log_msg;

    if (g_log_timestamps.load(std::memory_order_relaxed)) {
        log_msg = FormatISO8601DateTime(GetUnixEpochTime()) + " ";
    }

    try {
        log_msg += tfm::format(fmt, args...);
    } catch (tinyformat::format_error& fmterr) {
        log_msg += "Error \"" + std::string(fmterr.what()) + "\" while formatting log message: " + fmt;
    }

    log_msg += "\n";

    return log_msg;
}

template <typename... Args>
//!
//! \brief LogPrintStr directed to cout.
//! \param fmt
//! \param args
//!
void log(const char* fmt, const Args&... args)
{
    std::cout << LogPrintStr(fmt, args...) << std::flush;
}

template <typename... Args>
//!
//! \brief LogPrintStr directed to cout, conditioned on the debug setting.
//! \param fmt
//! \param args
//!
void debug_log(const char* fmt, const Args&... args)
{
    if (g_debug.load()) {
        log(fmt, args...);
    }
}

template <typename... Args>
//!
//! \brief LogPrintStr directed to cerr
//! \param fmt
//! \param args
//!
void error_log(const char* fmt, const Args&... args)
{
    std::string error_fmt = "ERROR: ";
    error_fmt += fmt;

    std::cerr << LogPrintStr(error_fmt.c_str(), args...);
}

[[nodiscard]] int ParseStringToInt(const std::string& str);

//!
//! \brief Parses the usual config file spellings of a boolean: 1/0, true/false, yes/no, on/off (case-insensitive).
//! \param str
//! \return parsed value, or std::nullopt if the string is none of the above.
//!
[[nodiscard]] std::optional<bool> ParseStringToBool(const std::string& str);

//!
//! \brief Finds directory entries in the provided path that match the provided wildcard string.
//! \param directory
//! \param wildcard regular expression matched against the whole filename
//! \param case_insensitive whether the match ignores case
//! \return std::vector of fs::paths that match. Empty if the directory does not exist or cannot be read.
//!
std::vector<fs::path> FindDirEntriesWithWildcard(const fs::path& directory, const std::string& wildcard,
                                                 bool case_insensitive = false);

//!
//! \brief Safely get an enviroment variable value from the provided name
//! \param std::string of the name of the variable to retrieve
//! \return std::string of the value of the requested variable. std::nullopt if not found.
//!
std::optional<std::string> GetEnvVariable(const std::string& var_name);

//!
//! \brief The WallpaperRotateException class is the root of the exception hierarchy for the wallpaper_rotate
//! application.
//!
class WallpaperRotateException : public std::exception
{
public:
    WallpaperRotateException(const std::string& message) : m_message(message) {}
    WallpaperRotateException(const char* message) : m_message(message) {}

    const char* what() const noexcept override {
        return m_message.c_str();
    }

protected:
    std::string m_message;
};

//! File system related exceptions
class FileSystemException : public WallpaperRotateException
{
public:
    FileSystemException(const std::string& message, const std::filesystem::path& path)
        : WallpaperRotateException(message + " Path: " + path.string()), m_path(path) {}

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

//! The config file does not exist. Fatal at startup.
class ConfigMissingException : public FileSystemException
{
public:
    ConfigMissingException(const std::filesystem::path& path)
        : FileSystemException("Config file not found.", path) {}
};

//! The config file exists but cannot be used.
class ConfigException : public WallpaperRotateException
{
public:
    ConfigException(const std::string& message) : WallpaperRotateException(message) {}
};

//! The persisted index file could not be written.
class StateStoreException : public FileSystemException
{
public:
    StateStoreException(const std::string& message, const std::filesystem::path& path)
        : FileSystemException(message, path) {}
};

typedef std::variant<bool, int, std::string, fs::path> config_variant;

//!
//! \brief The Config class stores program config read from an INI style config file, with applied defaults if the
//! config file cannot be read, or a config parameter is not in the config file. Keys are addressed as "section.key",
//! both lowercased. Lines before the first section header belong to the section "general".
//!
class Config
{
public:
    //!
    //! \brief Constructor.
    //!
    Config();

    virtual ~Config() = default;

    //!
    //! \brief Reads and parses the config file provided by the argument and replaces m_config_in, then calls private
    //! method ProcessArgs() to repopulate m_config.
    //! \param config_file
    //! \return false if the file could not be opened, in which case ProcessArgs() runs against an empty input and
    //! every parameter takes its default.
    //!
    bool ReadAndUpdateConfig(const fs::path& config_file);

    //!
    //! \brief Provides the config_variant type value of the config parameter (argument).
    //! \param arg (key) to look up value.
    //! \return config_variant type value of the value of the config parameter (argument).
    //!
    config_variant GetArg(const std::string& arg) const;

    //!
    //! \brief Whether the last read of the config file contained a [section] header with this name.
    //!
    bool HasSection(const std::string& section) const;

protected:
    //!
    //! \brief Operates on m_config_in and selects the provided default value if the arg is not found. This is how
    //! default values for parameters are established.
    //! \param arg (key) to look up value as string.
    //! \param default_value if arg is not found.
    //! \return string value found in lookup, default value if not found.
    //!
    std::string GetArgString(const std::string& arg, const std::string& default_value) const;

    //!
    //! \brief Like GetArgString(), but distinguishes an absent arg from one that is present.
    //!
    std::optional<std::string> GetArgStringOptional(const std::string& arg) const;

    //!
    //! \brief Holds the processed parameter-values, which are strongly typed and in a config_variant union, and where
    //! default values are populated if not found in the config file (m_config_in).
    //!
    std::map<std::string, config_variant> m_config;

private:
    //!
    //! \brief Private helper method used by ReadAndUpdateConfig. Note this is pure virtual. It must be implemented
    //! in a specialization of a derived class for use by a specific application.
    //!
    virtual void ProcessArgs() = 0;

    //!
    //! \brief Holds the raw parsed parameter-values from the config file.
    //!
    std::map<std::string, std::string> m_config_in;

    //!
    //! \brief Section names seen in the config file.
    //!
    std::set<std::string> m_sections;
};

#endif // UTIL_H
