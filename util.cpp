/*
 * Copyright (C) 2025 James C. Owens
 * Portions Copyright (c) 2019 The Bitcoin Core developers
 * Portions Copyright (c) 2025 The Gridcoin developers
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <util.h>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <ctime>
#include <regex>
#include <fstream>

//!
//! \brief This to support early use of the log utility functions before the config is read to get the
//! debug flag.
//!
std::atomic<bool> g_debug = false;

//!
//! \brief The flag controls the logging of timestamps by the log functions. This is used to suppress
//! timestamp output when run under systemd, where the journal appends a high resolution timestamp.
//!
std::atomic<bool> g_log_timestamps = true;

[[nodiscard]] std::vector<std::string> StringSplit(const std::string& s, const std::string& delim)
{
    size_t pos = 0;
    size_t end = 0;
    std::vector<std::string> elems;

    while((end = s.find(delim, pos)) != std::string::npos)
    {
        elems.push_back(s.substr(pos, end - pos));
        pos = end + delim.size();
    }

    // Append final value
    elems.push_back(s.substr(pos, end - pos));
    return elems;
}

[[nodiscard]] std::string TrimString(const std::string& str, const std::string& pattern)
{
    std::string::size_type front = str.find_first_not_of(pattern);
    if (front == std::string::npos) {
        return std::string();
    }
    std::string::size_type end = str.find_last_not_of(pattern);
    return str.substr(front, end - front + 1);
}

[[nodiscard]] std::string StripQuotes(const std::string& str)
{
    if (str.empty()) {
        return str;
    }

    std::string result = str;

    if (result.front() == '"' || result.front() == '\'') {
        result.erase(0, 1);
    }

    if (!result.empty() && (result.back() == '"' || result.back() == '\'')) {
        result.pop_back();
    }

    return result;
}

std::string ToLower(const std::string& str)
{
    std::string r;
    for (auto ch : str) r += ToLower(static_cast<char>(ch));
    return r;
}

int64_t GetUnixEpochTime()
{
    auto now = std::chrono::system_clock::now();

    return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

std::string FormatISO8601DateTime(int64_t time)
{
    struct tm ts;
    time_t time_val = time;
    if (gmtime_r(&time_val, &ts) == nullptr) {
        return {};
    }

    return strprintf("%04i-%02i-%02iT%02i:%02i:%02iZ",
                     ts.tm_year + 1900, ts.tm_mon + 1, ts.tm_mday, ts.tm_hour, ts.tm_min, ts.tm_sec);
}

[[nodiscard]] int ParseStringToInt(const std::string& str)
{
    try {
        return std::stoi(str);
    } catch (const std::invalid_argument& e){
        error_log("%s: Invalid argument: %s",
                  __func__,
                  e.what());
        throw;
    } catch (const std::out_of_range& e){
        error_log("%s: Out of range: %s",
                  __func__,
                  e.what());
        throw;
    }
}

[[nodiscard]] std::optional<bool> ParseStringToBool(const std::string& str)
{
    std::string value = ToLower(TrimString(str));

    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    } else if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }

    return std::nullopt;
}

std::vector<fs::path> FindDirEntriesWithWildcard(const fs::path& directory, const std::string& wildcard,
                                                 bool case_insensitive)
{
    std::vector<fs::path> matching_entries;

    std::regex::flag_type flags = std::regex::ECMAScript;
    if (case_insensitive) {
        flags |= std::regex::icase;
    }

    std::regex regex_wildcard(wildcard, flags);

    std::error_code ec;

    if (!fs::exists(directory, ec) || !fs::is_directory(directory, ec)) {
        debug_log("WARNING: %s, directory %s to search for regex expression \"%s\" "
                  "does not exist or is not a directory.",
                  __func__,
                  directory,
                  wildcard);

        return matching_entries;
    }

    fs::directory_iterator iter(directory, ec);

    if (ec) {
        error_log("%s: Could not read directory %s: %s",
                  __func__,
                  directory,
                  ec.message());

        return matching_entries;
    }

    for (; iter != fs::directory_iterator(); iter.increment(ec)) {
        if (ec) {
            error_log("%s: Error while reading directory %s: %s",
                      __func__,
                      directory,
                      ec.message());
            break;
        }

        if (std::regex_match(iter->path().filename().string(), regex_wildcard)) {
            matching_entries.push_back(iter->path());
        }
    }

    return matching_entries;
}

std::optional<std::string> GetEnvVariable(const std::string& var_name)
{
    const char* value = std::getenv(var_name.c_str());

    if (value == nullptr) {
        return std::nullopt;
    }

    return std::string(value);
}

// Class Config

Config::Config()
{}

bool Config::ReadAndUpdateConfig(const fs::path& config_file)
{
    std::map<std::string, std::string> config;
    std::set<std::string> sections;
    bool file_read = false;

    std::ifstream file(config_file);

    if (!file.is_open()) {
        error_log("%s: Could not open the config file: %s",
                  __func__,
                  config_file);
    } else {
        std::string section = "general";
        std::string line;

        while (std::getline(file, line)) {
            line = TrimString(line);

            // Skip empty lines and comment lines
            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            if (line.front() == '[' && line.back() == ']') {
                section = ToLower(TrimString(line.substr(1, line.size() - 2)));
                sections.insert(section);
                continue;
            }

            // The value keeps everything after the first delimiter, so paths containing '=' survive.
            std::string::size_type delim = line.find_first_of("=:");

            if (delim == std::string::npos) {
                continue;
            }

            std::string key = ToLower(StripQuotes(TrimString(line.substr(0, delim))));

            if (key.empty()) {
                continue;
            }

            // Later duplicates win, as with a re-read.
            config[section + "." + key] = StripQuotes(TrimString(line.substr(delim + 1)));
        }

        file_read = true;
    }

    // Do this all at once so the result of the config read is essentially "atomic".
    m_config_in.swap(config);
    m_sections.swap(sections);
    m_config.clear();

    // If the config file read failed, we will process args anyway, which will result in defaults being chosen.
    ProcessArgs();

    return file_read;
}

config_variant Config::GetArg(const std::string& arg) const
{
    auto iter = m_config.find(arg);

    if (iter != m_config.end()) {
        return iter->second;
    } else {
        return std::string {};
    }
}

bool Config::HasSection(const std::string& section) const
{
    return m_sections.count(ToLower(section)) > 0;
}

std::string Config::GetArgString(const std::string& arg, const std::string& default_value) const
{
    auto iter = m_config_in.find(arg);

    if (iter != m_config_in.end()) {
        return iter->second;
    } else {
        return default_value;
    }
}

std::optional<std::string> Config::GetArgStringOptional(const std::string& arg) const
{
    auto iter = m_config_in.find(arg);

    if (iter != m_config_in.end()) {
        return iter->second;
    }

    return std::nullopt;
}
