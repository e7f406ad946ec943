/*
 * This file is part of SvgPdf.
 * Copyright (C) 2025 The SvgPdf Authors
 *
 * SvgPdf is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * SvgPdf is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with SvgPdf. If not, see <https://www.gnu.org/licenses/>.
 */
#pragma once

#include "configservices.h"

#include <string>

inline constexpr const char *DEFAULT_FONT_NAME = "Helvetica";

// Singleton holding the conversion preferences shared by the CLI and the
// converter. Variables are registered with their defaults on construction.
class ConfigManager
{
public:
    // Access singleton instance
    static ConfigManager& Get();

    void SetValue(const std::string& key, const std::string& value);
    std::string GetString(const std::string& key,
                          const std::string& fallback = "") const;
    bool HasKey(const std::string& key) const;

    float GetFloat(const std::string& name) const;
    void SetFloat(const std::string& name, float v);

    // Merge a JSON configuration file into the current values
    bool LoadFromFile(const std::string& path, std::string& error);
    bool SaveToFile(const std::string& path, std::string& error) const;

    // Drop every value and restore registered defaults
    void Reset();

private:
    ConfigManager();
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    void RegisterVariables();
    void ApplyStringDefaults();

    UserPreferencesStore store;
};
