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

#include <optional>
#include <string>
#include <unordered_map>

// Key/value preference storage with typed float variables and JSON
// persistence. Values are kept as strings; registered float variables are
// parsed and clamped to their range whenever they are assigned.
class UserPreferencesStore {
public:
  struct VariableInfo {
    std::string type;
    float defaultValue = 0.0f;
    float value = 0.0f;
    float minValue = 0.0f;
    float maxValue = 0.0f;
  };

  void SetValue(const std::string &key, const std::string &value);
  std::optional<std::string> GetValue(const std::string &key) const;
  std::string GetString(const std::string &key,
                        const std::string &fallback = "") const;
  bool HasKey(const std::string &key) const;
  void ClearValues();

  // Loads a flat JSON object. String, number and boolean members are
  // accepted; on failure the store is left untouched and error describes
  // the cause.
  bool LoadFromFile(const std::string &path, std::string &error);
  bool SaveToFile(const std::string &path, std::string &error) const;

  void RegisterVariable(const std::string &name, const std::string &type,
                        float defVal, float minVal, float maxVal);
  float GetFloat(const std::string &name) const;
  void SetFloat(const std::string &name, float v);
  void ApplyDefaults();

private:
  std::unordered_map<std::string, std::string> configData;
  std::unordered_map<std::string, VariableInfo> variables;
};
