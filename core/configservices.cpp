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
#include "configservices.h"

#include "stringutils.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>

using StringUtils::TryParseFloat;

void UserPreferencesStore::SetValue(const std::string &key,
                                    const std::string &value) {
  std::string newValue = value;

  auto var = variables.find(key);
  if (var != variables.end() && var->second.type == "float") {
    float parsed = 0.0f;
    if (TryParseFloat(value, parsed)) {
      parsed = std::clamp(parsed, var->second.minValue, var->second.maxValue);
      var->second.value = parsed;
      newValue = std::to_string(parsed);
    }
  }

  configData[key] = newValue;
}

std::optional<std::string>
UserPreferencesStore::GetValue(const std::string &key) const {
  auto it = configData.find(key);
  if (it != configData.end())
    return it->second;
  return std::nullopt;
}

std::string UserPreferencesStore::GetString(const std::string &key,
                                            const std::string &fallback) const {
  auto value = GetValue(key);
  return value ? *value : fallback;
}

bool UserPreferencesStore::HasKey(const std::string &key) const {
  return configData.find(key) != configData.end();
}

void UserPreferencesStore::ClearValues() { configData.clear(); }

void UserPreferencesStore::RegisterVariable(const std::string &name,
                                            const std::string &type,
                                            float defVal, float minVal,
                                            float maxVal) {
  VariableInfo info;
  info.type = type;
  info.defaultValue = defVal;
  info.value = defVal;
  info.minValue = minVal;
  info.maxValue = maxVal;
  variables[name] = info;
}

float UserPreferencesStore::GetFloat(const std::string &name) const {
  auto it = variables.find(name);
  float defVal = 0.0f;
  if (it != variables.end())
    defVal = it->second.defaultValue;

  auto valStr = GetValue(name);
  if (valStr) {
    float parsed = 0.0f;
    if (TryParseFloat(*valStr, parsed))
      return parsed;
  }
  return defVal;
}

void UserPreferencesStore::SetFloat(const std::string &name, float v) {
  auto it = variables.find(name);
  if (it != variables.end()) {
    v = std::clamp(v, it->second.minValue, it->second.maxValue);
    it->second.value = v;
  }
  SetValue(name, std::to_string(v));
}

void UserPreferencesStore::ApplyDefaults() {
  for (const auto &[name, info] : variables) {
    float value = info.defaultValue;
    auto raw = GetValue(name);
    if (raw) {
      float parsed = 0.0f;
      if (TryParseFloat(*raw, parsed))
        value = std::clamp(parsed, info.minValue, info.maxValue);
    }
    SetValue(name, std::to_string(value));
  }
}

bool UserPreferencesStore::LoadFromFile(const std::string &path,
                                        std::string &error) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    error = "Unable to open configuration file '" + path + "'.";
    return false;
  }

  nlohmann::json j = nlohmann::json::parse(file, nullptr, false);
  if (j.is_discarded()) {
    error = "Configuration file '" + path + "' is not valid JSON.";
    return false;
  }
  if (!j.is_object()) {
    error = "Configuration file '" + path + "' must contain a JSON object.";
    return false;
  }

  std::unordered_map<std::string, std::string> loaded;
  for (auto it = j.begin(); it != j.end(); ++it) {
    const nlohmann::json &value = it.value();
    if (value.is_string())
      loaded[it.key()] = value.get<std::string>();
    else if (value.is_boolean())
      loaded[it.key()] = value.get<bool>() ? "1" : "0";
    else if (value.is_number())
      loaded[it.key()] = value.dump();
    else {
      error = "Configuration key '" + it.key() +
              "' must be a string, number or boolean.";
      return false;
    }
  }

  for (auto &[key, value] : loaded)
    configData[key] = std::move(value);
  ApplyDefaults();
  return true;
}

bool UserPreferencesStore::SaveToFile(const std::string &path,
                                      std::string &error) const {
  std::ofstream file(path, std::ios::binary);
  if (!file.is_open()) {
    error = "Unable to open configuration file '" + path + "' for writing.";
    return false;
  }

  nlohmann::json j(configData);
  file << j.dump(4);
  if (!file) {
    error = "Failed to write configuration file '" + path + "'.";
    return false;
  }
  return true;
}
