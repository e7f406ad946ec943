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
#include "configmanager.h"

ConfigManager::ConfigManager() {
  RegisterVariables();
  Reset();
}

ConfigManager &ConfigManager::Get() {
  static ConfigManager instance;
  return instance;
}

void ConfigManager::RegisterVariables() {
  store.RegisterVariable("grid_columns", "float", 3.0f, 1.0f, 100.0f);
  store.RegisterVariable("grid_rows", "float", 10.0f, 1.0f, 1000.0f);
  store.RegisterVariable("font_size", "float", 12.0f, 1.0f, 512.0f);
  store.RegisterVariable("verbose_logging", "float", 0.0f, 0.0f, 1.0f);
}

void ConfigManager::ApplyStringDefaults() {
  if (!store.HasKey("font_name"))
    store.SetValue("font_name", DEFAULT_FONT_NAME);
  if (!store.HasKey("log_file"))
    store.SetValue("log_file", "");
}

// -- Config key-value access --

void ConfigManager::SetValue(const std::string &key, const std::string &value) {
  store.SetValue(key, value);
}

std::string ConfigManager::GetString(const std::string &key,
                                     const std::string &fallback) const {
  return store.GetString(key, fallback);
}

bool ConfigManager::HasKey(const std::string &key) const {
  return store.HasKey(key);
}

float ConfigManager::GetFloat(const std::string &name) const {
  return store.GetFloat(name);
}

void ConfigManager::SetFloat(const std::string &name, float v) {
  store.SetFloat(name, v);
}

bool ConfigManager::LoadFromFile(const std::string &path, std::string &error) {
  if (!store.LoadFromFile(path, error))
    return false;
  ApplyStringDefaults();
  return true;
}

bool ConfigManager::SaveToFile(const std::string &path,
                               std::string &error) const {
  return store.SaveToFile(path, error);
}

void ConfigManager::Reset() {
  store.ClearValues();
  store.ApplyDefaults();
  ApplyStringDefaults();
}
