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
#include "ConversionSettings.h"

#include "configmanager.h"

#include <cmath>

namespace print {

ConversionSettings ConversionSettings::LoadFromConfig(const ConfigManager &cfg) {
  ConversionSettings settings;
  settings.gridColumns =
      static_cast<int>(std::lround(cfg.GetFloat("grid_columns")));
  settings.gridRows = static_cast<int>(std::lround(cfg.GetFloat("grid_rows")));
  settings.fontName = cfg.GetString("font_name", DEFAULT_FONT_NAME);
  if (settings.fontName.empty())
    settings.fontName = DEFAULT_FONT_NAME;
  settings.fontSize = cfg.GetFloat("font_size");
  settings.verbose = cfg.GetFloat("verbose_logging") != 0.0f;
  settings.logFile = cfg.GetString("log_file");
  return settings;
}

void ConversionSettings::SaveToConfig(ConfigManager &cfg) const {
  cfg.SetFloat("grid_columns", static_cast<float>(gridColumns));
  cfg.SetFloat("grid_rows", static_cast<float>(gridRows));
  cfg.SetValue("font_name", fontName);
  cfg.SetFloat("font_size", static_cast<float>(fontSize));
  cfg.SetFloat("verbose_logging", verbose ? 1.0f : 0.0f);
  cfg.SetValue("log_file", logFile);
}

} // namespace print
