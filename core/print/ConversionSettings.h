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

#include <string>

class ConfigManager;

namespace print {

// A4 portrait in PostScript points. The page size is not configurable.
inline constexpr double kPageWidthPt = 595.0;
inline constexpr double kPageHeightPt = 842.0;

struct ConversionSettings {
  int gridColumns = 3;
  int gridRows = 10;
  std::string fontName = "Helvetica";
  double fontSize = 12.0;
  bool verbose = false;
  std::string logFile;

  static ConversionSettings LoadFromConfig(const ConfigManager &cfg);
  void SaveToConfig(ConfigManager &cfg) const;

  double PageWidthPt() const { return kPageWidthPt; }
  double PageHeightPt() const { return kPageHeightPt; }
};

} // namespace print
