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
#include <utility>

namespace svgpdf {

// Stage at which a conversion run failed. Every error is terminal for the run.
enum class ConversionError {
  None = 0,
  SourceOpenError,
  DecodeError,
  NoActivePage,
  DocumentFinalized,
  DestinationWriteError
};

const char *ToString(ConversionError error);

struct ConversionResult {
  bool success = false;
  ConversionError error = ConversionError::None;
  std::string message;

  static ConversionResult Ok() { return {true, ConversionError::None, {}}; }
  static ConversionResult Fail(ConversionError error, std::string message) {
    return {false, error, std::move(message)};
  }
};

} // namespace svgpdf
