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
#include "conversionerror.h"

namespace svgpdf {

const char *ToString(ConversionError error) {
  switch (error) {
  case ConversionError::None:
    return "None";
  case ConversionError::SourceOpenError:
    return "SourceOpenError";
  case ConversionError::DecodeError:
    return "DecodeError";
  case ConversionError::NoActivePage:
    return "NoActivePage";
  case ConversionError::DocumentFinalized:
    return "DocumentFinalized";
  case ConversionError::DestinationWriteError:
    return "DestinationWriteError";
  }
  return "Unknown";
}

} // namespace svgpdf
