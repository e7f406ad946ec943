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

#include "conversionerror.h"
#include "svgdocument.h"

#include <filesystem>
#include <string>

namespace svgpdf {

// Decodes the supported SVG subset into an SvgDocument. Shapes are read from
// the direct children of the <svg> root; gradients are also read from a
// direct <defs> child. Unsupported elements are skipped.
class SvgLoader
{
public:
    // Reads and decodes the file. Unreadable sources report SourceOpenError,
    // malformed or unsupported XML reports DecodeError.
    ConversionResult LoadFromFile(const std::filesystem::path& path,
                                  SvgDocument& out) const;

    // Decodes SVG text already held in memory
    ConversionResult LoadFromString(const std::string& xml,
                                    SvgDocument& out) const;
};

} // namespace svgpdf
