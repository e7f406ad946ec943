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
#include <vector>

namespace svgpdf {

// Rectangle outline in SVG user units
struct SvgRect {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
};

// Text anchored at (x, y); content is the element's character data
struct SvgText {
    double x = 0.0;
    double y = 0.0;
    std::string content;
};

// Path data is kept verbatim and never interpreted
struct SvgPath {
    std::string d;
};

struct SvgGradientStop {
    std::string offset;
    std::string color;
};

struct SvgLinearGradient {
    std::string id;
    double x1 = 0.0;
    double y1 = 0.0;
    double x2 = 0.0;
    double y2 = 0.0;
    std::vector<SvgGradientStop> stops;
};

// Structured form of a decoded SVG file. Each element kind keeps the order
// in which it appeared in the source.
struct SvgDocument {
    // Raw root attributes, unset when the source does not declare them
    std::optional<std::string> width;
    std::optional<std::string> height;
    std::optional<std::string> title;

    std::vector<SvgRect> rects;
    std::vector<SvgText> texts;
    std::vector<SvgPath> paths;
    std::vector<SvgLinearGradient> gradients;
};

} // namespace svgpdf
