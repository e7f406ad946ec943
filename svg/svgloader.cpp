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
#include "svgloader.h"

#include "logger.h"
#include "stringutils.h"

#include <tinyxml2.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string_view>

namespace fs = std::filesystem;

namespace svgpdf {

namespace {

constexpr const char *SVG_NAMESPACE = "http://www.w3.org/2000/svg";

// Element names may carry a namespace prefix ("svg:rect").
std::string_view LocalName(const char *name) {
  std::string_view view = name ? name : "";
  size_t colon = view.find(':');
  if (colon != std::string_view::npos)
    view.remove_prefix(colon + 1);
  return view;
}

std::string Describe(const tinyxml2::XMLElement *element) {
  return "<" + std::string(LocalName(element->Name())) + "> on line " +
         std::to_string(element->GetLineNum());
}

// Missing attributes read as 0. A value that is not a plain number fails.
bool ReadNumber(const tinyxml2::XMLElement *element, const char *name,
                double &out, std::string &error) {
  const char *raw = element->Attribute(name);
  if (!raw) {
    out = 0.0;
    return true;
  }
  if (StringUtils::TryParseDouble(raw, out))
    return true;
  error = "attribute '" + std::string(name) + "' of " + Describe(element) +
          " is not a number: '" + raw + "'";
  return false;
}

// Gradient vectors are commonly written as percentages; "50%" reads as 0.5.
bool ReadGradientCoordinate(const tinyxml2::XMLElement *element,
                            const char *name, double &out, std::string &error) {
  const char *raw = element->Attribute(name);
  if (raw) {
    std::string_view value = StringUtils::Trim(raw);
    if (!value.empty() && value.back() == '%') {
      value.remove_suffix(1);
      if (StringUtils::TryParseDouble(value, out)) {
        out /= 100.0;
        return true;
      }
    }
  }
  return ReadNumber(element, name, out, error);
}

std::string CharacterData(const tinyxml2::XMLElement *element) {
  std::string content;
  for (const tinyxml2::XMLNode *node = element->FirstChild(); node;
       node = node->NextSibling()) {
    if (const tinyxml2::XMLText *text = node->ToText())
      content += text->Value();
  }
  return content;
}

bool ParseGradient(const tinyxml2::XMLElement *element, SvgDocument &out,
                   std::string &error) {
  SvgLinearGradient gradient;
  if (const char *id = element->Attribute("id"))
    gradient.id = id;
  if (!ReadGradientCoordinate(element, "x1", gradient.x1, error) ||
      !ReadGradientCoordinate(element, "y1", gradient.y1, error) ||
      !ReadGradientCoordinate(element, "x2", gradient.x2, error) ||
      !ReadGradientCoordinate(element, "y2", gradient.y2, error))
    return false;

  for (const tinyxml2::XMLElement *stop = element->FirstChildElement(); stop;
       stop = stop->NextSiblingElement()) {
    if (LocalName(stop->Name()) != "stop")
      continue;
    SvgGradientStop entry;
    if (const char *offset = stop->Attribute("offset"))
      entry.offset = offset;
    if (const char *color = stop->Attribute("stop-color"))
      entry.color = color;
    gradient.stops.push_back(std::move(entry));
  }
  out.gradients.push_back(std::move(gradient));
  return true;
}

bool ParseElement(const tinyxml2::XMLElement *element, SvgDocument &out,
                  std::string &error) {
  const std::string_view name = LocalName(element->Name());
  if (name == "rect") {
    SvgRect rect;
    if (!ReadNumber(element, "x", rect.x, error) ||
        !ReadNumber(element, "y", rect.y, error) ||
        !ReadNumber(element, "width", rect.width, error) ||
        !ReadNumber(element, "height", rect.height, error))
      return false;
    out.rects.push_back(rect);
  } else if (name == "text") {
    SvgText text;
    if (!ReadNumber(element, "x", text.x, error) ||
        !ReadNumber(element, "y", text.y, error))
      return false;
    text.content = CharacterData(element);
    out.texts.push_back(std::move(text));
  } else if (name == "path") {
    SvgPath path;
    if (const char *d = element->Attribute("d"))
      path.d = d;
    out.paths.push_back(std::move(path));
  } else if (name == "linearGradient") {
    return ParseGradient(element, out, error);
  } else if (name == "defs") {
    for (const tinyxml2::XMLElement *child = element->FirstChildElement();
         child; child = child->NextSiblingElement()) {
      if (LocalName(child->Name()) == "linearGradient" &&
          !ParseGradient(child, out, error))
        return false;
    }
  } else if (name == "title") {
    if (!out.title)
      out.title = CharacterData(element);
  }
  return true;
}

} // namespace

ConversionResult SvgLoader::LoadFromFile(const fs::path &path,
                                         SvgDocument &out) const {
  std::error_code ec;
  if (fs::is_directory(path, ec))
    return ConversionResult::Fail(
        ConversionError::SourceOpenError,
        "error opening SVG file '" + path.string() + "': is a directory");

  errno = 0;
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    const std::string cause =
        errno != 0 ? std::strerror(errno) : "unable to open file";
    return ConversionResult::Fail(ConversionError::SourceOpenError,
                                  "error opening SVG file '" + path.string() +
                                      "': " + cause);
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad())
    return ConversionResult::Fail(ConversionError::SourceOpenError,
                                  "error reading SVG file '" + path.string() +
                                      "'");

  Logger::Instance().Debug("Loaded SVG source " + path.string());
  return LoadFromString(buffer.str(), out);
}

ConversionResult SvgLoader::LoadFromString(const std::string &xml,
                                           SvgDocument &out) const {
  tinyxml2::XMLDocument doc;
  if (doc.Parse(xml.c_str(), xml.size()) != tinyxml2::XML_SUCCESS)
    return ConversionResult::Fail(ConversionError::DecodeError,
                                  std::string("error decoding SVG: ") +
                                      doc.ErrorStr());

  const tinyxml2::XMLElement *root = doc.RootElement();
  if (!root)
    return ConversionResult::Fail(ConversionError::DecodeError,
                                  "error decoding SVG: document has no root "
                                  "element");
  if (LocalName(root->Name()) != "svg")
    return ConversionResult::Fail(ConversionError::DecodeError,
                                  "error decoding SVG: expected <svg> root, "
                                  "found " +
                                      Describe(root));
  const char *ns = root->Attribute("xmlns");
  if (ns && std::strcmp(ns, SVG_NAMESPACE) != 0)
    return ConversionResult::Fail(ConversionError::DecodeError,
                                  std::string("error decoding SVG: unexpected "
                                              "namespace '") +
                                      ns + "' on <svg> root");

  SvgDocument decoded;
  if (const char *width = root->Attribute("width"))
    decoded.width = std::string(width);
  if (const char *height = root->Attribute("height"))
    decoded.height = std::string(height);

  std::string error;
  for (const tinyxml2::XMLElement *child = root->FirstChildElement(); child;
       child = child->NextSiblingElement()) {
    if (!ParseElement(child, decoded, error))
      return ConversionResult::Fail(ConversionError::DecodeError,
                                    "error decoding SVG: " + error);
  }

  std::ostringstream summary;
  summary << "Decoded SVG: " << decoded.rects.size() << " rect(s), "
          << decoded.texts.size() << " text(s), " << decoded.paths.size()
          << " path(s), " << decoded.gradients.size() << " gradient(s)";
  Logger::Instance().Debug(summary.str());

  out = std::move(decoded);
  return ConversionResult::Ok();
}

} // namespace svgpdf
