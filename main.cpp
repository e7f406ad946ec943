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
#include "logger.h"
#include "stringutils.h"
#include "svg_pdf_converter.h"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

constexpr int EXIT_CONVERSION_FAILED = 1;
constexpr int EXIT_USAGE = 2;

void PrintUsage(std::ostream &out) {
  out << "Usage: svgpdf [options] <input.svg> [more.svg ...] <output.pdf>\n"
         "\n"
         "Each input SVG becomes one A4 page of the output PDF.\n"
         "\n"
         "Options:\n"
         "  --config <file.json>  load settings from a JSON file\n"
         "  --columns <n>         layout grid column count\n"
         "  --rows <n>            layout grid row count\n"
         "  --font <name>         font name (text always uses Helvetica)\n"
         "  --font-size <pt>      text size in points\n"
         "  --log-file <path>     also write log messages to a file\n"
         "  --verbose             log debug messages\n"
         "  --help                show this message\n";
}

bool ParseNumberOption(const std::string &option, const std::string &value,
                       float &out) {
  if (StringUtils::TryParseFloat(value, out))
    return true;
  std::cerr << "svgpdf: " << option << " expects a number, got '" << value
            << "'\n";
  return false;
}

} // namespace

int main(int argc, char **argv) {
  ConfigManager &cfg = ConfigManager::Get();
  std::vector<std::string> positional;
  // Command-line values override the configuration file regardless of order.
  std::vector<std::pair<std::string, std::string>> overrides;
  std::string configPath;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto needValue = [&](std::string &value) {
      if (i + 1 >= argc) {
        std::cerr << "svgpdf: " << arg << " requires a value\n";
        return false;
      }
      value = argv[++i];
      return true;
    };

    std::string value;
    if (arg == "--help" || arg == "-h") {
      PrintUsage(std::cout);
      return 0;
    } else if (arg == "--verbose" || arg == "-v") {
      overrides.emplace_back("verbose_logging", "1");
    } else if (arg == "--config") {
      if (!needValue(configPath))
        return EXIT_USAGE;
    } else if (arg == "--columns" || arg == "--rows" ||
               arg == "--font-size") {
      if (!needValue(value))
        return EXIT_USAGE;
      float parsed = 0.0f;
      if (!ParseNumberOption(arg, value, parsed))
        return EXIT_USAGE;
      const char *key = arg == "--columns" ? "grid_columns"
                        : arg == "--rows"  ? "grid_rows"
                                           : "font_size";
      overrides.emplace_back(key, value);
    } else if (arg == "--font") {
      if (!needValue(value))
        return EXIT_USAGE;
      overrides.emplace_back("font_name", value);
    } else if (arg == "--log-file") {
      if (!needValue(value))
        return EXIT_USAGE;
      overrides.emplace_back("log_file", value);
    } else if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "svgpdf: unknown option " << arg << "\n";
      PrintUsage(std::cerr);
      return EXIT_USAGE;
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.size() < 2) {
    PrintUsage(std::cerr);
    return EXIT_USAGE;
  }

  if (!configPath.empty()) {
    std::string error;
    if (!cfg.LoadFromFile(configPath, error)) {
      std::cerr << "svgpdf: " << error << "\n";
      return EXIT_USAGE;
    }
  }
  for (const auto &[key, value] : overrides)
    cfg.SetValue(key, value);

  const print::ConversionSettings settings =
      print::ConversionSettings::LoadFromConfig(cfg);

  Logger &log = Logger::Instance();
  log.SetVerbose(settings.verbose);
  if (!settings.logFile.empty() && !log.SetLogFile(settings.logFile))
    log.Warn("Unable to open log file " + settings.logFile);

  const std::string outputPath = positional.back();
  positional.pop_back();

  svgpdf::SvgPdfConverter converter(settings);
  for (const auto &input : positional) {
    svgpdf::ConversionResult result = converter.ConvertFile(input);
    if (!result.success) {
      log.Flush();
      return EXIT_CONVERSION_FAILED;
    }
  }

  svgpdf::ConversionResult saved = converter.Save(outputPath);
  log.Flush();
  if (!saved.success)
    return EXIT_CONVERSION_FAILED;

  std::cout << "Successfully generated " << outputPath << std::endl;
  return 0;
}
