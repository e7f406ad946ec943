#include "ConversionSettings.h"
#include "configmanager.h"
#include "configservices.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

int main() {
  const fs::path dir = fs::temp_directory_path() / "svgpdf_preferences_test";
  std::error_code ec;
  fs::remove_all(dir, ec);
  fs::create_directories(dir);
  std::string error;

  UserPreferencesStore store;
  store.RegisterVariable("font_size", "float", 12.0f, 1.0f, 512.0f);
  store.SetValue("font_size", "4000");
  assert(store.GetFloat("font_size") == 512.0f);
  store.SetFloat("font_size", 0.0f);
  assert(store.GetFloat("font_size") == 1.0f);
  store.SetValue("font_size", "nan");
  assert(store.GetFloat("font_size") == 12.0f);
  store.ApplyDefaults();
  assert(store.GetValue("font_size") == std::to_string(12.0f));
  assert(store.GetFloat("unknown") == 0.0f);
  assert(store.GetString("missing", "fallback") == "fallback");

  const fs::path out = dir / "prefs.json";
  store.SetValue("font_name", "Courier");
  assert(store.SaveToFile(out.string(), error));

  UserPreferencesStore loaded;
  loaded.RegisterVariable("font_size", "float", 12.0f, 1.0f, 512.0f);
  assert(loaded.LoadFromFile(out.string(), error));
  assert(loaded.GetFloat("font_size") == 1.0f);
  assert(loaded.GetString("font_name") == "Courier");

  // Numbers and booleans are accepted alongside strings.
  const fs::path typed = dir / "typed.json";
  {
    std::ofstream f(typed);
    f << R"({"font_size": 9, "verbose_logging": true, "font_name": "Times"})";
  }
  UserPreferencesStore typedStore;
  typedStore.RegisterVariable("font_size", "float", 12.0f, 1.0f, 512.0f);
  assert(typedStore.LoadFromFile(typed.string(), error));
  assert(typedStore.GetFloat("font_size") == 9.0f);
  assert(typedStore.GetString("verbose_logging") == "1");
  assert(typedStore.GetString("font_name") == "Times");

  // Rejected files leave the store untouched.
  const fs::path broken = dir / "broken.json";
  {
    std::ofstream f(broken);
    f << "{ not json";
  }
  error.clear();
  assert(!typedStore.LoadFromFile(broken.string(), error));
  assert(!error.empty());
  assert(typedStore.GetString("font_name") == "Times");

  const fs::path nested = dir / "nested.json";
  {
    std::ofstream f(nested);
    f << R"({"font_name": ["a", "b"]})";
  }
  assert(!typedStore.LoadFromFile(nested.string(), error));
  assert(error.find("font_name") != std::string::npos);
  assert(typedStore.GetString("font_name") == "Times");

  assert(!typedStore.LoadFromFile((dir / "absent.json").string(), error));

  // Defaults exposed through the conversion settings.
  ConfigManager &cfg = ConfigManager::Get();
  cfg.Reset();
  print::ConversionSettings settings =
      print::ConversionSettings::LoadFromConfig(cfg);
  assert(settings.gridColumns == 3);
  assert(settings.gridRows == 10);
  assert(settings.fontName == "Helvetica");
  assert(settings.fontSize == 12.0);
  assert(!settings.verbose);
  assert(settings.logFile.empty());
  assert(settings.PageWidthPt() == 595.0);
  assert(settings.PageHeightPt() == 842.0);

  const fs::path cfgFile = dir / "svgpdf.json";
  {
    std::ofstream f(cfgFile);
    f << R"({"grid_columns": "5", "grid_rows": 0, "font_name": "Courier",
            "font_size": 10.5, "verbose_logging": 1})";
  }
  assert(cfg.LoadFromFile(cfgFile.string(), error));
  settings = print::ConversionSettings::LoadFromConfig(cfg);
  assert(settings.gridColumns == 5);
  assert(settings.gridRows == 1);
  assert(settings.fontName == "Courier");
  assert(settings.fontSize == 10.5);
  assert(settings.verbose);

  settings.gridRows = 7;
  settings.SaveToConfig(cfg);
  assert(cfg.GetFloat("grid_rows") == 7.0f);
  assert(cfg.SaveToFile(cfgFile.string(), error));
  cfg.Reset();
  assert(cfg.GetFloat("grid_rows") == 10.0f);
  assert(cfg.LoadFromFile(cfgFile.string(), error));
  assert(cfg.GetFloat("grid_rows") == 7.0f);
  assert(cfg.GetString("font_name") == "Courier");

  cfg.Reset();
  fs::remove_all(dir, ec);
  return 0;
}
