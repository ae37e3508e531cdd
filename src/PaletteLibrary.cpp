#include "PaletteLibrary.h"

#include "PaletteBuilder.h"
#include "PixelArtError.h"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace {
std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

struct BuiltinPalette {
  const char* name;
  std::vector<const char*> colors;
};

// Hex lists are RGB (#rrggbb) as published.
const BuiltinPalette kBuiltins[] = {
    {"Game Boy", {"#0f380f", "#306230", "#8bac0f", "#9bbc0f"}},
    {"Game Boy Pocket", {"#283818", "#607050", "#889878", "#b0c0a0"}},
    {"Ice Cream", {"#7c3f58", "#eb6b6f", "#f9a875", "#fff6d3"}},
    {"Demichrome", {"#211e20", "#555568", "#a0a08b", "#e9efec"}},
    {"Kirokaze", {"#332c50", "#46878f", "#94e344", "#e2f3e4"}},
    {"Rustic", {"#2c2137", "#764462", "#edb4a1", "#a96868"}},
    {"Mist", {"#2d1b00", "#1e606e", "#5ab9a8", "#c4f0c2"}},
    {"Wish", {"#622e4c", "#7550e8", "#608fcf", "#8be5ff"}},
    {"Neon", {"#f8e3c4", "#cc3495", "#6b1fb1", "#0b0630"}},
    {"Crimson", {"#eff9d6", "#ba5044", "#7a1c4b", "#1b0326"}},
    {"Aqua", {"#002b59", "#005881", "#00afb4", "#95e5d7"}},
    {"Nostalgia", {"#d0d058", "#a0a840", "#708028", "#405010"}},
    {"Cherry", {"#2d162c", "#412752", "#683a68", "#9775a6"}},
    {"Pastel", {"#46425e", "#5b768d", "#d17c7c", "#f6c6a8"}},
    {"Gold", {"#210b1b", "#4d222c", "#9d654c", "#cfab51"}},
    {"Candy", {"#151640", "#3f6d9e", "#f783b0", "#e6f2ef"}},
    {"Emerald", {"#2c2137", "#446176", "#3fac95", "#a1ef8c"}},
    {"Chrome", {"#221e31", "#41485d", "#778e98", "#c5dbd4"}},
    {"Soviet", {"#e8d6c0", "#92938d", "#a1281c", "#000000"}},
    {"Sepia", {"#cca66e", "#99683d", "#664930", "#332920"}},
    {"Slime", {"#d1cb95", "#40985e", "#1a644e", "#04373b", "#0a1a2f"}},
    {"Sunset Beach", {"#ffcf47", "#f98542", "#fc6767", "#4b79a1", "#283e51"}},
    {"Cyberpunk City", {"#1a1a2e", "#f72585", "#3a0ca3", "#4361ee", "#4cc9f0"}},
    {"Forest Dawn", {"#2e352f", "#6a8860", "#d3b88c", "#f4e2d8", "#8b5a2b"}},
    {"Retro Arcade", {"#00ff87", "#ff4b5c", "#ff9f1c", "#011627", "#39c0ed"}},
    {"Vintage Cinema", {"#1c1b29", "#ae7f42", "#856046", "#dbd3c9", "#5a3f37"}},
    {"Aqua2", {"#000000", "#083131", "#105d63", "#318e9c", "#84bece", "#ffffff"}},
    {"Anaglyph", {"#1a0908", "#4d1313", "#b3242d", "#f26174", "#85b1f2", "#335ccc", "#141f66", "#0a0a1a"}},
    {"DMG", {"#333030", "#423d4d", "#4d5966", "#667f59", "#88985b", "#b3b37e", "#d8ceae", "#f0f0e4"}},
    {"Spoky",
     {"#161317", "#2c262d", "#52474e", "#7a676f", "#522d2d", "#72403b", "#895142", "#aa644d",
      "#7e5c57", "#a68576", "#c2af91", "#f5e9bf", "#5d4e54", "#94797f", "#be9b97", "#e6bdaf",
      "#3f3e43", "#635d67", "#837481", "#a99aa4", "#303332", "#494e4b", "#5e675f", "#788374",
      "#242426", "#3e4143", "#5d6567", "#748382"}},
    {"Fex",
     {"#f2f0e5", "#b8b5b9", "#868188", "#646365", "#45444f", "#3a3858", "#212123", "#352b42",
      "#43436a", "#4b80ca", "#68c2d3", "#a2dcc7", "#ede19e", "#d3a068", "#b45252", "#6a536e",
      "#4b4158", "#80493a", "#a77b5b", "#e5ceb4", "#c2d368", "#8ab060", "#567b79", "#4e584a",
      "#7b7243", "#b2b47e", "#edc8c4", "#cf8acb", "#5f556a"}},
    {"Apollo",
     {"#172038", "#253a5e", "#3c5e8b", "#4f8fba", "#73bed3", "#a4dddb", "#19332d", "#25562e",
      "#468232", "#75a743", "#a8ca58", "#d0da91", "#4d2b32", "#7a4841", "#ad7757", "#c09473",
      "#d7b594", "#e7d5b3", "#341c27", "#602c2c", "#884b2b", "#be772b", "#de9e41", "#e8c170",
      "#241527", "#411d31", "#752438", "#a53030", "#cf573c", "#da863e", "#1e1d39", "#402751",
      "#7a367b", "#a23e8c", "#c65197", "#df84a5", "#090a14", "#10141f", "#151d28", "#202e37",
      "#394a50", "#577277", "#819796", "#a8b5b2", "#c7cfcc", "#ebede9"}},
    {"C64",
     {"#2e222f", "#3e3546", "#625565", "#966c6c", "#ab947a", "#694f62", "#7f708a", "#9babb2",
      "#c7dcd0", "#ffffff", "#6e2727", "#b33831", "#ea4f36", "#f57d4a", "#ae2334", "#e83b3b",
      "#fb6b1d", "#f79617", "#f9c22b", "#7a3045", "#9e4539", "#cd683d", "#e6904e", "#fbb954",
      "#4c3e24", "#676633", "#a2a947", "#d5e04b", "#fbff86", "#165a4c", "#239063", "#1ebc73",
      "#91db69", "#cddf6c", "#313638", "#374e4a", "#547e64", "#92a984", "#b2ba90", "#0b5e65",
      "#0b8a8f", "#0eaf9b", "#30e1b9", "#8ff8e2", "#323353", "#484a77", "#4d65b4", "#4d9be6",
      "#8fd3ff", "#45293f", "#6b3e75", "#905ea9", "#a884f3", "#eaaded", "#753c54", "#a24b6f",
      "#cf657f", "#ed8099", "#831c5d", "#c32454", "#f04f78", "#f68181", "#fca790", "#fdcbb0"}},
    {"CGA", {"#000000", "#55ffff", "#ff55ff", "#ffffff"}},
    {"Pico-8",
     {"#000000", "#1d2b53", "#7e2553", "#008751", "#ab5236", "#5f574f", "#c2c3c7", "#fff1e8",
      "#ff004d", "#ffa300", "#ffec27", "#00e436", "#29adff", "#83769c", "#ff77a8", "#ffccaa"}},
    {"EGA",
     {"#000000", "#0000aa", "#00aa00", "#00aaaa", "#aa0000", "#aa00aa", "#aa5500", "#aaaaaa",
      "#555555", "#5555ff", "#55ff55", "#55ffff", "#ff5555", "#ff55ff", "#ffff55", "#ffffff"}},
};
} // namespace

PaletteLibrary PaletteLibrary::WithBuiltins() {
  PaletteLibrary library;
  for (const BuiltinPalette& builtin : kBuiltins) {
    Palette colors;
    for (const char* hex : builtin.colors) {
      cv::Vec3b bgr;
      if (PaletteBuilder::ParseHexColor(hex, bgr)) colors.push_back(bgr);
    }
    library.Add(builtin.name, colors);
  }
  return library;
}

void PaletteLibrary::Add(const std::string& name, const Palette& palette) {
  palettes_[ToLower(name)] = Entry{name, PaletteBuilder::Finalize(palette, kMaxPaletteSize)};
}

int PaletteLibrary::LoadDirectory(const std::string& dir) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    throw PixelArtError(ErrorKind::InvalidPaletteSource, "palette directory not found: " + dir);
  }

  // Sorted for a stable load order across filesystems.
  std::vector<fs::path> strips;
  for (const fs::directory_entry& entry : fs::directory_iterator(dir, ec)) {
    if (entry.is_regular_file(ec) && ToLower(entry.path().extension().string()) == ".png") {
      strips.push_back(entry.path());
    }
  }
  std::sort(strips.begin(), strips.end());

  int loaded = 0;
  for (const fs::path& path : strips) {
    try {
      Add(path.stem().string(), PaletteBuilder::LoadPalette(path.string()));
      ++loaded;
    } catch (const PixelArtError& e) {
      spdlog::warn("Skipping palette {}: {}", path.string(), e.what());
    }
  }
  spdlog::debug("Loaded {} palette(s) from {}", loaded, dir);
  return loaded;
}

bool PaletteLibrary::Contains(const std::string& name) const {
  return palettes_.count(ToLower(name)) != 0;
}

const Palette& PaletteLibrary::Get(const std::string& name) const {
  auto it = palettes_.find(ToLower(name));
  if (it == palettes_.end()) {
    throw PixelArtError(ErrorKind::InvalidPaletteSource, "unknown palette preset: " + name);
  }
  return it->second.palette;
}

std::vector<std::string> PaletteLibrary::Names() const {
  std::vector<std::string> names;
  names.reserve(palettes_.size());
  for (const auto& kv : palettes_) names.push_back(kv.second.name);
  return names;
}
