#pragma once

#include "PixelTypes.h"

#include <map>
#include <string>
#include <vector>

// PaletteLibrary: named predefined palettes.
// Owned by the caller and passed explicitly to the pipeline; there is no
// process-wide registry. Lookup is case-insensitive.
class PaletteLibrary {
public:
  // Library preloaded with the built-in retro presets.
  static PaletteLibrary WithBuiltins();

  // Adds or replaces a palette. The palette is finalized (deduped, sorted).
  void Add(const std::string& name, const Palette& palette);

  // Loads every *.png palette strip directly inside dir, named by file stem.
  // Unreadable strips are logged and skipped. Returns the number loaded.
  // Throws PixelArtError(InvalidPaletteSource) if dir is not a directory.
  int LoadDirectory(const std::string& dir);

  bool Contains(const std::string& name) const;

  // Throws PixelArtError(InvalidPaletteSource) for unknown names.
  const Palette& Get(const std::string& name) const;

  // Display names in sorted order.
  std::vector<std::string> Names() const;

  size_t Size() const { return palettes_.size(); }

private:
  struct Entry {
    std::string name;
    Palette palette;
  };
  std::map<std::string, Entry> palettes_; // keyed by lower-cased name
};
