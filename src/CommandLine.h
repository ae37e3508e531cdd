#pragma once

#include "BatchRunner.h"
#include "PixelTypes.h"

#include <atomic>
#include <exception>
#include <ostream>
#include <string>

enum ExitCode {
  kExitOk = 0,
  kExitUsage = 1,
  kExitError = 2,
  kExitPartial = 3,
  kExitCancelled = 130
};

struct CommandLineOptions {
  PixelationConfig config;
  std::string inputPath;
  std::string outputPath;
  std::string paletteDir;
  bool listPresets = false;
  bool showHelp = false;
  bool verbose = false;
};

// CommandLine: argv parsing and the batch entry point behind paletteforge.
class CommandLine {
public:
  // Returns false with outError set on unknown options, missing values or bad numbers.
  // A preset without an explicit --colors keeps all of its colors.
  static bool Parse(int argc, const char* const* argv, CommandLineOptions& out, std::string& outError);

  static void PrintUsage(std::ostream& os, const char* prog);

  // Runs a parsed command and returns the process exit code. Errors are
  // logged and mapped to a code; nothing propagates.
  static int Run(const CommandLineOptions& options, const std::atomic<bool>* cancel, std::ostream& out);

  static int ExitCodeFor(const BatchReport& report);
  static int ExitCodeFor(const std::exception& error);
};
