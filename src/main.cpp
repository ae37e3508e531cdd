#include "CommandLine.h"

#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

namespace {
std::atomic<bool> g_cancel{false};

void OnInterrupt(int) { g_cancel.store(true); }
} // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    CommandLine::PrintUsage(std::cout, argv[0]);
    return kExitUsage;
  }

  spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

  CommandLineOptions options;
  std::string error;
  if (!CommandLine::Parse(argc, argv, options, error)) {
    std::cerr << error << std::endl;
    CommandLine::PrintUsage(std::cerr, argv[0]);
    return kExitUsage;
  }
  if (options.showHelp) {
    CommandLine::PrintUsage(std::cout, argv[0]);
    return kExitOk;
  }
  if (options.verbose) spdlog::set_level(spdlog::level::debug);

  std::signal(SIGINT, OnInterrupt);
  return CommandLine::Run(options, &g_cancel, std::cout);
}
