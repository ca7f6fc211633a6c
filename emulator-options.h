#ifndef EMULATOR_OPTIONS_H
#define EMULATOR_OPTIONS_H

#include <optional>
#include <string>
#include <vector>

#include "interpreter.h"

// Everything the frontend can be configured with from the command line.
struct EmulatorOptions {
  static constexpr int kDefaultCpuHz = 700;
  static constexpr int kMinCpuHz = 100;
  static constexpr int kMaxCpuHz = 5000;

  std::string rom_path;
  QuirkFlags quirks;
  int cpu_hz = kDefaultCpuHz;
};

// Parses `<rom file> [--shift-uses-vy] [--jump-uses-vx]
// [--store-load-increments-i] [--cpu-hz N]` (program name excluded). On
// failure returns nothing and describes the problem in `error`.
std::optional<EmulatorOptions> ParseArguments(
    const std::vector<std::string>& args, std::string* error);

std::string Usage(const std::string& program);

#endif /* EMULATOR_OPTIONS_H */
