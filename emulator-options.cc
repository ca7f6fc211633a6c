#include "emulator-options.h"

#include <cstdlib>

namespace {

bool ParseHz(const std::string& text, int* hz) {
  if (text.empty()) {
    return false;
  }
  char* end = nullptr;
  const long value = std::strtol(text.c_str(), &end, 10);
  if (*end != '\0' || value < EmulatorOptions::kMinCpuHz ||
      value > EmulatorOptions::kMaxCpuHz) {
    return false;
  }
  *hz = static_cast<int>(value);
  return true;
}

} // namespace

std::optional<EmulatorOptions> ParseArguments(
    const std::vector<std::string>& args, std::string* error) {
  EmulatorOptions options;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto& arg = args[i];
    if (arg == "--shift-uses-vy") {
      options.quirks |= Quirk::kShiftUsesVy;
    } else if (arg == "--jump-uses-vx") {
      options.quirks |= Quirk::kJumpUsesVx;
    } else if (arg == "--store-load-increments-i") {
      options.quirks |= Quirk::kStoreLoadIncrementsI;
    } else if (arg == "--cpu-hz") {
      if (i + 1 == args.size() || !ParseHz(args[i + 1], &options.cpu_hz)) {
        *error = "--cpu-hz expects a number between " +
                 std::to_string(EmulatorOptions::kMinCpuHz) + " and " +
                 std::to_string(EmulatorOptions::kMaxCpuHz);
        return std::nullopt;
      }
      ++i;
    } else if (arg.rfind("--", 0) == 0) {
      *error = "unknown option " + arg;
      return std::nullopt;
    } else if (options.rom_path.empty()) {
      options.rom_path = arg;
    } else {
      *error = "only one rom file can be given";
      return std::nullopt;
    }
  }

  if (options.rom_path.empty()) {
    *error = "missing rom file";
    return std::nullopt;
  }
  return options;
}

std::string Usage(const std::string& program) {
  return "Usage: " + program +
         " <rom file> [--shift-uses-vy] [--jump-uses-vx]"
         " [--store-load-increments-i] [--cpu-hz N]";
}
