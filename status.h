#ifndef STATUS_H
#define STATUS_H

#include <cstdint>

// Outcome of loading a ROM. Anything but kSuccess leaves the interpreter
// exactly as it was before the call.
enum class RomStatus {
  kSuccess,
  kRomNotFound,
  kRomOpenFailed,
  kRomReadFailed,
  kRomExceedsMemory,
};

// Outcome of a single step. Errors abandon the instruction and leave the
// program counter pointing at it.
enum class StepStatus {
  kSuccess,
  kInvalidOpcode,
  kStackOverflow,
  kStackEmpty,
  kAddressOutOfBounds,
  // Stepping before any ROM was loaded.
  kNotRunning,
};

struct StepResult {
  StepStatus status = StepStatus::kSuccess;
  // The word that was fetched, zero when nothing was fetched.
  uint16_t opcode = 0;

  bool ok() const { return status == StepStatus::kSuccess; }
};

const char* ToString(RomStatus status);
const char* ToString(StepStatus status);

#endif /* STATUS_H */
