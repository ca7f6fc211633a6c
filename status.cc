#include "status.h"

const char* ToString(RomStatus status) {
  switch (status) {
  case RomStatus::kSuccess:
    return "ROM loaded";
  case RomStatus::kRomNotFound:
    return "ROM file not found";
  case RomStatus::kRomOpenFailed:
    return "ROM file could not be opened";
  case RomStatus::kRomReadFailed:
    return "ROM file could not be read";
  case RomStatus::kRomExceedsMemory:
    return "ROM file is larger than 3584 bytes";
  }
  return "unknown ROM status";
}

const char* ToString(StepStatus status) {
  switch (status) {
  case StepStatus::kSuccess:
    return "ok";
  case StepStatus::kInvalidOpcode:
    return "invalid opcode";
  case StepStatus::kStackOverflow:
    return "stack overflow";
  case StepStatus::kStackEmpty:
    return "return with empty stack";
  case StepStatus::kAddressOutOfBounds:
    return "memory access out of bounds";
  case StepStatus::kNotRunning:
    return "no ROM loaded";
  }
  return "unknown step status";
}
