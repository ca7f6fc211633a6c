#include "interpreter.h"

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace {

// A bitmapped font with characters 0-9 and A-F, 5 bytes per glyph.
constexpr std::array<uint8_t, 80> kFont = {
    0xF0, 0x90, 0x90, 0x90, 0xF0, // 0
    0x20, 0x60, 0x20, 0x20, 0x70, // 1
    0xF0, 0x10, 0xF0, 0x80, 0xF0, // 2
    0xF0, 0x10, 0xF0, 0x10, 0xF0, // 3
    0x90, 0x90, 0xF0, 0x10, 0x10, // 4
    0xF0, 0x80, 0xF0, 0x10, 0xF0, // 5
    0xF0, 0x80, 0xF0, 0x90, 0xF0, // 6
    0xF0, 0x10, 0x20, 0x40, 0x40, // 7
    0xF0, 0x90, 0xF0, 0x90, 0xF0, // 8
    0xF0, 0x90, 0xF0, 0x10, 0xF0, // 9
    0xF0, 0x90, 0xF0, 0x90, 0x90, // A
    0xE0, 0x90, 0xE0, 0x90, 0xE0, // B
    0xF0, 0x80, 0x80, 0x80, 0xF0, // C
    0xE0, 0x90, 0x90, 0x90, 0xE0, // D
    0xF0, 0x80, 0xF0, 0x80, 0xF0, // E
    0xF0, 0x80, 0xF0, 0x80, 0x80  // F
};

constexpr uint16_t kAddressMask = 0x0FFF;

} // namespace

const char* ToString(Quirk quirk) {
  switch (quirk) {
  case Quirk::kShiftUsesVy:
    return "Shift uses VY";
  case Quirk::kJumpUsesVx:
    return "Jump uses VX";
  case Quirk::kStoreLoadIncrementsI:
    return "Store/load increments I";
  }
  return "unknown quirk";
}

Interpreter::Interpreter(QuirkFlags quirks, unsigned seed)
    : quirks_(quirks), random_(seed) {
  stack_.reserve(kStackSize);
  Reset();
}

void Interpreter::Reset() {
  memory_.fill(0);
  std::copy(kFont.begin(), kFont.end(), memory_.begin() + kFontAddress);
  variable_registers_.fill(0);
  stack_.clear();
  program_counter_ = kProgramStart;
  index_register_ = 0;
  delay_timer_ = 0;
  sound_timer_ = 0;
  keys_.fill(false);
  graphics_.fill(false);
  running_ = false;
  draw_flag_ = true;
}

RomStatus Interpreter::LoadRom(const std::string& path) {
  std::error_code error;
  if (path.empty() || !std::filesystem::is_regular_file(path, error)) {
    return RomStatus::kRomNotFound;
  }

  std::ifstream file_stream(path, std::ios::binary);
  if (!file_stream) {
    return RomStatus::kRomOpenFailed;
  }

  const auto size = std::filesystem::file_size(path, error);
  if (error) {
    return RomStatus::kRomReadFailed;
  }
  if (size > static_cast<std::uintmax_t>(kMaxRomSize)) {
    return RomStatus::kRomExceedsMemory;
  }

  // Read into a scratch buffer so that a short read can't leave a half
  // loaded program behind.
  std::vector<uint8_t> rom(static_cast<std::size_t>(size));
  file_stream.read(reinterpret_cast<char*>(rom.data()),
                   static_cast<std::streamsize>(rom.size()));
  if (file_stream.gcount() != static_cast<std::streamsize>(rom.size())) {
    return RomStatus::kRomReadFailed;
  }
  return LoadRom(rom);
}

RomStatus Interpreter::LoadRom(const std::vector<uint8_t>& rom) {
  if (rom.size() > static_cast<std::size_t>(kMaxRomSize)) {
    return RomStatus::kRomExceedsMemory;
  }
  Reset();
  std::copy(rom.begin(), rom.end(), memory_.begin() + kProgramStart);
  running_ = true;
  return RomStatus::kSuccess;
}

StepResult Interpreter::Step() {
  if (!running_) {
    return {StepStatus::kNotRunning, 0};
  }
  if (program_counter_ > kMemorySize - 2) {
    return {StepStatus::kAddressOutOfBounds, 0};
  }

  // Each Chip8 instruction is two bytes, stored big endian.
  const uint16_t instruction =
      (memory_[program_counter_] << 8) | memory_[program_counter_ + 1];
  return Execute(Decode(instruction));
}

StepResult Interpreter::Execute(const Instruction& instruction) {
  auto& vx = variable_registers_[instruction.x];
  auto& vy = variable_registers_[instruction.y];
  auto& vf = variable_registers_[0xF];
  uint16_t next_pc = program_counter_ + 2;

  switch (instruction.op) {
  case Operation::kClearScreen: {
    graphics_.fill(false);
    draw_flag_ = true;
    break;
  }

  case Operation::kReturn: {
    if (stack_.empty()) {
      return {StepStatus::kStackEmpty, instruction.raw};
    }
    next_pc = stack_.back();
    stack_.pop_back();
    break;
  }

  // Unconditional jump.
  case Operation::kJump: {
    next_pc = instruction.nnn;
    break;
  }

  // Function call, the return address is the instruction after the call.
  case Operation::kCall: {
    if (stack_.size() == static_cast<std::size_t>(kStackSize)) {
      return {StepStatus::kStackOverflow, instruction.raw};
    }
    stack_.push_back(next_pc);
    next_pc = instruction.nnn;
    break;
  }

  case Operation::kSkipEqualByte: {
    if (vx == instruction.nn) {
      next_pc += 2;
    }
    break;
  }

  case Operation::kSkipNotEqualByte: {
    if (vx != instruction.nn) {
      next_pc += 2;
    }
    break;
  }

  case Operation::kSkipEqualReg: {
    if (vx == vy) {
      next_pc += 2;
    }
    break;
  }

  case Operation::kLoadByte: {
    vx = instruction.nn;
    break;
  }

  // No carry flag for the immediate form.
  case Operation::kAddByte: {
    vx += instruction.nn;
    break;
  }

  case Operation::kLoadReg: {
    vx = vy;
    break;
  }

  case Operation::kOr: {
    vx |= vy;
    break;
  }

  case Operation::kAnd: {
    vx &= vy;
    break;
  }

  case Operation::kXor: {
    vx ^= vy;
    break;
  }

  // The flag is written last for all the arithmetic below. VF can be one of
  // the operands and the flag must win.
  case Operation::kAdd: {
    const int sum = vx + vy;
    vx = static_cast<uint8_t>(sum);
    vf = sum > 0xFF;
    break;
  }

  case Operation::kSub: {
    const bool no_borrow = vx >= vy;
    vx = static_cast<uint8_t>(vx - vy);
    vf = no_borrow;
    break;
  }

  case Operation::kSubReversed: {
    const bool no_borrow = vy >= vx;
    vx = static_cast<uint8_t>(vy - vx);
    vf = no_borrow;
    break;
  }

  case Operation::kShiftRight: {
    const uint8_t source = ShiftSource(instruction);
    vx = source >> 1;
    vf = source & 0x01;
    break;
  }

  case Operation::kShiftLeft: {
    const uint8_t source = ShiftSource(instruction);
    vx = static_cast<uint8_t>(source << 1);
    vf = (source & 0x80) >> 7;
    break;
  }

  case Operation::kSkipNotEqualReg: {
    if (vx != vy) {
      next_pc += 2;
    }
    break;
  }

  case Operation::kLoadIndex: {
    index_register_ = instruction.nnn;
    break;
  }

  // Jump by offset. The offset register depends on the interpreter being
  // imitated.
  case Operation::kJumpOffset: {
    const auto offset_register = HasQuirk(Quirk::kJumpUsesVx) ? instruction.x
                                                              : 0;
    next_pc = instruction.nnn + variable_registers_[offset_register];
    break;
  }

  case Operation::kRandom: {
    std::uniform_int_distribution<int> byte(0, 0xFF);
    vx = static_cast<uint8_t>(byte(random_)) & instruction.nn;
    break;
  }

  case Operation::kDraw: {
    if (index_register_ + instruction.n > kMemorySize) {
      return {StepStatus::kAddressOutOfBounds, instruction.raw};
    }
    Draw(instruction);
    break;
  }

  // Skip instructions based on key state.
  case Operation::kSkipKeyPressed: {
    if (keys_[vx & 0xF]) {
      next_pc += 2;
    }
    break;
  }

  case Operation::kSkipKeyNotPressed: {
    if (!keys_[vx & 0xF]) {
      next_pc += 2;
    }
    break;
  }

  case Operation::kLoadDelayTimer: {
    vx = delay_timer_;
    break;
  }

  // Block by re-executing this instruction until some key is down, then take
  // the lowest one.
  case Operation::kWaitKey: {
    const auto pressed = std::find(keys_.begin(), keys_.end(), true);
    if (pressed == keys_.end()) {
      next_pc = program_counter_;
    } else {
      vx = static_cast<uint8_t>(pressed - keys_.begin());
    }
    break;
  }

  case Operation::kSetDelayTimer: {
    delay_timer_ = vx;
    break;
  }

  case Operation::kSetSoundTimer: {
    sound_timer_ = vx;
    break;
  }

  // VF is left alone, I stays inside the 12 bit address space.
  case Operation::kAddIndex: {
    index_register_ = (index_register_ + vx) & kAddressMask;
    break;
  }

  case Operation::kLoadFontGlyph: {
    index_register_ = kFontAddress + (vx & 0x0F) * kFontCharacterHeight;
    break;
  }

  case Operation::kStoreBcd: {
    if (index_register_ + 3 > kMemorySize) {
      return {StepStatus::kAddressOutOfBounds, instruction.raw};
    }
    memory_[index_register_] = vx / 100;
    memory_[index_register_ + 1] = (vx / 10) % 10;
    memory_[index_register_ + 2] = vx % 10;
    break;
  }

  case Operation::kStoreRegisters: {
    if (index_register_ + instruction.x + 1 > kMemorySize) {
      return {StepStatus::kAddressOutOfBounds, instruction.raw};
    }
    for (int i = 0; i <= instruction.x; ++i) {
      memory_[index_register_ + i] = variable_registers_[i];
    }
    if (HasQuirk(Quirk::kStoreLoadIncrementsI)) {
      index_register_ += instruction.x + 1;
    }
    break;
  }

  case Operation::kLoadRegisters: {
    if (index_register_ + instruction.x + 1 > kMemorySize) {
      return {StepStatus::kAddressOutOfBounds, instruction.raw};
    }
    for (int i = 0; i <= instruction.x; ++i) {
      variable_registers_[i] = memory_[index_register_ + i];
    }
    if (HasQuirk(Quirk::kStoreLoadIncrementsI)) {
      index_register_ += instruction.x + 1;
    }
    break;
  }

  case Operation::kInvalid:
    return {StepStatus::kInvalidOpcode, instruction.raw};
  }

  program_counter_ = next_pc;
  return {StepStatus::kSuccess, instruction.raw};
}

// XOR-draws N rows of an 8 pixel wide sprite read from I at (VX, VY). Every
// pixel wraps around the screen edges on its own.
void Interpreter::Draw(const Instruction& instruction) {
  const int col_start = variable_registers_[instruction.x] % kDisplayWidth;
  const int row_start = variable_registers_[instruction.y] % kDisplayHeight;
  bool collision = false;

  for (int sprite_row_offset = 0; sprite_row_offset < instruction.n;
       ++sprite_row_offset) {
    const auto row = (row_start + sprite_row_offset) % kDisplayHeight;
    const auto sprite_row = memory_[index_register_ + sprite_row_offset];
    for (int sprite_col_offset = 0; sprite_col_offset < 8;
         ++sprite_col_offset) {
      // Check if the `sprite_col_offset`th bit from the left is set.
      if (!(sprite_row & (0x80 >> sprite_col_offset))) {
        continue;
      }
      const auto col = (col_start + sprite_col_offset) % kDisplayWidth;
      auto& cell = graphics_[row * kDisplayWidth + col];
      if (cell) {
        collision = true;
      }
      cell = !cell;
    }
  }

  variable_registers_[0xF] = collision;
  draw_flag_ = true;
}

uint8_t Interpreter::ShiftSource(const Instruction& instruction) const {
  return HasQuirk(Quirk::kShiftUsesVy) ? variable_registers_[instruction.y]
                                       : variable_registers_[instruction.x];
}

void Interpreter::TickTimers() {
  if (delay_timer_ > 0) {
    delay_timer_--;
  }
  if (sound_timer_ > 0) {
    sound_timer_--;
  }
}

void Interpreter::SetKeyValue(int key, bool pressed) {
  if (key < 0 || key >= kKeyCount) {
    return;
  }
  keys_[key] = pressed;
}

bool Interpreter::GetKeyValue(int key) const {
  if (key < 0 || key >= kKeyCount) {
    return false;
  }
  return keys_[key];
}

void Interpreter::SetQuirk(Quirk quirk) {
  quirks_.set(static_cast<std::size_t>(quirk));
}

void Interpreter::ClearQuirk(Quirk quirk) {
  quirks_.reset(static_cast<std::size_t>(quirk));
}

bool Interpreter::ToggleQuirk(Quirk quirk) {
  quirks_.flip(static_cast<std::size_t>(quirk));
  return HasQuirk(quirk);
}

bool Interpreter::HasQuirk(Quirk quirk) const {
  return quirks_.test(static_cast<std::size_t>(quirk));
}

bool Interpreter::PixelAt(int x, int y) const {
  if (x < 0 || x >= kDisplayWidth || y < 0 || y >= kDisplayHeight) {
    return false;
  }
  return graphics_[y * kDisplayWidth + x];
}

uint8_t Interpreter::ReadMemory(int address) const {
  if (address < 0 || address >= kMemorySize) {
    return 0;
  }
  return memory_[address];
}

bool Interpreter::ConsumeDrawFlag() {
  const bool changed = draw_flag_;
  draw_flag_ = false;
  return changed;
}
