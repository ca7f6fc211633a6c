#ifndef INTERPRETER_H
#define INTERPRETER_H

#include <array>
#include <bitset>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "instruction.h"
#include "status.h"

// Compatibility toggles reproducing the ways historical interpreters
// disagreed. Each one only affects the instructions named next to it.
enum class Quirk {
  // 8XY6/8XYE shift VY into VX instead of shifting VX in place.
  kShiftUsesVy = 0,
  // BNNN jumps to NNN + VX (X being the top nibble of NNN) instead of NNN + V0.
  kJumpUsesVx = 1,
  // FX55/FX65 leave I pointing past the last register transferred.
  kStoreLoadIncrementsI = 2,
};

constexpr std::size_t kQuirkCount = 3;
using QuirkFlags = std::bitset<kQuirkCount>;

inline QuirkFlags& operator|=(QuirkFlags& flags, Quirk quirk) {
  flags.set(static_cast<std::size_t>(quirk));
  return flags;
}

// Short human readable name, e.g. for a status bar.
const char* ToString(Quirk quirk);

// A CHIP-8 virtual machine. The host owns it and drives it from one thread:
// `Step` at whatever CPU rate it likes, `TickTimers` at 60 Hz and
// `SetKeyValue` on input events. Nothing here logs, blocks or throws for
// emulation conditions; every problem comes back as a status.
class Interpreter {
public:
  static constexpr int kMemorySize = 4096;
  static constexpr int kRegisterCount = 16;
  static constexpr int kStackSize = 16;
  static constexpr int kKeyCount = 16;
  static constexpr int kDisplayWidth = 64;
  static constexpr int kDisplayHeight = 32;
  static constexpr int kDisplaySize = kDisplayWidth * kDisplayHeight;

  // The original Chip-8 interpreter stored the first byte of the program at
  // address 0x200 and so many programs rely on this.
  static constexpr uint16_t kProgramStart = 0x200;
  static constexpr int kMaxRomSize = kMemorySize - kProgramStart;
  // Early Chip8 interpreters stored the font starting at address 0x050.
  static constexpr uint16_t kFontAddress = 0x050;
  static constexpr int kFontCharacterHeight = 5;

  using Graphics = std::array<bool, kDisplaySize>;

  explicit Interpreter(QuirkFlags quirks = QuirkFlags(),
                       unsigned seed = std::random_device{}());

  // Reads the file at `path` and loads it as described by the bytes
  // overload.
  RomStatus LoadRom(const std::string& path);
  // Re-initializes the whole machine, copies `rom` to 0x200 and starts
  // running. Too large a ROM is rejected without touching anything.
  RomStatus LoadRom(const std::vector<uint8_t>& rom);

  // Returns to the freshly constructed state. Quirks are host configuration
  // and survive.
  void Reset();

  // Fetch, decode and execute a single instruction.
  StepResult Step();

  // Decrement the delay and sound timers if they're set. Meant to be called
  // at 60 Hz regardless of the CPU rate.
  void TickTimers();

  // Keys outside 0x0-0xF are ignored.
  void SetKeyValue(int key, bool pressed);
  bool GetKeyValue(int key) const;

  // Quirks are read on every step, so changes apply to the next instruction.
  void SetQuirk(Quirk quirk);
  void ClearQuirk(Quirk quirk);
  // Flips one quirk and returns its new state.
  bool ToggleQuirk(Quirk quirk);
  bool HasQuirk(Quirk quirk) const;
  const QuirkFlags& quirks() const { return quirks_; }

  bool is_running() const { return running_; }
  const Graphics& graphics() const { return graphics_; }
  bool PixelAt(int x, int y) const;
  uint8_t delay_timer() const { return delay_timer_; }
  uint8_t sound_timer() const { return sound_timer_; }

  uint16_t pc() const { return program_counter_; }
  uint16_t index_register() const { return index_register_; }
  const std::array<uint8_t, kRegisterCount>& registers() const {
    return variable_registers_;
  }
  const std::vector<uint16_t>& stack() const { return stack_; }
  std::size_t stack_depth() const { return stack_.size(); }
  // Out of range addresses read as zero.
  uint8_t ReadMemory(int address) const;

  // True once after each change to the framebuffer, so a frontend can skip
  // redrawing an unchanged screen.
  bool ConsumeDrawFlag();

private:
  StepResult Execute(const Instruction& instruction);
  void Draw(const Instruction& instruction);
  // Shared by the shift instructions: returns the value being shifted
  // according to the shift quirk.
  uint8_t ShiftSource(const Instruction& instruction) const;

  std::array<uint8_t, kMemorySize> memory_{};
  std::array<uint8_t, kRegisterCount> variable_registers_{};
  std::vector<uint16_t> stack_;
  uint16_t program_counter_ = kProgramStart;
  uint16_t index_register_ = 0;
  uint8_t delay_timer_ = 0;
  uint8_t sound_timer_ = 0;
  std::array<bool, kKeyCount> keys_{};
  Graphics graphics_{};
  bool running_ = false;
  bool draw_flag_ = false;
  QuirkFlags quirks_;
  std::mt19937 random_;
};

#endif /* INTERPRETER_H */
