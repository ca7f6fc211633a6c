#ifndef INSTRUCTION_H
#define INSTRUCTION_H

#include <cstdint>
#include <string>

// Every operation the interpreter understands. `kInvalid` is produced for any
// word that doesn't decode to one of the others.
enum class Operation {
  kInvalid,
  kClearScreen,        // 00E0
  kReturn,             // 00EE
  kJump,               // 1NNN
  kCall,               // 2NNN
  kSkipEqualByte,      // 3XNN
  kSkipNotEqualByte,   // 4XNN
  kSkipEqualReg,       // 5XY0
  kLoadByte,           // 6XNN
  kAddByte,            // 7XNN
  kLoadReg,            // 8XY0
  kOr,                 // 8XY1
  kAnd,                // 8XY2
  kXor,                // 8XY3
  kAdd,                // 8XY4
  kSub,                // 8XY5
  kShiftRight,         // 8XY6
  kSubReversed,        // 8XY7
  kShiftLeft,          // 8XYE
  kSkipNotEqualReg,    // 9XY0
  kLoadIndex,          // ANNN
  kJumpOffset,         // BNNN
  kRandom,             // CXNN
  kDraw,               // DXYN
  kSkipKeyPressed,     // EX9E
  kSkipKeyNotPressed,  // EXA1
  kLoadDelayTimer,     // FX07
  kWaitKey,            // FX0A
  kSetDelayTimer,      // FX15
  kSetSoundTimer,      // FX18
  kAddIndex,           // FX1E
  kLoadFontGlyph,      // FX29
  kStoreBcd,           // FX33
  kStoreRegisters,     // FX55
  kLoadRegisters,      // FX65
};

// Chip8 instructions are 16 bit words, commonly of the form:
//   - 0xTXYN or
//   - 0xTXNN or
//   - 0xTNNN
// where:
//   - T is the type of instruction
//   - X and Y are register indices
//   - N[NN] are integer "constants"
//
// A decoded instruction carries every field; which ones matter depends on
// `op`.
struct Instruction {
  Operation op = Operation::kInvalid;
  uint16_t raw = 0;
  uint8_t x = 0;
  uint8_t y = 0;
  uint8_t n = 0;
  uint8_t nn = 0;
  uint16_t nnn = 0;
};

// Common bit masks for accessing parts of an instruction word.
inline uint8_t register1(uint16_t instruction) {
  return (instruction & 0x0F00) >> 8;
}
inline uint8_t register2(uint16_t instruction) {
  return (instruction & 0x00F0) >> 4;
}
inline uint8_t constant4(uint16_t instruction) { return instruction & 0x000F; }
inline uint8_t constant8(uint16_t instruction) { return instruction & 0x00FF; }
inline uint16_t constant12(uint16_t instruction) {
  return instruction & 0x0FFF;
}

// Pure decode, no machine state involved.
Instruction Decode(uint16_t instruction);

// Assembly-like text for an instruction word, e.g. "DRW V1, V2, 5". Invalid
// words come back as "??? 0xNNNN".
std::string Disassemble(uint16_t instruction);

#endif /* INSTRUCTION_H */
