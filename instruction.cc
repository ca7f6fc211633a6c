#include "instruction.h"

#include <iomanip>
#include <sstream>

namespace {

// Which operation a word encodes. Sub-opcodes live in the low nibble for the
// 0x8 family and in the low byte for the 0x0, 0xE and 0xF families.
Operation DecodeOperation(uint16_t instruction) {
  switch (instruction & 0xF000) {
  case (0x0000): {
    if (instruction == 0x00E0) {
      return Operation::kClearScreen;
    }
    if (instruction == 0x00EE) {
      return Operation::kReturn;
    }
    // 0NNN machine code routines aren't supported.
    return Operation::kInvalid;
  }
  case (0x1000):
    return Operation::kJump;
  case (0x2000):
    return Operation::kCall;
  case (0x3000):
    return Operation::kSkipEqualByte;
  case (0x4000):
    return Operation::kSkipNotEqualByte;
  case (0x5000):
    return constant4(instruction) == 0 ? Operation::kSkipEqualReg
                                       : Operation::kInvalid;
  case (0x6000):
    return Operation::kLoadByte;
  case (0x7000):
    return Operation::kAddByte;

  // Two register arithmetic.
  case (0x8000): {
    switch (constant4(instruction)) {
    case (0x0):
      return Operation::kLoadReg;
    case (0x1):
      return Operation::kOr;
    case (0x2):
      return Operation::kAnd;
    case (0x3):
      return Operation::kXor;
    case (0x4):
      return Operation::kAdd;
    case (0x5):
      return Operation::kSub;
    case (0x6):
      return Operation::kShiftRight;
    case (0x7):
      return Operation::kSubReversed;
    case (0xE):
      return Operation::kShiftLeft;
    default:
      return Operation::kInvalid;
    }
  }
  case (0x9000):
    return constant4(instruction) == 0 ? Operation::kSkipNotEqualReg
                                       : Operation::kInvalid;
  case (0xA000):
    return Operation::kLoadIndex;
  case (0xB000):
    return Operation::kJumpOffset;
  case (0xC000):
    return Operation::kRandom;
  case (0xD000):
    return Operation::kDraw;
  case (0xE000): {
    switch (constant8(instruction)) {
    case (0x9E):
      return Operation::kSkipKeyPressed;
    case (0xA1):
      return Operation::kSkipKeyNotPressed;
    default:
      return Operation::kInvalid;
    }
  }

  // The F* instructions are a bit of grab bag...
  case (0xF000): {
    switch (constant8(instruction)) {
    case (0x07):
      return Operation::kLoadDelayTimer;
    case (0x0A):
      return Operation::kWaitKey;
    case (0x15):
      return Operation::kSetDelayTimer;
    case (0x18):
      return Operation::kSetSoundTimer;
    case (0x1E):
      return Operation::kAddIndex;
    case (0x29):
      return Operation::kLoadFontGlyph;
    case (0x33):
      return Operation::kStoreBcd;
    case (0x55):
      return Operation::kStoreRegisters;
    case (0x65):
      return Operation::kLoadRegisters;
    default:
      return Operation::kInvalid;
    }
  }
  }
  return Operation::kInvalid;
}

std::string Hex(unsigned value, int width) {
  std::ostringstream out;
  out << "0x" << std::hex << std::uppercase << std::setfill('0')
      << std::setw(width) << value;
  return out.str();
}

std::string Reg(uint8_t index) {
  std::ostringstream out;
  out << 'V' << std::hex << std::uppercase << static_cast<int>(index);
  return out.str();
}

} // namespace

Instruction Decode(uint16_t instruction) {
  Instruction decoded;
  decoded.op = DecodeOperation(instruction);
  decoded.raw = instruction;
  decoded.x = register1(instruction);
  decoded.y = register2(instruction);
  decoded.n = constant4(instruction);
  decoded.nn = constant8(instruction);
  decoded.nnn = constant12(instruction);
  return decoded;
}

std::string Disassemble(uint16_t instruction) {
  const auto d = Decode(instruction);
  const auto vx = Reg(d.x);
  const auto vy = Reg(d.y);
  const auto nn = Hex(d.nn, 2);
  const auto nnn = Hex(d.nnn, 3);

  switch (d.op) {
  case Operation::kClearScreen:
    return "CLS";
  case Operation::kReturn:
    return "RET";
  case Operation::kJump:
    return "JP " + nnn;
  case Operation::kCall:
    return "CALL " + nnn;
  case Operation::kSkipEqualByte:
    return "SE " + vx + ", " + nn;
  case Operation::kSkipNotEqualByte:
    return "SNE " + vx + ", " + nn;
  case Operation::kSkipEqualReg:
    return "SE " + vx + ", " + vy;
  case Operation::kLoadByte:
    return "LD " + vx + ", " + nn;
  case Operation::kAddByte:
    return "ADD " + vx + ", " + nn;
  case Operation::kLoadReg:
    return "LD " + vx + ", " + vy;
  case Operation::kOr:
    return "OR " + vx + ", " + vy;
  case Operation::kAnd:
    return "AND " + vx + ", " + vy;
  case Operation::kXor:
    return "XOR " + vx + ", " + vy;
  case Operation::kAdd:
    return "ADD " + vx + ", " + vy;
  case Operation::kSub:
    return "SUB " + vx + ", " + vy;
  case Operation::kShiftRight:
    return "SHR " + vx + ", " + vy;
  case Operation::kSubReversed:
    return "SUBN " + vx + ", " + vy;
  case Operation::kShiftLeft:
    return "SHL " + vx + ", " + vy;
  case Operation::kSkipNotEqualReg:
    return "SNE " + vx + ", " + vy;
  case Operation::kLoadIndex:
    return "LD I, " + nnn;
  case Operation::kJumpOffset:
    return "JP V0, " + nnn;
  case Operation::kRandom:
    return "RND " + vx + ", " + nn;
  case Operation::kDraw:
    return "DRW " + vx + ", " + vy + ", " + std::to_string(d.n);
  case Operation::kSkipKeyPressed:
    return "SKP " + vx;
  case Operation::kSkipKeyNotPressed:
    return "SKNP " + vx;
  case Operation::kLoadDelayTimer:
    return "LD " + vx + ", DT";
  case Operation::kWaitKey:
    return "LD " + vx + ", K";
  case Operation::kSetDelayTimer:
    return "LD DT, " + vx;
  case Operation::kSetSoundTimer:
    return "LD ST, " + vx;
  case Operation::kAddIndex:
    return "ADD I, " + vx;
  case Operation::kLoadFontGlyph:
    return "LD F, " + vx;
  case Operation::kStoreBcd:
    return "LD B, " + vx;
  case Operation::kStoreRegisters:
    return "LD [I], " + vx;
  case Operation::kLoadRegisters:
    return "LD " + vx + ", [I]";
  case Operation::kInvalid:
    break;
  }
  return "??? " + Hex(instruction, 4);
}
