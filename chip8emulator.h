#ifndef CHIP8EMULATOR_H
#define CHIP8EMULATOR_H

#include <array>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "clock-regulator.h"
#include "emulator-options.h"
#include "interpreter.h"
#include "screen.h"

// The SDL frontend. Owns the interpreter and drives it from the window's
// event loop: instructions at the configured CPU rate, timers at 60 Hz.
class Chip8Emulator {
public:
  static constexpr int kPixelScale = 10;
  static constexpr int kStatusBarHeight = 30;
  static constexpr int kTimerHz = 60;
  static constexpr int kCpuHzStep = 100;

  explicit Chip8Emulator(EmulatorOptions options)
      : options_(std::move(options)), interpreter_(options_.quirks),
        screen_("Chip 8 Emulator", Interpreter::kDisplayWidth * kPixelScale,
                Interpreter::kDisplayHeight * kPixelScale + kStatusBarHeight,
                /* font_size = */ 18),
        cpu_regulator_(options_.cpu_hz), timer_regulator_(kTimerHz) {
    // Chip8 key codes range from 0x0 to 0xF (0-15). The hex keypad
    //   1 2 3 C
    //   4 5 6 D
    //   7 8 9 E
    //   A 0 B F
    // is laid over the left hand side of a qwerty keyboard. This mapping
    // stores the corresponding SDL scancode for each Chip8 code.
    const std::array<SDL_Scancode, Interpreter::kKeyCount> key_mapping = {
        SDL_SCANCODE_X, // 0
        SDL_SCANCODE_1, // 1
        SDL_SCANCODE_2, // 2
        SDL_SCANCODE_3, // 3
        SDL_SCANCODE_Q, // 4
        SDL_SCANCODE_W, // 5
        SDL_SCANCODE_E, // 6
        SDL_SCANCODE_A, // 7
        SDL_SCANCODE_S, // 8
        SDL_SCANCODE_D, // 9
        SDL_SCANCODE_Z, // A
        SDL_SCANCODE_C, // B
        SDL_SCANCODE_4, // C
        SDL_SCANCODE_R, // D
        SDL_SCANCODE_F, // E
        SDL_SCANCODE_V, // F
    };
    for (int key = 0; key < Interpreter::kKeyCount; ++key) {
      screen_.OnKeyDown(key_mapping[key],
                        [this, key] { interpreter_.SetKeyValue(key, true); });
      screen_.OnKeyUp(key_mapping[key],
                      [this, key] { interpreter_.SetKeyValue(key, false); });
    }

    screen_.OnKeyDown(SDL_SCANCODE_P, [this] { TogglePause(); });
    screen_.OnKeyDown(SDL_SCANCODE_ESCAPE, [this] { screen_.RequestClose(); });
    screen_.OnKeyDown(SDL_SCANCODE_EQUALS,
                      [this] { ChangeCpuRate(kCpuHzStep); });
    screen_.OnKeyDown(SDL_SCANCODE_MINUS,
                      [this] { ChangeCpuRate(-kCpuHzStep); });
    screen_.OnKeyDown(SDL_SCANCODE_BACKSPACE, [this] { LoadRom(); });

    // Quirks can be flipped while a ROM runs. They apply from the next step.
    screen_.OnKeyDown(SDL_SCANCODE_F1,
                      [this] { ToggleQuirk(Quirk::kShiftUsesVy); });
    screen_.OnKeyDown(SDL_SCANCODE_F2,
                      [this] { ToggleQuirk(Quirk::kJumpUsesVx); });
    screen_.OnKeyDown(SDL_SCANCODE_F3,
                      [this] { ToggleQuirk(Quirk::kStoreLoadIncrementsI); });
  }

  // Prints the args to std::cout if DEBUG is defined with some common stream
  // manipulations that aid in debugging hex values.
  template <typename Arg, typename... Args>
  void Debug(Arg&& arg, Args&&... args) {
#ifdef DEBUG
    std::cout << std::hex << std::setfill('0') << std::setw(4)
              << std::forward<Arg>(arg);
    ((std::cout << std::forward<Args>(args)), ...);
    std::cout << std::dec << std::endl;
#endif
  }

  // Loads the ROM and runs it until the window is closed. Returns the process
  // exit code.
  int BlockingExecute() {
    if (!screen_.ok()) {
      std::cerr << "Could not open window: " << screen_.error() << std::endl;
      return 1;
    }
    if (!LoadRom()) {
      return 1;
    }

    while (screen_.PollEvent()) {
      if (timer_regulator_.Tick()) {
        interpreter_.TickTimers();
      }

      // Regulate program speed to prevent the game from running too fast.
      if (!paused_ && cpu_regulator_.Tick()) {
        StepInterpreter();
      }

      // There's no synthesizer, the terminal bell rings each time the sound
      // timer gets armed.
      if (interpreter_.sound_timer() > 0 && !beeping_) {
        std::cout << "\a" << std::flush;
      }
      beeping_ = interpreter_.sound_timer() > 0;

      if (interpreter_.ConsumeDrawFlag() || status_changed_) {
        Render();
      }
    }
    return 0;
  }

private:
  bool LoadRom() {
    auto status = interpreter_.LoadRom(options_.rom_path);
    if (status != RomStatus::kSuccess) {
      std::cerr << "Could not load " << options_.rom_path << ": "
                << ToString(status) << std::endl;
      SetStatus(ToString(status));
      return false;
    }
    paused_ = false;
    SetStatus("Now running " + options_.rom_path);
    return true;
  }

  void StepInterpreter() {
    const auto pc = interpreter_.pc();
    auto result = interpreter_.Step();
#ifdef DEBUG
    Debug(pc, ": ", Disassemble(result.opcode));
#endif
    if (result.ok()) {
      return;
    }

    // A faulty ROM is paused rather than killed so it can be looked at.
    std::ostringstream message;
    message << ToString(result.status) << " at 0x" << std::hex
            << std::uppercase << std::setfill('0') << std::setw(4) << pc;
    if (result.status == StepStatus::kInvalidOpcode) {
      message << " (" << Disassemble(result.opcode) << ")";
    }
    std::cerr << message.str() << std::endl;
    paused_ = true;
    SetStatus(message.str());
  }

  void TogglePause() {
    if (!interpreter_.is_running()) {
      return;
    }
    paused_ = !paused_;
    SetStatus(paused_ ? "Paused." : "Now running " + options_.rom_path);
  }

  void ChangeCpuRate(int delta) {
    auto hz = cpu_regulator_.frequency() + delta;
    if (hz < EmulatorOptions::kMinCpuHz || hz > EmulatorOptions::kMaxCpuHz) {
      return;
    }
    cpu_regulator_.SetFrequency(hz);
    status_changed_ = true;
  }

  void ToggleQuirk(Quirk quirk) {
    const bool enabled = interpreter_.ToggleQuirk(quirk);
    SetStatus(std::string(ToString(quirk)) + (enabled ? ": on" : ": off"));
  }

  void SetStatus(std::string status) {
    status_ = std::move(status);
    status_changed_ = true;
  }

  void Render() {
    // Generate a vector of all the filled rectangles that need to be drawn.
    std::vector<SDL_Rect> rects_to_draw;
    const auto& graphics = interpreter_.graphics();
    for (int row = 0; row < Interpreter::kDisplayHeight; ++row) {
      for (int col = 0; col < Interpreter::kDisplayWidth; ++col) {
        if (graphics[row * Interpreter::kDisplayWidth + col]) {
          SDL_Rect r;
          r.x = col * kPixelScale;
          r.y = row * kPixelScale;
          r.w = kPixelScale;
          r.h = kPixelScale;
          rects_to_draw.push_back(r);
        }
      }
    }

    SDL_Rect status_bar;
    status_bar.x = 0;
    status_bar.y = Interpreter::kDisplayHeight * kPixelScale;
    status_bar.w = screen_.width();
    status_bar.h = kStatusBarHeight;

    // Update the screen.
    screen_.Clear(Color::Black());
    screen_.DrawRects(rects_to_draw, Color::White());
    screen_.DrawRects({status_bar}, Color::Gray());
    auto text_rect = screen_.DrawText(status_, 6, status_bar.y + 4,
                                      Color::White());
    screen_.DrawText(std::to_string(cpu_regulator_.frequency()) + " Hz",
                     text_rect.x + text_rect.w + 16, status_bar.y + 4,
                     Color::White());
    screen_.Update();
    status_changed_ = false;
  }

  EmulatorOptions options_;
  Interpreter interpreter_;
  Screen screen_;
  ClockRegulator cpu_regulator_;
  ClockRegulator timer_regulator_;
  std::string status_;
  bool status_changed_ = true;
  bool paused_ = false;
  bool beeping_ = false;
};

#endif /* CHIP8EMULATOR_H */
