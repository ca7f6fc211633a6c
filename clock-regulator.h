#ifndef CLOCK_REGULATOR_H
#define CLOCK_REGULATOR_H

#include <chrono>

// A class which helps regulate CPU/timer clocks. The `Tick` method will return
// true at most `cycles_per_second` times per second. `Tick` should be called
// first/early in your main program loop. E.g.
//
// void MainLoop() {
//   while (true) {
//     if (cpu_regulator.Tick()) {
//       interpreter.Step();
//     }
//     if (timer_regulator.Tick()) {
//       interpreter.TickTimers();
//     }
//   }
// }
class ClockRegulator {
public:
  using Clock = std::chrono::steady_clock;

  explicit ClockRegulator(int cycles_per_second) : ready_at_(Clock::now()) {
    SetFrequency(cycles_per_second);
  }

  bool Tick() { return TickAt(Clock::now()); }

  // Same as `Tick` with an explicit notion of "now".
  bool TickAt(Clock::time_point now) {
    // If enough time has elapsed since the previous tick, update the next tick
    // to happen in one period. Ticks that were missed by a wide margin are
    // dropped instead of being replayed in a burst.
    if (now < ready_at_) {
      return false;
    }
    ready_at_ += period_;
    if (ready_at_ < now) {
      ready_at_ = now + period_;
    }
    return true;
  }

  // Non positive frequencies are treated as 1 Hz.
  void SetFrequency(int cycles_per_second) {
    cycles_per_second_ = cycles_per_second > 0 ? cycles_per_second : 1;
    period_ = std::chrono::duration_cast<Clock::duration>(
        std::chrono::nanoseconds(1000000000LL / cycles_per_second_));
  }

  int frequency() const { return cycles_per_second_; }

private:
  int cycles_per_second_ = 1;
  Clock::duration period_{};
  Clock::time_point ready_at_;
};

#endif /* CLOCK_REGULATOR_H */
