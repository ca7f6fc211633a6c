#include "chip8emulator.h"

int main(int argc, char** argv) {
  std::string error;
  auto options =
      ParseArguments(std::vector<std::string>(argv + 1, argv + argc), &error);
  if (!options) {
    std::cout << error << std::endl;
    std::cout << Usage(argv[0]) << std::endl;
    return 1;
  }
  Chip8Emulator emulator(std::move(*options));
  return emulator.BlockingExecute();
}
