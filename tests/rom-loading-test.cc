#include "interpreter.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

namespace fs = std::filesystem;

class RomLoadingTest : public ::testing::Test {
protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    directory_ = fs::temp_directory_path() /
                 (std::string("chip8vm-") + info->test_suite_name() + "-" +
                  info->name());
    fs::create_directories(directory_);
  }

  void TearDown() override {
    std::error_code ignored;
    fs::remove_all(directory_, ignored);
  }

  std::string WriteRom(const std::string& name,
                       const std::vector<uint8_t>& bytes) {
    const auto path = directory_ / name;
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    return path.string();
  }

  static std::vector<uint8_t> Pattern(std::size_t size) {
    std::vector<uint8_t> bytes(size);
    for (std::size_t i = 0; i < size; ++i) {
      bytes[i] = static_cast<uint8_t>(i * 7 + 3);
    }
    return bytes;
  }

  fs::path directory_;
  Interpreter interpreter_;
};

TEST_F(RomLoadingTest, MissingFile) {
  EXPECT_EQ(interpreter_.LoadRom((directory_ / "missing.ch8").string()),
            RomStatus::kRomNotFound);
  EXPECT_FALSE(interpreter_.is_running());
}

TEST_F(RomLoadingTest, EmptyPath) {
  EXPECT_EQ(interpreter_.LoadRom(std::string()), RomStatus::kRomNotFound);
}

TEST_F(RomLoadingTest, DirectoryIsNotARom) {
  EXPECT_EQ(interpreter_.LoadRom(directory_.string()),
            RomStatus::kRomNotFound);
}

TEST_F(RomLoadingTest, LargestRomFits) {
  const auto rom = Pattern(Interpreter::kMaxRomSize);
  ASSERT_EQ(interpreter_.LoadRom(WriteRom("max.ch8", rom)),
            RomStatus::kSuccess);

  EXPECT_TRUE(interpreter_.is_running());
  EXPECT_EQ(interpreter_.pc(), 0x200);
  for (std::size_t i = 0; i < rom.size(); ++i) {
    ASSERT_EQ(interpreter_.ReadMemory(0x200 + static_cast<int>(i)), rom[i])
        << i;
  }
}

TEST_F(RomLoadingTest, OneByteTooManyIsRejected) {
  const auto path = WriteRom("big.ch8", Pattern(Interpreter::kMaxRomSize + 1));
  EXPECT_EQ(interpreter_.LoadRom(path), RomStatus::kRomExceedsMemory);
  EXPECT_FALSE(interpreter_.is_running());
  EXPECT_EQ(interpreter_.ReadMemory(0x200), 0);
}

TEST_F(RomLoadingTest, InMemoryRomHasTheSameLimit) {
  EXPECT_EQ(interpreter_.LoadRom(Pattern(Interpreter::kMaxRomSize + 1)),
            RomStatus::kRomExceedsMemory);
  EXPECT_FALSE(interpreter_.is_running());
  EXPECT_EQ(interpreter_.LoadRom(Pattern(16)), RomStatus::kSuccess);
  EXPECT_TRUE(interpreter_.is_running());
}

TEST_F(RomLoadingTest, EmptyFileLoads) {
  EXPECT_EQ(interpreter_.LoadRom(WriteRom("empty.ch8", {})),
            RomStatus::kSuccess);
  EXPECT_TRUE(interpreter_.is_running());
  EXPECT_EQ(interpreter_.ReadMemory(0x200), 0);
}

TEST_F(RomLoadingTest, FailedLoadKeepsRunningProgram) {
  // LD V0, 0x42 ; JP 0x202
  ASSERT_EQ(interpreter_.LoadRom(
                WriteRom("good.ch8", {0x60, 0x42, 0x12, 0x02})),
            RomStatus::kSuccess);
  ASSERT_TRUE(interpreter_.Step().ok());

  const auto path = WriteRom("big.ch8", Pattern(Interpreter::kMaxRomSize + 1));
  EXPECT_EQ(interpreter_.LoadRom(path), RomStatus::kRomExceedsMemory);
  EXPECT_TRUE(interpreter_.is_running());
  EXPECT_EQ(interpreter_.pc(), 0x202);
  EXPECT_EQ(interpreter_.registers()[0], 0x42);
  EXPECT_EQ(interpreter_.ReadMemory(0x200), 0x60);
}

TEST_F(RomLoadingTest, ReloadStartsFromScratch) {
  // LD V0, 0x42 ; LD DT, V0 ; CALL 0x200
  const auto path = WriteRom("prog.ch8", {0x60, 0x42, 0xF0, 0x15, 0x22, 0x00});
  ASSERT_EQ(interpreter_.LoadRom(path), RomStatus::kSuccess);
  for (int i = 0; i < 3; ++i) {
    ASSERT_TRUE(interpreter_.Step().ok());
  }
  interpreter_.SetKeyValue(4, true);

  const auto shorter = WriteRom("short.ch8", {0x00, 0xE0});
  ASSERT_EQ(interpreter_.LoadRom(shorter), RomStatus::kSuccess);
  EXPECT_EQ(interpreter_.pc(), 0x200);
  EXPECT_EQ(interpreter_.registers()[0], 0);
  EXPECT_EQ(interpreter_.delay_timer(), 0);
  EXPECT_EQ(interpreter_.stack_depth(), 0u);
  EXPECT_FALSE(interpreter_.GetKeyValue(4));
  // Nothing of the previous program survives past the new one.
  EXPECT_EQ(interpreter_.ReadMemory(0x202), 0);
  EXPECT_EQ(interpreter_.ReadMemory(0x204), 0);
}

TEST_F(RomLoadingTest, UnreadableFileFailsToOpen) {
  // A running program must survive the failed load.
  ASSERT_EQ(interpreter_.LoadRom(std::vector<uint8_t>{0x60, 0x2A}),
            RomStatus::kSuccess);
  const auto path = WriteRom("locked.ch8", {0x00, 0xE0});
  fs::permissions(path, fs::perms::none);
  if (std::ifstream(path)) {
    GTEST_SKIP() << "file permissions are not enforced for this user";
  }

  EXPECT_EQ(interpreter_.LoadRom(path), RomStatus::kRomOpenFailed);
  EXPECT_TRUE(interpreter_.is_running());
  EXPECT_EQ(interpreter_.ReadMemory(Interpreter::kProgramStart), 0x60);
}

TEST_F(RomLoadingTest, StatusesHaveText) {
  EXPECT_STREQ(ToString(RomStatus::kRomOpenFailed),
               "ROM file could not be opened");
  EXPECT_STREQ(ToString(RomStatus::kRomReadFailed),
               "ROM file could not be read");
  EXPECT_STREQ(ToString(RomStatus::kRomExceedsMemory),
               "ROM file is larger than 3584 bytes");
  EXPECT_STREQ(ToString(StepStatus::kInvalidOpcode), "invalid opcode");
}

} // namespace
