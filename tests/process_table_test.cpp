// airbeacon headers
#include "core/process_table.hpp"

// Test helpers
#include "FakeProcessTable.hpp"
#include "TempDir.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <fstream>
#include <sys/wait.h>
#include <unistd.h>

namespace airbeacon::test {

  using airbeacon::core::LinuxProcessTable;

  namespace {
    std::string own_comm() {
      std::ifstream comm("/proc/self/comm");
      std::string name;
      std::getline(comm, name);
      return name;
    }
  } // namespace

  TEST(LinuxProcessTableTest, currentProcessIsAliveAndMatchesItsOwnName) {
    LinuxProcessTable table;
    uint32_t self = static_cast<uint32_t>(getpid());
    std::string comm = own_comm();
    ASSERT_FALSE(comm.empty());

    EXPECT_TRUE(table.is_alive(self));
    ASSERT_TRUE(table.process_name(self).has_value());
    EXPECT_TRUE(table.name_matches(self, comm));
    EXPECT_TRUE(table.name_matches(self, comm.substr(0, 3)));
    EXPECT_FALSE(table.name_matches(self, comm + "-with-suffix-nobody-uses"));
    EXPECT_FALSE(table.name_matches(self, "zz-not-this-process"));
  }

  TEST(LinuxProcessTableTest, reapedChildIsNotAlive) {
    pid_t child = fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
      _exit(0);
    }
    int status = 0;
    ASSERT_EQ(waitpid(child, &status, 0), child);

    LinuxProcessTable table;
    EXPECT_FALSE(table.is_alive(static_cast<uint32_t>(child)));
    EXPECT_FALSE(table.process_name(static_cast<uint32_t>(child)).has_value());
    EXPECT_FALSE(table.name_matches(static_cast<uint32_t>(child), ""));
  }

  TEST(LinuxProcessTableTest, pidZeroIsNeverAlive) {
    LinuxProcessTable table;
    EXPECT_FALSE(table.is_alive(0));
    EXPECT_FALSE(table.is_alive(0xFFFFFFFFu));
  }

  TEST(LinuxProcessTableTest, truncatedCommIsExtendedFromCmdline) {
    TempDir proc;
    uint32_t self = static_cast<uint32_t>(getpid());
    std::filesystem::create_directories(proc.file(std::to_string(self)));

    proc.write_text(std::to_string(self) + "/comm", "airplay-server-\n");
    std::string cmdline("/usr/bin/airplay-server-long\0--port\0007000", 40);
    proc.write_text(std::to_string(self) + "/cmdline", cmdline);

    LinuxProcessTable table(proc.file("").string());
    auto name = table.process_name(self);
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(*name, "airplay-server-long");
    EXPECT_TRUE(table.name_matches(self, "airplay-server-long"));
  }

  TEST(LinuxProcessTableTest, shortCommIsUsedAsIs) {
    TempDir proc;
    uint32_t self = static_cast<uint32_t>(getpid());
    std::filesystem::create_directories(proc.file(std::to_string(self)));
    proc.write_text(std::to_string(self) + "/comm", "airplayd\n");

    LinuxProcessTable table(proc.file("").string());
    EXPECT_EQ(table.process_name(self).value_or(""), "airplayd");
  }

  TEST(ProcessTableTest, nameMatchesIsPrefixNotEquality) {
    FakeProcessTable table;
    table.add(42, "airplayd.bin");

    EXPECT_TRUE(table.name_matches(42, "airplayd"));
    EXPECT_TRUE(table.name_matches(42, "airplayd.bin"));
    EXPECT_FALSE(table.name_matches(42, "airplayd.bin.old"));
    EXPECT_FALSE(table.name_matches(42, "other"));
  }

  TEST(ProcessTableTest, vanishedProcessNeverMatches) {
    FakeProcessTable table;
    table.add(42, "airplayd");
    table.kill(42);

    EXPECT_FALSE(table.name_matches(42, "airplayd"));
    EXPECT_FALSE(table.name_matches(42, ""));
  }

} // namespace airbeacon::test
