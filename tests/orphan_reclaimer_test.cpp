// airbeacon headers
#include "core/orphan_reclaimer.hpp"

// Test helpers
#include "TempDir.hpp"

// GTest headers
#include <gtest/gtest.h>

namespace airbeacon::test {

  using airbeacon::core::OrphanReclaimer;
  using airbeacon::core::ReclaimResult;

  TEST(OrphanReclaimerTest, deletesExistingFile) {
    TempDir dir;
    auto path = dir.write("state.ble", { 0x58, 0x1B, 0x01, 0x00, 0x00, 0x00 });

    OrphanReclaimer reclaimer;
    EXPECT_EQ(reclaimer.reclaim(path), ReclaimResult::DELETED);
    EXPECT_FALSE(std::filesystem::exists(path));
  }

  TEST(OrphanReclaimerTest, missingFileCountsAsAlreadyReclaimed) {
    TempDir dir;

    OrphanReclaimer reclaimer;
    EXPECT_EQ(reclaimer.reclaim(dir.file("never-written.ble")), ReclaimResult::ALREADY_GONE);
  }

  TEST(OrphanReclaimerTest, permissionDeniedLeavesFileAndDoesNotThrow) {
    TempDir dir;
    auto path = dir.write("state.ble", { 0x58, 0x1B, 0x01, 0x00, 0x00, 0x00 });

    OrphanReclaimer reclaimer([](const std::filesystem::path&, std::error_code& ec) {
      ec = std::make_error_code(std::errc::permission_denied);
      return false;
    });

    ReclaimResult result = ReclaimResult::DELETED;
    EXPECT_NO_THROW(result = reclaimer.reclaim(path));
    EXPECT_EQ(result, ReclaimResult::PERMISSION_DENIED);
    EXPECT_TRUE(std::filesystem::exists(path));
  }

  TEST(OrphanReclaimerTest, removeReportingNoSuchFileIsAlreadyGone) {
    OrphanReclaimer reclaimer([](const std::filesystem::path&, std::error_code& ec) {
      ec = std::make_error_code(std::errc::no_such_file_or_directory);
      return false;
    });

    EXPECT_EQ(reclaimer.reclaim("/nonexistent/state.ble"), ReclaimResult::ALREADY_GONE);
  }

  TEST(OrphanReclaimerTest, otherErrorsAreReportedAsFailed) {
    OrphanReclaimer reclaimer([](const std::filesystem::path&, std::error_code& ec) {
      ec = std::make_error_code(std::errc::io_error);
      return false;
    });

    EXPECT_EQ(reclaimer.reclaim("/tmp/state.ble"), ReclaimResult::FAILED);
  }

} // namespace airbeacon::test
