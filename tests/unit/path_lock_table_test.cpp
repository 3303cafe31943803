#include "internal/lock/path_lock_table.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using alerts::lock::PathLockTable;
using namespace std::chrono_literals;

std::filesystem::path FreshDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "alerts_path_lock_table_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

void TestAcquireTimesOutWhileHeld() {
  PathLockTable table(50ms);
  auto          held = table.Acquire("38.7_-9.1/2025-12-14_15-32_x");

  bool timed_out = false;
  std::thread other([&] {
    try {
      auto guard = table.Acquire("38.7_-9.1/2025-12-14_15-32_x");
    } catch (const alerts::util::LockTimeout&) {
      timed_out = true;
    }
  });
  other.join();

  assert(timed_out);
}

void TestDifferentKeysDoNotBlock() {
  PathLockTable table(50ms);
  auto          a = table.Acquire("a/one");
  auto          b = table.Acquire("a/two");
  assert(table.Size() == 2);
}

void TestReleaseAllowsNextHolderAndPrunes() {
  PathLockTable table(1s);
  {
    auto guard = table.Acquire("key");
    assert(table.Size() == 1);
  }
  assert(table.Size() == 0);

  auto again = table.Acquire("key");
  again.Release();
  assert(table.Size() == 0);
}

void TestLockTimeoutIsRetryable() {
  PathLockTable table(10ms);
  auto          held = table.Acquire("key");

  bool retryable = false;
  std::thread other([&] {
    try {
      (void)table.Acquire("key");
    } catch (const alerts::util::RetryableError&) {
      retryable = true;
    }
  });
  other.join();
  assert(retryable);
}

void TestMutualExclusionUnderContention() {
  PathLockTable    table(5s);
  int              counter = 0;
  std::atomic<int> inside{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 200; ++i) {
        auto guard = table.Acquire("shared");
        assert(inside.fetch_add(1) == 0);
        ++counter;
        inside.fetch_sub(1);
      }
    });
  }
  for (auto& thread : threads) thread.join();

  assert(counter == 8 * 200);
  assert(table.Size() == 0);
}

void TestDirectoryLockHeldByAnotherDescriptorTimesOut() {
  const auto dir = FreshDir("flock");

  // a separate open file description behaves like another process
  const int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  assert(fd >= 0);
  assert(flock(fd, LOCK_EX) == 0);

  PathLockTable table(50ms);
  bool          timed_out = false;
  try {
    (void)table.Acquire("key", dir);
  } catch (const alerts::util::LockTimeout&) {
    timed_out = true;
  }
  assert(timed_out);
  assert(table.Size() == 0);

  flock(fd, LOCK_UN);
  auto guard = table.Acquire("key", dir);
  close(fd);
}

void TestMissingDirectoryFallsBackToProcessLock() {
  PathLockTable table(50ms);
  auto guard = table.Acquire("key", std::filesystem::temp_directory_path() / "alerts_path_lock_table_tests" / "does-not-exist");
  assert(table.Size() == 1);
}

} // namespace

int main() {
  TestAcquireTimesOutWhileHeld();
  TestDifferentKeysDoNotBlock();
  TestReleaseAllowsNextHolderAndPrunes();
  TestLockTimeoutIsRetryable();
  TestMutualExclusionUnderContention();
  TestDirectoryLockHeldByAnotherDescriptorTimesOut();
  TestMissingDirectoryFallsBackToProcessLock();

  std::cout << "alerts_unit_path_lock_table: pass\n";
  return 0;
}
