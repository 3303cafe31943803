#include "path_lock_table.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

#include "internal/util/errors.hpp"

namespace alerts::lock {

namespace {

constexpr auto kFlockPollInterval = std::chrono::milliseconds(5);

void CloseFd(int fd) {
  if (fd >= 0) {
    flock(fd, LOCK_UN);
    close(fd);
  }
}

} // namespace

PathLockTable::Guard::Guard(Guard&& other) noexcept
    : table_(other.table_), key_(std::move(other.key_)), mutex_(std::move(other.mutex_)), fd_(other.fd_) {
  other.table_ = nullptr;
  other.fd_    = -1;
}

PathLockTable::Guard& PathLockTable::Guard::operator=(Guard&& other) noexcept {
  if (this != &other) {
    Release();
    table_       = other.table_;
    key_         = std::move(other.key_);
    mutex_       = std::move(other.mutex_);
    fd_          = other.fd_;
    other.table_ = nullptr;
    other.fd_    = -1;
  }
  return *this;
}

PathLockTable::Guard::~Guard() {
  Release();
}

void PathLockTable::Guard::Release() {
  CloseFd(fd_);
  fd_ = -1;

  if (mutex_) {
    mutex_->unlock();
    if (table_) table_->Prune(key_, std::move(mutex_));
    mutex_.reset();
  }
  table_ = nullptr;
}

PathLockTable::PathLockTable(std::chrono::milliseconds timeout) : timeout_(timeout) {
}

std::shared_ptr<std::timed_mutex> PathLockTable::KeyMutex(const std::string& key) {
  std::lock_guard lock(guard_);
  auto&           key_mutex = mutexes_[key];
  if (!key_mutex) {
    key_mutex = std::make_shared<std::timed_mutex>();
  }
  return key_mutex;
}

void PathLockTable::Prune(const std::string& key, std::shared_ptr<std::timed_mutex> mutex) {
  std::lock_guard lock(guard_);
  auto            it = mutexes_.find(key);
  // map + the releasing guard hold the only references
  if (it != mutexes_.end() && it->second == mutex && mutex.use_count() == 2) {
    mutexes_.erase(it);
  }
}

std::size_t PathLockTable::Size() const {
  std::lock_guard lock(guard_);
  return mutexes_.size();
}

PathLockTable::Guard PathLockTable::Acquire(const std::string& key, const std::filesystem::path& directory) {
  const auto deadline = std::chrono::steady_clock::now() + timeout_;

  auto key_mutex = KeyMutex(key);
  if (!key_mutex->try_lock_until(deadline)) {
    throw alerts::util::LockTimeout("timed out waiting for record lock: " + key);
  }

  Guard guard;
  guard.table_ = this;
  guard.key_   = key;
  guard.mutex_ = std::move(key_mutex);

  if (directory.empty()) {
    return guard;
  }

  const int fd = open(directory.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) {
    // not created yet, or moved away; callers re-check existence under the lock
    return guard;
  }
  guard.fd_ = fd;

  while (flock(fd, LOCK_EX | LOCK_NB) != 0) {
    const int e = errno;
    if (e != EWOULDBLOCK && e != EINTR) {
      throw alerts::util::IOError("flock failed for " + directory.string() + ": " + std::strerror(e));
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      throw alerts::util::LockTimeout("timed out waiting for record directory lock: " + directory.string());
    }
    std::this_thread::sleep_for(kFlockPollInterval);
  }

  return guard;
}

} // namespace alerts::lock
