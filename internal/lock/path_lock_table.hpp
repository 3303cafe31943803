#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace alerts::lock {

/*
  Per-record locks with bounded acquisition.

  Keyed by the state-independent record key (bucket/slug), so a move and
  an append on the same record serialize. Inside one process a timed
  mutex per key; across processes sharing an alerts root an advisory
  flock on the record directory itself (no lock files in the tree).

  Acquisition past the timeout throws util::LockTimeout.
*/
class PathLockTable {
 public:
  class Guard {
   public:
    Guard() = default;
    Guard(Guard&& other) noexcept;
    Guard& operator=(Guard&& other) noexcept;
    ~Guard();

    Guard(const Guard&)            = delete;
    Guard& operator=(const Guard&) = delete;

    void Release();

   private:
    friend class PathLockTable;

    PathLockTable*                    table_ = nullptr;
    std::string                       key_;
    std::shared_ptr<std::timed_mutex> mutex_;
    int                               fd_ = -1;
  };

  explicit PathLockTable(std::chrono::milliseconds timeout);

  // directory may be empty or missing; then only the in-process lock is held.
  Guard Acquire(const std::string& key, const std::filesystem::path& directory = {});

  std::chrono::milliseconds Timeout() const {
    return timeout_;
  }

  std::size_t Size() const;

 private:
  std::shared_ptr<std::timed_mutex> KeyMutex(const std::string& key);
  void                              Prune(const std::string& key, std::shared_ptr<std::timed_mutex> mutex);

  const std::chrono::milliseconds timeout_;

  mutable std::mutex                                                 guard_;
  std::unordered_map<std::string, std::shared_ptr<std::timed_mutex>> mutexes_;
};

} // namespace alerts::lock
