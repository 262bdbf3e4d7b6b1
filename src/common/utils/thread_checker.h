#pragma once

#include <cassert>
#include <thread>

namespace blobxfer::utils {

/**
 * Records the thread that constructed it and asserts, in debug builds, that
 * later check() calls come from that same thread.
 *
 * TransferEngine keeps one of these: its tables are owned by the thread that
 * drives update() and must not be touched from anywhere else.
 *
 * In release builds (NDEBUG defined) every operation is a no-op.
 */
class ThreadChecker {
 public:
#ifndef NDEBUG
  ThreadChecker() noexcept : owner_thread_id_(std::this_thread::get_id()) {}

  ThreadChecker(ThreadChecker&& other) noexcept : owner_thread_id_(other.owner_thread_id_) {
    other.detach();
  }

  ThreadChecker& operator=(ThreadChecker&& other) noexcept {
    if (this != &other) {
      owner_thread_id_ = other.owner_thread_id_;
      other.detach();
    }
    return *this;
  }

  ThreadChecker(const ThreadChecker&) = delete;
  ThreadChecker& operator=(const ThreadChecker&) = delete;

  void check() const noexcept {
    assert(is_owner_thread() && "ThreadChecker: called from wrong thread!");
  }

  // A detached checker accepts any thread.
  [[nodiscard]] bool is_owner_thread() const noexcept {
    return owner_thread_id_ == std::thread::id{} ||
           std::this_thread::get_id() == owner_thread_id_;
  }

  void detach() noexcept { owner_thread_id_ = std::thread::id{}; }

  // Hand ownership to the calling thread, e.g. after constructing the engine
  // on one thread and driving it from another.
  void rebind_to_current() noexcept { owner_thread_id_ = std::this_thread::get_id(); }

 private:
  std::thread::id owner_thread_id_;

#else  // NDEBUG

 public:
  ThreadChecker() noexcept = default;
  ThreadChecker(ThreadChecker&&) noexcept = default;
  ThreadChecker& operator=(ThreadChecker&&) noexcept = default;
  ThreadChecker(const ThreadChecker&) = delete;
  ThreadChecker& operator=(const ThreadChecker&) = delete;

  void check() const noexcept {}
  [[nodiscard]] static constexpr bool is_owner_thread() noexcept { return true; }
  void detach() noexcept {}
  void rebind_to_current() noexcept {}

#endif  // NDEBUG
};

}  // namespace blobxfer::utils

// BLOBXFER_THREAD_CHECKER(name) declares the member (debug builds only).
// BLOBXFER_DCHECK_THREAD(checker) asserts the calling thread owns it.
#ifndef NDEBUG
#define BLOBXFER_THREAD_CHECKER(name) ::blobxfer::utils::ThreadChecker name
#define BLOBXFER_DCHECK_THREAD(checker) (checker).check()
#else
#define BLOBXFER_THREAD_CHECKER(name) static_assert(true, "")
#define BLOBXFER_DCHECK_THREAD(checker) ((void)0)
#endif
