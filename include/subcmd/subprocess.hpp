/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file subprocess.hpp
 * @brief Linux child process primitive: pipe acquisition, spawn, wait, kill.
 *
 * Subprocess is the only place that touches fork/exec/waitpid/kill.
 * Streams are acquired before Start():
 *
 *   StdoutPipe() / StderrPipe()  -> read end handed to the caller
 *   SetInput(reader)             -> stdin pipe fed by a feeder thread
 *   (not requested)              -> /dev/null
 *
 * Exec failures are reported synchronously by Start() through a
 * close-on-exec status pipe carrying the child's errno.
 *
 * Wait() observes exit with waitid(WNOWAIT) and reaps under the same lock
 * Kill() takes, so Kill() from another thread never signals a recycled pid.
 */

#ifndef SUBCMD_SUBPROCESS_HPP_
#define SUBCMD_SUBPROCESS_HPP_

#include "subcmd/log.hpp"
#include "subcmd/platform.hpp"
#include "subcmd/stream.hpp"
#include "subcmd/vocabulary.hpp"

#include <cstdint>

namespace subcmd {

// ============================================================================
// ProcessError
// ============================================================================

enum class ProcessError : uint8_t {
  kPipeFailed = 0,   ///< Could not create a stdio pipe
  kSpawnFailed,      ///< fork(2) or exec failed
  kExitFailure,      ///< Child exited with a nonzero code
  kSignaled,         ///< Child was terminated by a signal
  kWaitFailed,       ///< waitid(2)/waitpid(2) error
  kKillFailed,       ///< kill(2) error
  kNotStarted,       ///< Operation requires a started process
  kAlreadyStarted,   ///< Operation only valid before Start()
  kAlreadyFinished,  ///< Child already reaped, or Wait() already called
  kDrainFailed,      ///< An output drain ended on a stream error
};

inline constexpr const char* ProcessErrorToString(ProcessError e) noexcept {
  switch (e) {
    case ProcessError::kPipeFailed:
      return "pipe failed";
    case ProcessError::kSpawnFailed:
      return "spawn failed";
    case ProcessError::kExitFailure:
      return "exit failure";
    case ProcessError::kSignaled:
      return "terminated by signal";
    case ProcessError::kWaitFailed:
      return "wait failed";
    case ProcessError::kKillFailed:
      return "kill failed";
    case ProcessError::kNotStarted:
      return "not started";
    case ProcessError::kAlreadyStarted:
      return "already started";
    case ProcessError::kAlreadyFinished:
      return "already finished";
    case ProcessError::kDrainFailed:
      return "drain failed";
  }
  return "unknown";
}

}  // namespace subcmd

#if defined(SUBCMD_PLATFORM_LINUX)

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <pthread.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

namespace subcmd {

/// @brief Exit status of a reaped child.
struct WaitResult {
  bool exited;      ///< true if child exited normally
  int exit_code;    ///< Exit code (valid if exited==true)
  bool signaled;    ///< true if child was killed by signal
  int term_signal;  ///< Signal number (valid if signaled==true)

  WaitResult() : exited(false), exit_code(-1), signaled(false), term_signal(0) {}
};

/// @brief pipe2(2)-compatible pipe constructor.
using PipeFn = int (*)(int fds[2], int flags);

namespace detail {

inline int DefaultPipe(int fds[2], int flags) { return ::pipe2(fds, flags); }

// ============================================================================
// PipeGuard - RAII wrapper for pipe file descriptors
// ============================================================================

class PipeGuard {
 public:
  PipeGuard() : fd_{-1, -1} {}
  ~PipeGuard() { CloseAll(); }

  /// @brief Create a close-on-exec pipe. Returns false on failure.
  bool Create(PipeFn fn = &DefaultPipe) { return fn(fd_, O_CLOEXEC) == 0; }

  int ReadEnd() const { return fd_[0]; }
  int WriteEnd() const { return fd_[1]; }

  void CloseRead() {
    if (fd_[0] >= 0) {
      ::close(fd_[0]);  // NOLINT
      fd_[0] = -1;
    }
  }
  void CloseWrite() {
    if (fd_[1] >= 0) {
      ::close(fd_[1]);  // NOLINT
      fd_[1] = -1;
    }
  }
  void CloseAll() {
    CloseRead();
    CloseWrite();
  }

  /// @brief Release read-end ownership (caller takes responsibility).
  int ReleaseRead() {
    int r = fd_[0];
    fd_[0] = -1;
    return r;
  }
  /// @brief Release write-end ownership.
  int ReleaseWrite() {
    int r = fd_[1];
    fd_[1] = -1;
    return r;
  }

  PipeGuard(const PipeGuard&) = delete;
  PipeGuard& operator=(const PipeGuard&) = delete;

 private:
  int fd_[2];
};

/// @brief Owning descriptor slot, closed on destruction or Reset().
class FdGuard {
 public:
  explicit FdGuard(int fd = -1) : fd_(fd) {}
  ~FdGuard() { Reset(); }

  int get() const { return fd_; }
  int Release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
  }
  void Reset(int fd = -1) {
    if (fd_ >= 0) {
      ::close(fd_);  // NOLINT
    }
    fd_ = fd;
  }

  FdGuard(const FdGuard&) = delete;
  FdGuard& operator=(const FdGuard&) = delete;

 private:
  int fd_;
};

inline int OpenDevNull(int flags) {
  return ::open("/dev/null", flags | O_CLOEXEC);  // NOLINT
}

inline void FillWaitResult(int status, WaitResult& wr) {
  if (WIFEXITED(status)) {
    wr.exited = true;
    wr.exit_code = WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    wr.signaled = true;
    wr.term_signal = WTERMSIG(status);
  }
}

/**
 * @brief Copy @p input into the child's stdin, then close it.
 *
 * SIGPIPE is blocked on this thread; a child that exits without reading
 * its input turns the write into EPIPE, which ends the copy quietly.
 */
inline void FeedInput(Reader* input, int fd) {
  sigset_t pipe_set;
  sigemptyset(&pipe_set);
  sigaddset(&pipe_set, SIGPIPE);
  pthread_sigmask(SIG_BLOCK, &pipe_set, nullptr);

  FdWriter sink(fd);
  char buf[4096];
  bool broken_pipe = false;
  for (;;) {
    auto rd = input->Read(buf, sizeof(buf));
    if (!rd.has_value()) {
      SUBCMD_LOG_WARN("Process", "stdin source: %s", StreamErrorToString(rd.get_error()));
      break;
    }
    if (rd.value() == 0U) break;
    auto wr = sink.Write(buf, rd.value());
    if (!wr.has_value()) {
      broken_pipe = (errno == EPIPE);
      if (!broken_pipe) {
        SUBCMD_LOG_WARN("Process", "stdin write: %s", std::strerror(errno));
      }
      break;
    }
  }

  auto closed = sink.Close();
  if (!closed.has_value()) {
    SUBCMD_LOG_WARN("Process", "stdin close: %s", StreamErrorToString(closed.get_error()));
  }

  if (broken_pipe) {
    // Consume the SIGPIPE left pending on this thread by the failed write.
    struct timespec zero = {0, 0};
    (void)sigtimedwait(&pipe_set, nullptr, &zero);
  }
}

}  // namespace detail

// ============================================================================
// Subprocess
// ============================================================================

/**
 * @brief One child process, modelled after a command description that is
 *        filled in before Start() and then run exactly once.
 *
 * Usage:
 * @code
 *   subcmd::Subprocess proc("/bin/echo", {"hello"});
 *   auto out = proc.StdoutPipe();          // read end, caller owns it
 *   if (out && proc.Start()) {
 *     subcmd::FdReader reader(out.value());
 *     ...
 *     auto status = proc.Wait();
 *   }
 * @endcode
 *
 * Destruction kills and reaps a child that was started but not waited for.
 */
class Subprocess {
 public:
  Subprocess(std::string path, std::vector<std::string> args)
      : path_(std::move(path)), args_(std::move(args)) {}

  ~Subprocess() {
    bool reap = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (pid_ > 0 && !finished_) {
        ::kill(pid_, SIGKILL);
        reap = true;
      }
    }
    if (reap) {
      int status;
      while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
      }
    }
    if (feeder_.joinable()) {
      feeder_.join();
    }
  }

  // Non-copyable, non-movable
  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;
  Subprocess(Subprocess&&) = delete;
  Subprocess& operator=(Subprocess&&) = delete;

  const std::string& Path() const { return path_; }

  /// @brief Arguments after argv[0]. Only meaningful before Start().
  std::vector<std::string>& Args() { return args_; }
  const std::vector<std::string>& Args() const { return args_; }

  /// @brief Stdin source, read by a feeder thread once the child runs.
  void SetInput(Reader* input) { input_ = input; }

  /// @brief Constructor used by StdoutPipe() and StderrPipe().
  void SetPipeFunction(PipeFn fn) { pipe_fn_ = (fn != nullptr) ? fn : &detail::DefaultPipe; }

  /**
   * @brief Create the stdout pipe.
   * @return Read end (caller owns it), kAlreadyStarted, or kPipeFailed.
   */
  expected<int, ProcessError> StdoutPipe() { return MakeOutputPipe(stdout_child_); }

  /// @brief Create the stderr pipe. Same contract as StdoutPipe().
  expected<int, ProcessError> StderrPipe() { return MakeOutputPipe(stderr_child_); }

  /**
   * @brief Fork and exec. Returns as soon as exec succeeded.
   *
   * Whatever happens, the child ends of the stdout/stderr pipes are closed
   * in the parent afterwards, so readers of those pipes see end of stream
   * once the child (if any) is gone.
   *
   * @return kAlreadyStarted, kPipeFailed (stdin/devnull setup), or
   *         kSpawnFailed (fork error, or exec error reported by the child).
   */
  expected<void, ProcessError> Start() {
    if (started_.load(std::memory_order_acquire)) {
      return expected<void, ProcessError>::error(ProcessError::kAlreadyStarted);
    }

    detail::FdGuard out_child(stdout_child_.Release());
    detail::FdGuard err_child(stderr_child_.Release());

    detail::PipeGuard stdin_pipe;
    detail::FdGuard null_in;
    detail::FdGuard null_out;
    if (input_ != nullptr) {
      if (!stdin_pipe.Create()) {
        return expected<void, ProcessError>::error(ProcessError::kPipeFailed);
      }
    } else {
      null_in.Reset(detail::OpenDevNull(O_RDONLY));
      if (null_in.get() < 0) {
        return expected<void, ProcessError>::error(ProcessError::kPipeFailed);
      }
    }
    if (out_child.get() < 0 || err_child.get() < 0) {
      null_out.Reset(detail::OpenDevNull(O_WRONLY));
      if (null_out.get() < 0) {
        return expected<void, ProcessError>::error(ProcessError::kPipeFailed);
      }
    }

    detail::PipeGuard status_pipe;
    if (!status_pipe.Create()) {
      return expected<void, ProcessError>::error(ProcessError::kPipeFailed);
    }

    // Everything the child needs is prepared before fork(); the child only
    // makes async-signal-safe calls.
    std::vector<char*> argv;
    argv.reserve(args_.size() + 2U);
    argv.push_back(const_cast<char*>(path_.c_str()));
    for (auto& a : args_) {
      argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);

    const int child_in = (input_ != nullptr) ? stdin_pipe.ReadEnd() : null_in.get();
    const int child_out = (out_child.get() >= 0) ? out_child.get() : null_out.get();
    const int child_err = (err_child.get() >= 0) ? err_child.get() : null_out.get();

    pid_t child = ::fork();
    if (child < 0) {
      SUBCMD_LOG_ERROR("Process", "fork failed: %s", std::strerror(errno));
      return expected<void, ProcessError>::error(ProcessError::kSpawnFailed);
    }

    if (child == 0) {
      // -- Child process --
      // Reset all signal dispositions and the mask (SIG_IGN survives exec)
      struct sigaction sa_dfl;
      std::memset(&sa_dfl, 0, sizeof(sa_dfl));
      sa_dfl.sa_handler = SIG_DFL;
      for (int sig = 1; sig < 32; ++sig) {
        sigaction(sig, &sa_dfl, nullptr);  // ignore errors for uncatchable
      }
      sigset_t empty;
      sigemptyset(&empty);
      sigprocmask(SIG_SETMASK, &empty, nullptr);

      if (::dup2(child_in, STDIN_FILENO) < 0 || ::dup2(child_out, STDOUT_FILENO) < 0 ||
          ::dup2(child_err, STDERR_FILENO) < 0) {
        ReportExecErrno(status_pipe.WriteEnd());
      }

      ::execvp(argv[0], argv.data());
      ReportExecErrno(status_pipe.WriteEnd());
    }

    // -- Parent process --
    status_pipe.CloseWrite();
    stdin_pipe.CloseRead();
    out_child.Reset();
    err_child.Reset();

    int child_errno = 0;
    ssize_t n;
    do {
      n = ::read(status_pipe.ReadEnd(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n > 0) {
      // Exec failed; the status pipe was not closed by a successful exec.
      int status;
      while (::waitpid(child, &status, 0) < 0 && errno == EINTR) {
      }
      SUBCMD_LOG_DEBUG("Process", "exec %s failed: %s", path_.c_str(),
                       std::strerror(child_errno));
      return expected<void, ProcessError>::error(ProcessError::kSpawnFailed);
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      pid_ = child;
    }
    started_.store(true, std::memory_order_release);
    SUBCMD_LOG_DEBUG("Process", "spawned %s pid %d", path_.c_str(), static_cast<int>(child));

    if (input_ != nullptr) {
      feeder_ = std::thread(&detail::FeedInput, input_, stdin_pipe.ReleaseWrite());
    }
    return expected<void, ProcessError>::success();
  }

  /**
   * @brief Block until the child exits, then reap it.
   *
   * Also joins the stdin feeder thread.
   *
   * @return success for exit code 0; kExitFailure, kSignaled, kNotStarted,
   *         kAlreadyFinished (second call) or kWaitFailed otherwise.
   */
  expected<void, ProcessError> Wait() {
    if (!started_.load(std::memory_order_acquire)) {
      return expected<void, ProcessError>::error(ProcessError::kNotStarted);
    }
    if (waited_.exchange(true, std::memory_order_acq_rel)) {
      return expected<void, ProcessError>::error(ProcessError::kAlreadyFinished);
    }

    pid_t pid;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      pid = pid_;
    }

    // Wait for exit without reaping: the pid stays valid for Kill().
    siginfo_t info;
    int rc;
    do {
      std::memset(&info, 0, sizeof(info));
      rc = ::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT);
    } while (rc < 0 && errno == EINTR);
    if (rc < 0) {
      SUBCMD_LOG_ERROR("Process", "waitid pid %d: %s", static_cast<int>(pid),
                       std::strerror(errno));
      return expected<void, ProcessError>::error(ProcessError::kWaitFailed);
    }

    WaitResult wr;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      int status = 0;
      pid_t w;
      do {
        w = ::waitpid(pid, &status, 0);
      } while (w < 0 && errno == EINTR);
      finished_ = true;
      pid_ = -1;
      if (w < 0) {
        return expected<void, ProcessError>::error(ProcessError::kWaitFailed);
      }
      detail::FillWaitResult(status, wr);
      result_ = wr;
    }

    if (feeder_.joinable()) {
      feeder_.join();
    }

    if (wr.signaled) {
      return expected<void, ProcessError>::error(ProcessError::kSignaled);
    }
    if (!wr.exited || wr.exit_code != 0) {
      return expected<void, ProcessError>::error(ProcessError::kExitFailure);
    }
    return expected<void, ProcessError>::success();
  }

  /**
   * @brief Send SIGKILL to the child.
   * @return kNotStarted, kAlreadyFinished once reaped, kKillFailed if kill(2)
   *         fails, success otherwise.
   */
  expected<void, ProcessError> Kill() {
    if (!started_.load(std::memory_order_acquire)) {
      return expected<void, ProcessError>::error(ProcessError::kNotStarted);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_) {
      return expected<void, ProcessError>::error(ProcessError::kAlreadyFinished);
    }
    if (::kill(pid_, SIGKILL) != 0) {
      return expected<void, ProcessError>::error(ProcessError::kKillFailed);
    }
    return expected<void, ProcessError>::success();
  }

  /// @brief Child PID (-1 if not started or already reaped).
  pid_t GetPid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pid_;
  }

  bool IsStarted() const { return started_.load(std::memory_order_acquire); }

  /// @brief Started and not yet reaped.
  bool IsRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pid_ > 0 && !finished_;
  }

  /// @brief Exit status recorded by the last successful reap.
  WaitResult LastWaitResult() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return result_;
  }

 private:
  expected<int, ProcessError> MakeOutputPipe(detail::FdGuard& slot) {
    if (started_.load(std::memory_order_acquire)) {
      return expected<int, ProcessError>::error(ProcessError::kAlreadyStarted);
    }
    detail::PipeGuard p;
    if (!p.Create(pipe_fn_)) {
      return expected<int, ProcessError>::error(ProcessError::kPipeFailed);
    }
    slot.Reset(p.ReleaseWrite());
    return expected<int, ProcessError>::success(p.ReleaseRead());
  }

  /// @brief Child side: ship errno to the parent and exit. Never returns.
  [[noreturn]] static void ReportExecErrno(int fd) {
    int err = errno;
    ssize_t n = ::write(fd, &err, sizeof(err));
    (void)n;
    ::_exit(127);
  }

  std::string path_;
  std::vector<std::string> args_;
  Reader* input_ = nullptr;
  PipeFn pipe_fn_ = &detail::DefaultPipe;

  detail::FdGuard stdout_child_;  ///< Child end of the stdout pipe until Start()
  detail::FdGuard stderr_child_;

  mutable std::mutex mutex_;  ///< Guards pid_, finished_, result_
  pid_t pid_ = -1;
  bool finished_ = false;
  WaitResult result_;

  std::atomic<bool> started_{false};
  std::atomic<bool> waited_{false};
  std::thread feeder_;
};

}  // namespace subcmd

#endif  // defined(SUBCMD_PLATFORM_LINUX)

#endif  // SUBCMD_SUBPROCESS_HPP_
