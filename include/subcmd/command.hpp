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
 * @file command.hpp
 * @brief Command templates and the processes they manufacture.
 *
 * A Command is an executable path plus base arguments. NewProcess()
 * returns an independent, not-yet-running Process:
 *
 *   Command --NewProcess()--> Process --Start()--> stderr drain thread
 *                                               +-> stdout drain thread
 *
 * Each drain thread copies one pipe into a Broadcaster until end of
 * stream, then closes the Broadcaster (and through it, closable sinks).
 *
 * Usage:
 * @code
 *   auto cmd = subcmd::NewCommand("/bin/ls", "-l");
 *   auto proc = cmd->NewProcess();
 *   proc->AppendArgs({"/tmp"});
 *   subcmd::BufferWriter out;
 *   proc->RegisterOutput(&out);
 *   if (proc->Start()) {
 *     auto r = proc->WaitAndDrain();
 *   }
 * @endcode
 *
 * Process and Command are capability interfaces shared with the test
 * double in test_command.hpp, so callers can be unit-tested without
 * spawning anything.
 */

#ifndef SUBCMD_COMMAND_HPP_
#define SUBCMD_COMMAND_HPP_

#include "subcmd/broadcaster.hpp"
#include "subcmd/log.hpp"
#include "subcmd/platform.hpp"
#include "subcmd/stream.hpp"
#include "subcmd/subprocess.hpp"
#include "subcmd/vocabulary.hpp"

#include <cerrno>
#include <cstring>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace subcmd {

// ============================================================================
// Process - capability interface
// ============================================================================

/**
 * @brief One instance of a command. Not running until Start(), single use.
 *
 * Sinks and the input source are borrowed and must outlive the process.
 */
class Process {
 public:
  virtual ~Process() = default;

  /// @brief Append instance-specific arguments. Only effective before Start().
  virtual void AppendArgs(const std::vector<std::string>& args) = 0;

  /// @brief Set the stdin source. Last call wins.
  virtual void SetInput(Reader* input) = 0;

  /// @brief Add a stdout sink. Every sink receives all stdout bytes written
  ///        after its registration.
  virtual void RegisterOutput(Writer* sink) = 0;

  /// @brief Add a stderr sink.
  virtual void RegisterError(Writer* sink) = 0;

  /// @brief Start the process and return immediately.
  virtual expected<void, ProcessError> Start() = 0;

  /**
   * @brief Block until the process has exited.
   *
   * @note Output still buffered in the pipes may reach the sinks after
   *       Wait() returns. Use WaitAndDrain() to also wait for the drains.
   */
  virtual expected<void, ProcessError> Wait() = 0;

  /**
   * @brief Wait(), then block until both drains finished and closed.
   *
   * @note A drain ends when every holder of the pipe's write end is gone.
   *       A background grandchild that inherited stdout or stderr keeps
   *       this call blocked until it exits or closes the stream.
   */
  virtual expected<void, ProcessError> WaitAndDrain() = 0;

  /// @brief Best-effort kill. May be called while another thread waits.
  virtual expected<void, ProcessError> Kill() = 0;

  /// @brief Printable command line.
  virtual std::string ToString() const = 0;

  /// @brief OS process id, -1 when there is none.
  virtual int Pid() const = 0;
};

// ============================================================================
// Command - capability interface
// ============================================================================

class Command {
 public:
  virtual ~Command() = default;

  /// @brief Executable path (argv[0]).
  virtual std::string Path() const = 0;

  /// @brief Replace the executable path. Not validated here; a bad path
  ///        makes Start() fail with kSpawnFailed.
  virtual void SetPath(const std::string& path) = 0;

  /// @brief Manufacture a new, not started process.
  virtual std::unique_ptr<Process> NewProcess() const = 0;
};

namespace detail {

/// @brief Quote an argument for display if it contains whitespace.
inline std::string QuoteArg(const std::string& arg) {
  if (arg.find_first_of(" \t\n\r") == std::string::npos) {
    return arg;
  }
  std::string quoted;
  quoted.reserve(arg.size() + 2U);
  quoted.push_back('"');
  for (char c : arg) {
    switch (c) {
      case '"':
        quoted += "\\\"";
        break;
      case '\\':
        quoted += "\\\\";
        break;
      case '\t':
        quoted += "\\t";
        break;
      case '\n':
        quoted += "\\n";
        break;
      case '\r':
        quoted += "\\r";
        break;
      default:
        quoted.push_back(c);
        break;
    }
  }
  quoted.push_back('"');
  return quoted;
}

}  // namespace detail

#if defined(SUBCMD_PLATFORM_LINUX)

// ============================================================================
// LocalProcess - Process backed by a real child process
// ============================================================================

class LocalProcess final : public Process {
 public:
  LocalProcess(const std::string& path, const std::vector<std::string>& base_args)
      : subprocess_(path, base_args) {
    if (!wake_.Create()) {
      SUBCMD_LOG_WARN("Process", "wake pipe for %s: %s, drains not cancellable",
                      path.c_str(), std::strerror(errno));
    }
  }

  /**
   * Kills a child that is still running, then cancels and joins the drain
   * threads. Output not yet drained is discarded, and a grandchild still
   * holding a pipe does not delay destruction.
   */
  ~LocalProcess() override {
    if (subprocess_.IsRunning()) {
      auto killed = subprocess_.Kill();
      if (!killed.has_value()) {
        SUBCMD_LOG_DEBUG("Process", "kill on destroy: %s",
                         ProcessErrorToString(killed.get_error()));
      }
      auto waited = subprocess_.Wait();
      if (!waited.has_value()) {
        SUBCMD_LOG_DEBUG("Process", "wait on destroy: %s",
                         ProcessErrorToString(waited.get_error()));
      }
    }
    CancelDrains();
    JoinDrains();
  }

  LocalProcess(const LocalProcess&) = delete;
  LocalProcess& operator=(const LocalProcess&) = delete;

  void AppendArgs(const std::vector<std::string>& args) override {
    extra_args_.insert(extra_args_.end(), args.begin(), args.end());
  }

  void SetInput(Reader* input) override { subprocess_.SetInput(input); }

  void RegisterOutput(Writer* sink) override { stdout_.Register(sink); }

  void RegisterError(Writer* sink) override { stderr_.Register(sink); }

  /// @brief Replace the constructor of the stdout/stderr pipes.
  void SetPipeFunction(PipeFn fn) { subprocess_.SetPipeFunction(fn); }

  /**
   * @brief Finalize the argument list, start the drains, then spawn.
   *
   * A stderr pipe failure aborts before spawning. A stdout pipe failure
   * does not: the child is spawned with stdout on /dev/null and no stdout
   * drain runs. This asymmetry is part of the contract.
   */
  expected<void, ProcessError> Start() override {
    std::vector<std::string>& args = subprocess_.Args();
    args.insert(args.end(), extra_args_.begin(), extra_args_.end());
    extra_args_.clear();

    auto err_pipe = subprocess_.StderrPipe();
    if (!err_pipe.has_value()) {
      return expected<void, ProcessError>::error(err_pipe.get_error());
    }
    // Drains of an earlier failed spawn already saw end of stream.
    JoinDrains();
    stderr_drain_ = std::thread(&LocalProcess::Drain, this, std::ref(stderr_), err_pipe.value(),
                                "stderr");

    auto out_pipe = subprocess_.StdoutPipe();
    if (out_pipe.has_value()) {
      stdout_drain_ = std::thread(&LocalProcess::Drain, this, std::ref(stdout_),
                                  out_pipe.value(), "stdout");
    } else {
      SUBCMD_LOG_WARN("Process", "stdout pipe for %s: %s, output discarded",
                      subprocess_.Path().c_str(), ProcessErrorToString(out_pipe.get_error()));
    }

    auto started = subprocess_.Start();
    if (!started.has_value()) {
      SUBCMD_LOG_DEBUG("Process", "start %s: %s", subprocess_.Path().c_str(),
                       ProcessErrorToString(started.get_error()));
    }
    return started;
  }

  expected<void, ProcessError> Wait() override {
    auto r = subprocess_.Wait();
    if (!r.has_value()) {
      SUBCMD_LOG_DEBUG("Process", "%s: %s", subprocess_.Path().c_str(),
                       ProcessErrorToString(r.get_error()));
    }
    return r;
  }

  expected<void, ProcessError> WaitAndDrain() override {
    auto r = Wait();
    JoinDrains();
    if (!r.has_value()) {
      return r;
    }
    std::lock_guard<std::mutex> lock(drain_mutex_);
    if (drain_error_.has_value()) {
      return expected<void, ProcessError>::error(ProcessError::kDrainFailed);
    }
    return r;
  }

  expected<void, ProcessError> Kill() override { return subprocess_.Kill(); }

  std::string ToString() const override {
    std::string line = detail::QuoteArg(subprocess_.Path());
    for (const auto& a : subprocess_.Args()) {
      line.push_back(' ');
      line += detail::QuoteArg(a);
    }
    for (const auto& a : extra_args_) {
      line.push_back(' ');
      line += detail::QuoteArg(a);
    }
    return line;
  }

  int Pid() const override { return static_cast<int>(subprocess_.GetPid()); }

  /// @brief Exit status of the reaped child.
  WaitResult LastWaitResult() const { return subprocess_.LastWaitResult(); }

 private:
  void Drain(Broadcaster& target, int fd, const char* name) {
    FdReader pipe(fd, /*owned=*/true, wake_.ReadEnd());
    auto r = target.Copy(pipe);
    if (!r.has_value()) {
      SUBCMD_LOG_WARN("Process", "%s drain: %s", name, StreamErrorToString(r.get_error()));
      std::lock_guard<std::mutex> lock(drain_mutex_);
      if (!drain_error_.has_value()) {
        drain_error_ = r.get_error();
      }
    }
  }

  void CancelDrains() {
    if (wake_.WriteEnd() < 0) return;
    const char token = 'x';
    ssize_t n;
    do {
      n = ::write(wake_.WriteEnd(), &token, 1);
    } while (n < 0 && errno == EINTR);
    if (n < 0) {
      SUBCMD_LOG_WARN("Process", "drain cancel: %s", std::strerror(errno));
    }
  }

  void JoinDrains() {
    std::lock_guard<std::mutex> lock(join_mutex_);
    if (stderr_drain_.joinable()) {
      stderr_drain_.join();
    }
    if (stdout_drain_.joinable()) {
      stdout_drain_.join();
    }
  }

  // The broadcasters are declared first so they outlive the drain threads.
  Broadcaster stdout_;
  Broadcaster stderr_;
  Subprocess subprocess_;
  std::vector<std::string> extra_args_;
  detail::PipeGuard wake_;  ///< Readable once the drains must stop

  std::mutex drain_mutex_;  ///< Guards drain_error_
  optional<StreamError> drain_error_;
  std::mutex join_mutex_;
  std::thread stdout_drain_;
  std::thread stderr_drain_;
};

// ============================================================================
// LocalCommand
// ============================================================================

class LocalCommand final : public Command {
 public:
  LocalCommand(std::string path, std::vector<std::string> args)
      : path_(std::move(path)), args_(std::move(args)) {}

  std::string Path() const override { return path_; }
  void SetPath(const std::string& path) override { path_ = path; }

  std::unique_ptr<Process> NewProcess() const override {
    return std::make_unique<LocalProcess>(path_, args_);
  }

  const std::vector<std::string>& BaseArgs() const noexcept { return args_; }

 private:
  std::string path_;
  const std::vector<std::string> args_;
};

// ============================================================================
// Factory
// ============================================================================

/**
 * @brief Create a command. @p args are given to every process it creates,
 *        ahead of any per-process AppendArgs().
 */
inline std::unique_ptr<Command> NewCommand(std::string path, std::vector<std::string> args) {
  return std::make_unique<LocalCommand>(std::move(path), std::move(args));
}

/// @brief Variadic form: NewCommand("/bin/sh", "-c", "echo hi").
template <typename... Args>
inline std::unique_ptr<Command> NewCommand(std::string path, Args&&... args) {
  return NewCommand(std::move(path), std::vector<std::string>{std::string(std::forward<Args>(args))...});
}

#endif  // defined(SUBCMD_PLATFORM_LINUX)

}  // namespace subcmd

#endif  // SUBCMD_COMMAND_HPP_
