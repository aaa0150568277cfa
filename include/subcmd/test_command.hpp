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
 * @file test_command.hpp
 * @brief TestCommand - Command that replays canned output instead of
 *        running anything.
 *
 * Usage:
 * @code
 *   subcmd::TestCommand cmd;
 *   cmd.stdout_data = "hello";
 *   cmd.wait_error = subcmd::ProcessError::kExitFailure;
 *   RunTool(cmd);   // code under test only sees subcmd::Command&
 * @endcode
 *
 * Unlike LocalProcess, TestProcess::Wait() returns only after both
 * streams have been written and closed.
 */

#ifndef SUBCMD_TEST_COMMAND_HPP_
#define SUBCMD_TEST_COMMAND_HPP_

#include "subcmd/broadcaster.hpp"
#include "subcmd/command.hpp"
#include "subcmd/log.hpp"
#include "subcmd/stream.hpp"
#include "subcmd/vocabulary.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace subcmd {

// ============================================================================
// TestProcess
// ============================================================================

class TestProcess final : public Process {
 public:
  TestProcess(std::string stdout_data, std::string stderr_data,
              optional<ProcessError> start_error, optional<ProcessError> wait_error,
              optional<ProcessError> kill_error)
      : stdout_data_(std::move(stdout_data)),
        stderr_data_(std::move(stderr_data)),
        start_error_(start_error),
        wait_error_(wait_error),
        kill_error_(kill_error) {}

  ~TestProcess() override { JoinWriters(); }

  TestProcess(const TestProcess&) = delete;
  TestProcess& operator=(const TestProcess&) = delete;

  void AppendArgs(const std::vector<std::string>&) override {}

  void SetInput(Reader* input) override { input_ = input; }

  void RegisterOutput(Writer* sink) override { stdout_.Register(sink); }

  void RegisterError(Writer* sink) override { stderr_.Register(sink); }

  expected<void, ProcessError> Start() override {
    if (start_error_.has_value()) {
      return expected<void, ProcessError>::error(start_error_.value());
    }
    std::lock_guard<std::mutex> lock(gate_mutex_);
    if (stdout_writer_.joinable() || stderr_writer_.joinable()) {
      return expected<void, ProcessError>::error(ProcessError::kAlreadyStarted);
    }
    stdout_writer_ = std::thread(&TestProcess::Replay, std::ref(stdout_), std::cref(stdout_data_));
    stderr_writer_ = std::thread(&TestProcess::Replay, std::ref(stderr_), std::cref(stderr_data_));
    return expected<void, ProcessError>::success();
  }

  expected<void, ProcessError> Wait() override {
    JoinWriters();
    if (wait_error_.has_value()) {
      return expected<void, ProcessError>::error(wait_error_.value());
    }
    return expected<void, ProcessError>::success();
  }

  expected<void, ProcessError> WaitAndDrain() override { return Wait(); }

  expected<void, ProcessError> Kill() override {
    if (kill_error_.has_value()) {
      return expected<void, ProcessError>::error(kill_error_.value());
    }
    return expected<void, ProcessError>::success();
  }

  std::string ToString() const override { return std::string(); }

  int Pid() const override { return -1; }

  /// @brief The stdin source last given to SetInput(). Never read.
  Reader* Input() const noexcept { return input_; }

 private:
  static void Replay(Broadcaster& target, const std::string& data) {
    if (!data.empty()) {
      auto w = target.Write(data.data(), data.size());
      if (!w.has_value()) {
        SUBCMD_LOG_DEBUG("TestProcess", "replay write: %s", StreamErrorToString(w.get_error()));
      }
    }
    auto c = target.Close();
    if (!c.has_value()) {
      SUBCMD_LOG_DEBUG("TestProcess", "replay close: %s", StreamErrorToString(c.get_error()));
    }
  }

  void JoinWriters() {
    std::lock_guard<std::mutex> lock(gate_mutex_);
    if (stdout_writer_.joinable()) {
      stdout_writer_.join();
    }
    if (stderr_writer_.joinable()) {
      stderr_writer_.join();
    }
  }

  Broadcaster stdout_;
  Broadcaster stderr_;
  const std::string stdout_data_;
  const std::string stderr_data_;
  const optional<ProcessError> start_error_;
  const optional<ProcessError> wait_error_;
  const optional<ProcessError> kill_error_;
  Reader* input_ = nullptr;

  std::mutex gate_mutex_;  ///< Completion gate: guards the writer threads
  std::thread stdout_writer_;
  std::thread stderr_writer_;
};

// ============================================================================
// TestCommand
// ============================================================================

/**
 * @brief Command double configured by plain fields. Each NewProcess()
 *        snapshots the current field values.
 */
class TestCommand final : public Command {
 public:
  std::string stdout_data;               ///< Written to every stdout sink
  std::string stderr_data;               ///< Written to every stderr sink
  optional<ProcessError> start_error;    ///< Returned by Start()
  optional<ProcessError> wait_error;     ///< Returned by Wait()
  optional<ProcessError> kill_error;     ///< Returned by Kill()

  /// @brief Always empty; a test command has no executable.
  std::string Path() const override { return std::string(); }

  void SetPath(const std::string&) override {}

  std::unique_ptr<Process> NewProcess() const override {
    return std::make_unique<TestProcess>(stdout_data, stderr_data, start_error, wait_error,
                                         kill_error);
  }
};

}  // namespace subcmd

#endif  // SUBCMD_TEST_COMMAND_HPP_
