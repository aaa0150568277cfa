/**
 * @file test_command.cpp
 * @brief Tests for command.hpp
 */

#include "subcmd/command.hpp"

#include <signal.h>
#include <unistd.h>

#include <catch2/catch_test_macros.hpp>
#include <cerrno>
#include <chrono>
#include <string>
#include <vector>

// ============================================================================
// Helpers
// ============================================================================

/// Poll until the sink is closed by its drain, or ~2s elapsed.
static bool WaitClosed(const subcmd::BufferWriter& sink) {
  for (int i = 0; i < 200; ++i) {
    if (sink.IsClosed()) return true;
    usleep(10000);
  }
  return sink.IsClosed();
}

/// Sink without a closing capability.
class CountingWriter final : public subcmd::Writer {
 public:
  subcmd::expected<size_t, subcmd::StreamError> Write(const void*, size_t size) override {
    bytes += size;
    return subcmd::expected<size_t, subcmd::StreamError>::success(size);
  }
  size_t bytes = 0;
};

/// Sink that rejects everything.
class RejectingWriter final : public subcmd::Writer {
 public:
  subcmd::expected<size_t, subcmd::StreamError> Write(const void*, size_t) override {
    return subcmd::expected<size_t, subcmd::StreamError>::error(
        subcmd::StreamError::kWriteFailed);
  }
};

/// Pipe constructor that always fails.
static int FailEveryPipe(int*, int) {
  errno = EMFILE;
  return -1;
}

static int g_pipe_calls = 0;

/// Pipe constructor that fails only its second call (the stdout pipe).
static int FailSecondPipe(int* fds, int flags) {
  if (++g_pipe_calls == 2) {
    errno = EMFILE;
    return -1;
  }
  return ::pipe2(fds, flags);
}

// ============================================================================
// Factory
// ============================================================================

TEST_CASE("NewCommand stores path and base args", "[command]") {
  auto cmd = subcmd::NewCommand("/bin/echo", std::vector<std::string>{"a", "b"});
  REQUIRE(cmd->Path() == "/bin/echo");

  cmd->SetPath("/usr/bin/env");
  REQUIRE(cmd->Path() == "/usr/bin/env");
}

TEST_CASE("NewCommand variadic form", "[command]") {
  auto cmd = subcmd::NewCommand("/bin/sh", "-c", "echo hi");
  auto* local = static_cast<subcmd::LocalCommand*>(cmd.get());
  REQUIRE(local->BaseArgs() == std::vector<std::string>{"-c", "echo hi"});

  auto bare = subcmd::NewCommand("/bin/true");
  REQUIRE(static_cast<subcmd::LocalCommand*>(bare.get())->BaseArgs().empty());
}

TEST_CASE("QuoteArg quotes only whitespace arguments", "[command]") {
  REQUIRE(subcmd::detail::QuoteArg("plain") == "plain");
  REQUIRE(subcmd::detail::QuoteArg("two words") == "\"two words\"");
  REQUIRE(subcmd::detail::QuoteArg("tab\there") == "\"tab\\there\"");
  REQUIRE(subcmd::detail::QuoteArg("say \"hi\" now") == "\"say \\\"hi\\\" now\"");
  REQUIRE(subcmd::detail::QuoteArg("") == "");
}

TEST_CASE("Process ToString shows base then appended args", "[command]") {
  auto cmd = subcmd::NewCommand("/bin/echo", "hello world");
  auto proc = cmd->NewProcess();
  proc->AppendArgs({"x", "y z"});
  REQUIRE(proc->ToString() == "/bin/echo \"hello world\" x \"y z\"");
  REQUIRE(proc->Pid() == -1);
}

TEST_CASE("Processes from one command are independent", "[command]") {
  auto cmd = subcmd::NewCommand("/bin/echo", "base");
  auto p1 = cmd->NewProcess();
  auto p2 = cmd->NewProcess();
  p1->AppendArgs({"one"});
  REQUIRE(p1->ToString() == "/bin/echo base one");
  REQUIRE(p2->ToString() == "/bin/echo base");
}

// ============================================================================
// Running processes
// ============================================================================

TEST_CASE("LocalProcess streams stdout and stderr to all sinks", "[command]") {
  auto cmd = subcmd::NewCommand("/bin/sh", "-c", "printf hello; printf world >&2");
  auto proc = cmd->NewProcess();

  subcmd::BufferWriter out1;
  subcmd::BufferWriter out2;
  subcmd::BufferWriter err1;
  subcmd::BufferWriter err2;
  proc->RegisterOutput(&out1);
  proc->RegisterOutput(&out2);
  proc->RegisterError(&err1);
  proc->RegisterError(&err2);

  REQUIRE(proc->Start().has_value());
  REQUIRE(proc->WaitAndDrain().has_value());

  REQUIRE(out1.Contents() == "hello");
  REQUIRE(out2.Contents() == "hello");
  REQUIRE(err1.Contents() == "world");
  REQUIRE(err2.Contents() == "world");
  REQUIRE(out1.IsClosed());
  REQUIRE(err2.IsClosed());
}

TEST_CASE("LocalProcess Wait then drains complete eventually", "[command]") {
  auto cmd = subcmd::NewCommand("/bin/sh", "-c", "echo out; echo err >&2");
  auto proc = cmd->NewProcess();
  subcmd::BufferWriter out;
  subcmd::BufferWriter err;
  proc->RegisterOutput(&out);
  proc->RegisterError(&err);

  REQUIRE(proc->Start().has_value());
  REQUIRE(proc->Wait().has_value());

  REQUIRE(WaitClosed(out));
  REQUIRE(WaitClosed(err));
  REQUIRE(out.Contents() == "out\n");
  REQUIRE(err.Contents() == "err\n");
}

TEST_CASE("LocalProcess passes base args before appended args", "[command]") {
  auto cmd = subcmd::NewCommand("/bin/echo", "a", "b");
  auto proc = cmd->NewProcess();
  proc->AppendArgs({"c"});
  proc->AppendArgs({"d", "e"});
  subcmd::BufferWriter out;
  proc->RegisterOutput(&out);

  REQUIRE(proc->Start().has_value());
  REQUIRE(proc->WaitAndDrain().has_value());
  REQUIRE(out.Contents() == "a b c d e\n");
}

TEST_CASE("LocalProcess without sinks still runs", "[command]") {
  auto cmd = subcmd::NewCommand("/bin/sh", "-c", "echo dropped; echo dropped >&2");
  auto proc = cmd->NewProcess();
  REQUIRE(proc->Start().has_value());
  REQUIRE(proc->WaitAndDrain().has_value());
}

TEST_CASE("LocalProcess non-closable sink receives output", "[command]") {
  auto cmd = subcmd::NewCommand("/bin/echo", "12345");
  auto proc = cmd->NewProcess();
  CountingWriter counter;
  proc->RegisterOutput(&counter);
  REQUIRE(proc->Start().has_value());
  REQUIRE(proc->WaitAndDrain().has_value());
  REQUIRE(counter.bytes == 6U);
}

TEST_CASE("LocalProcess feeds stdin", "[command]") {
  auto cmd = subcmd::NewCommand("cat");
  auto proc = cmd->NewProcess();
  subcmd::StringReader input("piped input");
  subcmd::BufferWriter out;
  proc->SetInput(&input);
  proc->RegisterOutput(&out);

  REQUIRE(proc->Start().has_value());
  REQUIRE(proc->WaitAndDrain().has_value());
  REQUIRE(out.Contents() == "piped input");
}

TEST_CASE("LocalProcess last SetInput wins", "[command]") {
  auto cmd = subcmd::NewCommand("cat");
  auto proc = cmd->NewProcess();
  subcmd::StringReader first("first");
  subcmd::StringReader second("second");
  subcmd::BufferWriter out;
  proc->SetInput(&first);
  proc->SetInput(&second);
  proc->RegisterOutput(&out);

  REQUIRE(proc->Start().has_value());
  REQUIRE(proc->WaitAndDrain().has_value());
  REQUIRE(out.Contents() == "second");
}

// ============================================================================
// Failures
// ============================================================================

TEST_CASE("LocalProcess invalid path fails to start", "[command]") {
  auto cmd = subcmd::NewCommand("/bin/echo", "x");
  cmd->SetPath("/nonexistent/subcmd-binary");
  auto proc = cmd->NewProcess();
  subcmd::BufferWriter err;
  proc->RegisterError(&err);

  auto r = proc->Start();
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == subcmd::ProcessError::kSpawnFailed);
  REQUIRE(proc->Pid() == -1);

  // The stderr drain was already running; it sees end of stream
  REQUIRE(WaitClosed(err));
  REQUIRE(err.Contents().empty());
}

TEST_CASE("LocalProcess nonzero exit", "[command]") {
  auto cmd = subcmd::NewCommand("/bin/sh", "-c", "echo failing >&2; exit 7");
  auto proc = cmd->NewProcess();
  subcmd::BufferWriter err;
  proc->RegisterError(&err);

  REQUIRE(proc->Start().has_value());
  auto r = proc->WaitAndDrain();
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == subcmd::ProcessError::kExitFailure);
  REQUIRE(err.Contents() == "failing\n");

  auto* local = static_cast<subcmd::LocalProcess*>(proc.get());
  REQUIRE(local->LastWaitResult().exit_code == 7);
}

TEST_CASE("LocalProcess Kill running process", "[command]") {
  auto cmd = subcmd::NewCommand("sleep", "10");
  auto proc = cmd->NewProcess();

  auto before = proc->Kill();
  REQUIRE(!before.has_value());
  REQUIRE(before.get_error() == subcmd::ProcessError::kNotStarted);

  REQUIRE(proc->Start().has_value());
  REQUIRE(proc->Pid() > 0);
  REQUIRE(proc->Kill().has_value());

  auto r = proc->WaitAndDrain();
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == subcmd::ProcessError::kSignaled);

  auto after = proc->Kill();
  REQUIRE(!after.has_value());
  REQUIRE(after.get_error() == subcmd::ProcessError::kAlreadyFinished);
}

TEST_CASE("LocalProcess reports drain failure", "[command]") {
  auto cmd = subcmd::NewCommand("/bin/echo", "rejected");
  auto proc = cmd->NewProcess();
  RejectingWriter bad;
  proc->RegisterOutput(&bad);

  REQUIRE(proc->Start().has_value());
  auto r = proc->WaitAndDrain();
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == subcmd::ProcessError::kDrainFailed);
}

TEST_CASE("LocalProcess destroyed while running", "[command]") {
  subcmd::BufferWriter out;
  {
    auto cmd = subcmd::NewCommand("/bin/sh", "-c", "echo started; exec sleep 100");
    auto proc = cmd->NewProcess();
    proc->RegisterOutput(&out);
    REQUIRE(proc->Start().has_value());
  }
  REQUIRE(out.IsClosed());
}

TEST_CASE("LocalProcess destruction is not held up by a background grandchild",
          "[command]") {
  subcmd::BufferWriter out;
  auto begin = std::chrono::steady_clock::now();
  {
    auto cmd = subcmd::NewCommand("/bin/sh", "-c", "sleep 5 & echo started; exec sleep 100");
    auto proc = cmd->NewProcess();
    proc->RegisterOutput(&out);
    REQUIRE(proc->Start().has_value());
    usleep(50000);
  }
  auto elapsed = std::chrono::steady_clock::now() - begin;

  REQUIRE(out.IsClosed());
  REQUIRE(elapsed < std::chrono::seconds(3));
}

// ============================================================================
// Pipe acquisition
// ============================================================================

TEST_CASE("LocalProcess stderr pipe failure aborts Start", "[command]") {
  auto cmd = subcmd::NewCommand("/bin/sh", "-c", "echo out; echo err >&2");
  auto proc = cmd->NewProcess();
  static_cast<subcmd::LocalProcess*>(proc.get())->SetPipeFunction(&FailEveryPipe);
  subcmd::BufferWriter out;
  subcmd::BufferWriter err;
  proc->RegisterOutput(&out);
  proc->RegisterError(&err);

  auto r = proc->Start();
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == subcmd::ProcessError::kPipeFailed);

  // Nothing was spawned and no drain ran
  REQUIRE(proc->Pid() == -1);
  auto k = proc->Kill();
  REQUIRE(!k.has_value());
  REQUIRE(k.get_error() == subcmd::ProcessError::kNotStarted);
  REQUIRE_FALSE(out.IsClosed());
  REQUIRE_FALSE(err.IsClosed());
}

TEST_CASE("LocalProcess stdout pipe failure still spawns", "[command]") {
  g_pipe_calls = 0;
  auto cmd = subcmd::NewCommand("/bin/sh", "-c", "echo out; echo err >&2");
  auto proc = cmd->NewProcess();
  static_cast<subcmd::LocalProcess*>(proc.get())->SetPipeFunction(&FailSecondPipe);
  subcmd::BufferWriter out;
  subcmd::BufferWriter err;
  proc->RegisterOutput(&out);
  proc->RegisterError(&err);

  REQUIRE(proc->Start().has_value());
  REQUIRE(proc->WaitAndDrain().has_value());
  REQUIRE(g_pipe_calls == 2);

  // stdout went to /dev/null, stderr was drained as usual
  REQUIRE(out.Contents().empty());
  REQUIRE_FALSE(out.IsClosed());
  REQUIRE(err.Contents() == "err\n");
  REQUIRE(err.IsClosed());
}
