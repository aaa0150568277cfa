/**
 * @file mock_demo.cpp
 * @brief Swapping a real command for TestCommand behind the Command interface.
 *
 * CountLines() only knows subcmd::Command, so the same function runs
 * against "wc -l" and against canned output.
 */

#include "subcmd/subcmd.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

// Runs the command on @p text and parses the first number it prints.
static subcmd::expected<long, subcmd::ProcessError> CountLines(const subcmd::Command& cmd,
                                                                const std::string& text) {
  auto proc = cmd.NewProcess();
  subcmd::StringReader input(text);
  subcmd::BufferWriter out;
  proc->SetInput(&input);
  proc->RegisterOutput(&out);

  auto started = proc->Start();
  if (!started) {
    return subcmd::expected<long, subcmd::ProcessError>::error(started.get_error());
  }
  auto done = proc->WaitAndDrain();
  if (!done) {
    return subcmd::expected<long, subcmd::ProcessError>::error(done.get_error());
  }
  return subcmd::expected<long, subcmd::ProcessError>::success(
      std::strtol(out.Contents().c_str(), nullptr, 10));
}

static void Report(const char* label, const subcmd::expected<long, subcmd::ProcessError>& r) {
  if (r) {
    std::printf("%-8s %ld lines\n", label, r.value());
  } else {
    std::printf("%-8s error: %s\n", label, subcmd::ProcessErrorToString(r.get_error()));
  }
}

int main() {
  subcmd::log::Init();

  const std::string text = "one\ntwo\nthree\n";

  auto wc = subcmd::NewCommand("wc", "-l");
  Report("wc", CountLines(*wc, text));

  subcmd::TestCommand fake;
  fake.stdout_data = "42\n";
  Report("fake", CountLines(fake, text));

  fake.wait_error = subcmd::ProcessError::kExitFailure;
  Report("failing", CountLines(fake, text));

  subcmd::log::Shutdown();
  return 0;
}
