/**
 * @file basic_demo.cpp
 * @brief Basic demo running a real command through subcmd.
 *
 * Demonstrates:
 *   - Creating a command with base arguments
 *   - Appending per-process arguments
 *   - Fanning stdout out to the terminal and an in-memory buffer
 *   - Feeding stdin from a string
 *   - Waiting for exit and for the output drains
 */

#include "subcmd/command.hpp"
#include "subcmd/log.hpp"

#include <cstdio>
#include <string>
#include <unistd.h>

int main(int argc, char* argv[]) {
  subcmd::log::Init();

  std::string pattern = (argc > 1) ? argv[1] : "sub";

  // grep -n <pattern>, reading from stdin
  auto cmd = subcmd::NewCommand("grep", "-n");
  auto proc = cmd->NewProcess();
  proc->AppendArgs({pattern});

  subcmd::StringReader input("subprocess\nbroadcast\nsubcommand\nreader\n");
  subcmd::FdWriter terminal(STDOUT_FILENO, /*owned=*/false);
  subcmd::BufferWriter captured;
  subcmd::FdWriter errors(STDERR_FILENO, /*owned=*/false);

  proc->SetInput(&input);
  proc->RegisterOutput(&terminal);
  proc->RegisterOutput(&captured);
  proc->RegisterError(&errors);

  SUBCMD_LOG_INFO("demo", "running: %s", proc->ToString().c_str());

  auto started = proc->Start();
  if (!started) {
    SUBCMD_LOG_ERROR("demo", "start failed: %s", subcmd::ProcessErrorToString(started.get_error()));
    return 1;
  }
  SUBCMD_LOG_DEBUG("demo", "pid %d", proc->Pid());

  auto done = proc->WaitAndDrain();
  if (!done) {
    // grep exits 1 when nothing matched
    SUBCMD_LOG_WARN("demo", "finished: %s", subcmd::ProcessErrorToString(done.get_error()));
  }

  SUBCMD_LOG_INFO("demo", "captured %zu bytes", captured.Size());
  std::printf("---\n%s", captured.Contents().c_str());

  subcmd::log::Shutdown();
  return done ? 0 : 1;
}
