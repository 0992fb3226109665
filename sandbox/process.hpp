#ifndef SANDBOX_PROCESS_HPP
#define SANDBOX_PROCESS_HPP

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "util/cancellation.hpp"

namespace sandbox {

// Settings to spawn a child process.
struct ProcessOptions {
  // args[0] is looked up in PATH if it does not contain a slash.
  std::vector<std::string> args;
  // KEY=VALUE entries. The environment of the parent is inherited when empty.
  std::vector<std::string> env;
  // When feed_stdin is set, stdin_data is written to the standard input of the
  // child, which is closed afterwards. Otherwise it reads /dev/null.
  bool feed_stdin = false;
  std::string stdin_data;
  // Bytes kept of each of stdout and stderr, negative for no limit. Further
  // output is read and discarded, so the child never blocks on a full pipe.
  int64_t max_output_bytes = -1;
};

// Results of the execution.
struct ProcessResult {
  std::string stdout_data;
  std::string stderr_data;
  bool stdout_truncated = false;
  bool stderr_truncated = false;
  int32_t status_code = 0;
  int32_t signal = 0;
  // The child was killed because the scope ended.
  bool killed = false;
  int64_t wall_time_millis = 0;
  // Set if the standard input could not be delivered completely.
  std::string stdin_error;
};

// A child process in its own process group, with piped standard streams.
// The whole group is killed when the child is killed or reaped, so that no
// descendant keeps running. Not thread safe.
class Process {
 public:
  // Spawns the child. Returns false and sets error_msg if it could not be
  // started.
  bool Start(const ProcessOptions& options, std::string* error_msg);

  // Waits for the termination of the child, killing it if the scope ends
  // first. Returns false and sets error_msg if the child could not be waited
  // for.
  bool Wait(const util::CancellationScope& scope, ProcessResult* result,
            std::string* error_msg);

  // Kills the process group of a running child.
  void Kill();

  bool Started() const { return pid_ != 0; }
  bool Reaped() const { return reaped_; }

  // Start followed by Wait.
  static bool Run(const ProcessOptions& options,
                  const util::CancellationScope& scope, ProcessResult* result,
                  std::string* error_msg);

  Process() = default;
  ~Process();
  Process(const Process&) = delete;
  Process& operator=(const Process&) = delete;
  Process(Process&&) = delete;
  Process& operator=(Process&&) = delete;

 private:
  // Body of the thread that feeds stdin and collects stdout and stderr.
  void PumpIo();
  // Waits for the io thread to drain the pipes, for a bounded time.
  void FinishIo();
  void CloseFd(int* fd);

  pid_t pid_ = 0;
  bool reaped_ = false;
  int stdin_fd_ = -1;
  int stdout_fd_ = -1;
  int stderr_fd_ = -1;
  std::string stdin_data_;
  int64_t max_output_bytes_ = -1;
  std::chrono::steady_clock::time_point start_time_;

  std::thread io_thread_;
  std::atomic<bool> io_done_{false};
  std::atomic<bool> stop_io_{false};
  // Owned by the io thread until it is joined.
  ProcessResult io_result_;
};

}  // namespace sandbox

#endif
