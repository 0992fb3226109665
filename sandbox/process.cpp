#include "sandbox/process.hpp"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <memory>
#include <mutex>

#include "glog/logging.h"

extern char** environ;

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

static const constexpr size_t kStrErrorBufSize = 2048;
static const constexpr size_t kReadChunk = 64 * 1024;
static const constexpr size_t kWriteChunk = 64 * 1024;
const auto kPollInterval = std::chrono::milliseconds(10);  // NOLINT
// How long the pipes may stay open after the child has been reaped.
const auto kIoGrace = std::chrono::milliseconds(500);  // NOLINT

std::string ErrnoMessage(const char* prefix, int err) {
  char buf[kStrErrorBufSize] = {};
  std::string msg = prefix;
  msg += ": ";
  msg += mystrerror(err, buf, kStrErrorBufSize);
  return msg;
}

void IgnoreSigpipe() {
  static std::once_flag once;
  std::call_once(once, []() { signal(SIGPIPE, SIG_IGN); });
}

void AppendCapped(const char* data, size_t len, int64_t cap, std::string* out,
                  bool* truncated) {
  if (cap < 0) {
    out->append(data, len);
    return;
  }
  size_t room = static_cast<size_t>(cap) > out->size()
                    ? static_cast<size_t>(cap) - out->size()
                    : 0;
  if (len > room) *truncated = true;
  out->append(data, std::min(len, room));
}

class FileActions {
 public:
  FileActions() { posix_spawn_file_actions_init(&actions_); }
  ~FileActions() { posix_spawn_file_actions_destroy(&actions_); }
  posix_spawn_file_actions_t* get() { return &actions_; }

 private:
  posix_spawn_file_actions_t actions_;
};

class SpawnAttr {
 public:
  SpawnAttr() { posix_spawnattr_init(&attr_); }
  ~SpawnAttr() { posix_spawnattr_destroy(&attr_); }
  posix_spawnattr_t* get() { return &attr_; }

 private:
  posix_spawnattr_t attr_;
};
}  // namespace

namespace sandbox {

bool Process::Start(const ProcessOptions& options, std::string* error_msg) {
  if (pid_ != 0) {
    *error_msg = "process already started";
    return false;
  }
  if (options.args.empty()) {
    *error_msg = "no command given";
    return false;
  }
  IgnoreSigpipe();

  int stdin_pipe[2] = {-1, -1};
  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  auto close_all = [&]() {
    for (int* p : {stdin_pipe, stdout_pipe, stderr_pipe}) {
      for (int i = 0; i < 2; i++) {
        if (p[i] != -1) close(p[i]);
      }
    }
  };
  if ((options.feed_stdin && pipe2(stdin_pipe, O_CLOEXEC) == -1) ||
      pipe2(stdout_pipe, O_CLOEXEC) == -1 ||
      pipe2(stderr_pipe, O_CLOEXEC) == -1) {
    *error_msg = ErrnoMessage("pipe2", errno);
    close_all();
    return false;
  }

  FileActions actions;
  int ret = 0;
  if (options.feed_stdin) {
    ret = posix_spawn_file_actions_adddup2(actions.get(), stdin_pipe[0],
                                           STDIN_FILENO);
  } else {
    ret = posix_spawn_file_actions_addopen(actions.get(), STDIN_FILENO,
                                           "/dev/null", O_RDONLY, 0);
  }
  if (ret == 0) {
    ret = posix_spawn_file_actions_adddup2(actions.get(), stdout_pipe[1],
                                           STDOUT_FILENO);
  }
  if (ret == 0) {
    ret = posix_spawn_file_actions_adddup2(actions.get(), stderr_pipe[1],
                                           STDERR_FILENO);
  }
  if (ret != 0) {
    *error_msg = ErrnoMessage("posix_spawn_file_actions", ret);
    close_all();
    return false;
  }

  // The child gets its own process group, the default SIGPIPE disposition
  // and an empty signal mask.
  SpawnAttr attr;
  sigset_t default_signals;
  sigset_t empty_mask;
  sigemptyset(&default_signals);
  sigaddset(&default_signals, SIGPIPE);
  sigemptyset(&empty_mask);
  ret = posix_spawnattr_setflags(
      attr.get(),
      POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK);
  if (ret == 0) ret = posix_spawnattr_setpgroup(attr.get(), 0);
  if (ret == 0) ret = posix_spawnattr_setsigdefault(attr.get(), &default_signals);
  if (ret == 0) ret = posix_spawnattr_setsigmask(attr.get(), &empty_mask);
  if (ret != 0) {
    *error_msg = ErrnoMessage("posix_spawnattr", ret);
    close_all();
    return false;
  }

  std::vector<std::unique_ptr<char, decltype(&free)>> storage;
  auto to_argv = [&storage](const std::vector<std::string>& strings) {
    std::vector<char*> out;
    for (const std::string& s : strings) {
      storage.emplace_back(strdup(s.c_str()), &free);
      out.push_back(storage.back().get());
    }
    out.push_back(nullptr);
    return out;
  };
  std::vector<char*> argv = to_argv(options.args);
  std::vector<char*> envp;
  if (!options.env.empty()) envp = to_argv(options.env);

  pid_t child = 0;
  ret = posix_spawnp(&child, argv[0], actions.get(), attr.get(), argv.data(),
                     options.env.empty() ? environ : envp.data());
  if (ret != 0) {
    *error_msg = ErrnoMessage("posix_spawn", ret);
    close_all();
    return false;
  }
  start_time_ = std::chrono::steady_clock::now();
  pid_ = child;
  VLOG(2) << "Spawned " << options.args[0] << " as " << pid_;

  // Keep the parent ends only.
  if (options.feed_stdin) {
    close(stdin_pipe[0]);
    stdin_fd_ = stdin_pipe[1];
    if (fcntl(stdin_fd_, F_SETFL, O_NONBLOCK) == -1) {
      LOG(WARNING) << ErrnoMessage("fcntl", errno);
    }
  }
  close(stdout_pipe[1]);
  close(stderr_pipe[1]);
  stdout_fd_ = stdout_pipe[0];
  stderr_fd_ = stderr_pipe[0];
  stdin_data_ = options.feed_stdin ? options.stdin_data : "";
  max_output_bytes_ = options.max_output_bytes;
  io_thread_ = std::thread(&Process::PumpIo, this);
  return true;
}

void Process::CloseFd(int* fd) {
  if (*fd != -1) {
    close(*fd);
    *fd = -1;
  }
}

void Process::PumpIo() {
  size_t stdin_pos = 0;
  if (stdin_fd_ != -1 && stdin_data_.empty()) CloseFd(&stdin_fd_);
  char buf[kReadChunk];
  while (!stop_io_ &&
         (stdin_fd_ != -1 || stdout_fd_ != -1 || stderr_fd_ != -1)) {
    struct pollfd fds[3];
    int* owners[3];
    nfds_t nfds = 0;
    if (stdin_fd_ != -1) {
      fds[nfds] = {stdin_fd_, POLLOUT, 0};
      owners[nfds++] = &stdin_fd_;
    }
    if (stdout_fd_ != -1) {
      fds[nfds] = {stdout_fd_, POLLIN, 0};
      owners[nfds++] = &stdout_fd_;
    }
    if (stderr_fd_ != -1) {
      fds[nfds] = {stderr_fd_, POLLIN, 0};
      owners[nfds++] = &stderr_fd_;
    }
    int ready = poll(fds, nfds, kPollInterval.count());
    if (ready == -1 && errno == EINTR) continue;
    if (ready == -1) {
      LOG(ERROR) << ErrnoMessage("poll", errno);
      break;
    }
    for (nfds_t i = 0; i < nfds; i++) {
      if (fds[i].revents == 0) continue;
      int* fd = owners[i];
      if (fd == &stdin_fd_) {
        size_t len = std::min(kWriteChunk, stdin_data_.size() - stdin_pos);
        ssize_t written = write(stdin_fd_, stdin_data_.data() + stdin_pos, len);
        if (written == -1) {
          if (errno == EINTR || errno == EAGAIN) continue;
          io_result_.stdin_error = ErrnoMessage("write", errno);
          CloseFd(&stdin_fd_);
          continue;
        }
        stdin_pos += written;
        if (stdin_pos == stdin_data_.size()) CloseFd(&stdin_fd_);
        continue;
      }
      ssize_t amount = read(*fd, buf, kReadChunk);
      if (amount == -1 && (errno == EINTR || errno == EAGAIN)) continue;
      if (amount <= 0) {
        CloseFd(fd);
        continue;
      }
      if (fd == &stdout_fd_) {
        AppendCapped(buf, amount, max_output_bytes_, &io_result_.stdout_data,
                     &io_result_.stdout_truncated);
      } else {
        AppendCapped(buf, amount, max_output_bytes_, &io_result_.stderr_data,
                     &io_result_.stderr_truncated);
      }
    }
  }
  if (stdin_fd_ != -1 && io_result_.stdin_error.empty()) {
    io_result_.stdin_error = "process exited before reading all its input";
  }
  CloseFd(&stdin_fd_);
  CloseFd(&stdout_fd_);
  CloseFd(&stderr_fd_);
  io_done_ = true;
}

void Process::FinishIo() {
  if (!io_thread_.joinable()) return;
  auto limit = std::chrono::steady_clock::now() + kIoGrace;
  while (!io_done_ && std::chrono::steady_clock::now() < limit) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  stop_io_ = true;
  io_thread_.join();
}

void Process::Kill() {
  if (pid_ == 0 || reaped_) return;
  if (kill(-pid_, SIGKILL) == -1 && errno != ESRCH) {
    LOG(WARNING) << ErrnoMessage("kill", errno);
  }
}

bool Process::Wait(const util::CancellationScope& scope, ProcessResult* result,
                   std::string* error_msg) {
  if (pid_ == 0) {
    *error_msg = "process not started";
    return false;
  }
  if (reaped_) {
    *error_msg = "process already waited for";
    return false;
  }
  int child_status = 0;
  bool killed = false;
  while (true) {
    pid_t ret = waitpid(pid_, &child_status, WNOHANG);
    if (ret == -1 && errno == EINTR) continue;
    if (ret == -1) {
      *error_msg = ErrnoMessage("waitpid", errno);
      Kill();
      reaped_ = true;
      FinishIo();
      return false;
    }
    if (ret == pid_) break;
    if (scope.Done()) {
      Kill();
      killed = true;
      while ((ret = waitpid(pid_, &child_status, 0)) == -1 && errno == EINTR) {
      }
      if (ret != pid_) {
        *error_msg = ErrnoMessage("waitpid", errno);
        reaped_ = true;
        FinishIo();
        return false;
      }
      break;
    }
    std::this_thread::sleep_for(kPollInterval);
  }
  auto wall_time = std::chrono::steady_clock::now() - start_time_;
  // Descendants left behind in the group would keep the pipes open.
  Kill();
  reaped_ = true;
  FinishIo();

  *result = std::move(io_result_);
  result->killed = killed;
  result->status_code =
      WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  result->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  result->wall_time_millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(wall_time).count();
  return true;
}

bool Process::Run(const ProcessOptions& options,
                  const util::CancellationScope& scope, ProcessResult* result,
                  std::string* error_msg) {
  Process process;
  if (!process.Start(options, error_msg)) return false;
  return process.Wait(scope, result, error_msg);
}

Process::~Process() {
  if (pid_ != 0 && !reaped_) {
    Kill();
    while (waitpid(pid_, nullptr, 0) == -1 && errno == EINTR) {
    }
    reaped_ = true;
  }
  if (io_thread_.joinable()) {
    stop_io_ = true;
    io_thread_.join();
  }
  CloseFd(&stdin_fd_);
  CloseFd(&stdout_fd_);
  CloseFd(&stderr_fd_);
}

}  // namespace sandbox
