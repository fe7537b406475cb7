/**
 * @file process.cpp
 * @brief External tool execution implementation
 */

#include "vidcut/process.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "vidcut/config.hpp"
#include "vidcut/logging.hpp"

extern char **environ;

namespace vidcut {

namespace {

int decode_status(int status) {
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

void split_lines(std::string &pending, bool is_stderr,
                 std::vector<OutputLine> &lines) {
  size_t start = 0;
  for (size_t i = 0; i < pending.size(); ++i) {
    if (pending[i] == '\n' || pending[i] == '\r') {
      if (i > start)
        lines.push_back({is_stderr, pending.substr(start, i - start)});
      start = i + 1;
    }
  }
  pending.erase(0, start);
}

} // anonymous namespace

// **---- DiagnosticTail ----**

void DiagnosticTail::push(const std::string &line) {
  if (max_lines_ == 0)
    return;
  lines_.push_back(line);
  while (lines_.size() > max_lines_)
    lines_.pop_front();
}

std::string DiagnosticTail::str() const {
  std::string out;
  for (const auto &l : lines_) {
    if (!out.empty())
      out += '\n';
    out += l;
  }
  return out;
}

// **---- ChildProcess ----**

ChildProcess::~ChildProcess() {
  if (pid_ > 0) {
    kill(-pid_, SIGKILL);
    int status = 0;
    waitpid(pid_, &status, 0);
    pid_ = -1;
  }
  close_fds();
}

bool ChildProcess::spawn(const std::vector<std::string> &argv,
                         std::string &error) {
  if (argv.empty() || argv[0].empty()) {
    error = "empty command";
    return false;
  }
  if (pid_ > 0) {
    error = "process already running";
    return false;
  }

  int out_fds[2] = {-1, -1};
  int err_fds[2] = {-1, -1};
  if (pipe2(out_fds, O_CLOEXEC) != 0) {
    error = fmt::format("pipe failed: {}", std::strerror(errno));
    return false;
  }
  if (pipe2(err_fds, O_CLOEXEC) != 0) {
    error = fmt::format("pipe failed: {}", std::strerror(errno));
    close(out_fds[0]);
    close(out_fds[1]);
    return false;
  }

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null",
                                   O_RDONLY, 0);
  posix_spawn_file_actions_adddup2(&actions, out_fds[1], STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, err_fds[1], STDERR_FILENO);

  posix_spawnattr_t attr;
  posix_spawnattr_init(&attr);
  sigset_t empty_mask;
  sigemptyset(&empty_mask);
  sigset_t default_signals;
  sigemptyset(&default_signals);
  sigaddset(&default_signals, SIGPIPE);
  sigaddset(&default_signals, SIGINT);
  sigaddset(&default_signals, SIGTERM);
  posix_spawnattr_setsigmask(&attr, &empty_mask);
  posix_spawnattr_setsigdefault(&attr, &default_signals);
  /// Own process group: termination is sent to the whole group
  posix_spawnattr_setpgroup(&attr, 0);
  posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP |
                                      POSIX_SPAWN_SETSIGMASK |
                                      POSIX_SPAWN_SETSIGDEF);

  std::vector<char *> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto &arg : argv)
    c_argv.push_back(const_cast<char *>(arg.c_str()));
  c_argv.push_back(nullptr);

  pid_t pid = -1;
  int rc = posix_spawnp(&pid, c_argv[0], &actions, &attr, c_argv.data(),
                        environ);

  posix_spawn_file_actions_destroy(&actions);
  posix_spawnattr_destroy(&attr);
  close(out_fds[1]);
  close(err_fds[1]);

  if (rc != 0) {
    error = fmt::format("cannot execute '{}': {}", argv[0], std::strerror(rc));
    close(out_fds[0]);
    close(err_fds[0]);
    return false;
  }

  fcntl(out_fds[0], F_SETFL, fcntl(out_fds[0], F_GETFL) | O_NONBLOCK);
  fcntl(err_fds[0], F_SETFL, fcntl(err_fds[0], F_GETFL) | O_NONBLOCK);

  pid_ = pid;
  out_.fd = out_fds[0];
  err_.fd = err_fds[0];
  out_.pending.clear();
  err_.pending.clear();
  LOG_DEBUG("Spawned pid {}: {}", pid_, argv[0]);
  return true;
}

void ChildProcess::read_available(Pipe &pipe, bool is_stderr,
                                  std::vector<OutputLine> &lines) {
  char buf[4096];
  while (pipe.fd >= 0) {
    ssize_t n = read(pipe.fd, buf, sizeof(buf));
    if (n > 0) {
      pipe.pending.append(buf, static_cast<size_t>(n));
      continue;
    }
    if (n == 0) {
      close_pipe(pipe, is_stderr, lines);
      return;
    }
    if (errno == EINTR)
      continue;
    if (errno != EAGAIN && errno != EWOULDBLOCK)
      close_pipe(pipe, is_stderr, lines);
    break;
  }
  split_lines(pipe.pending, is_stderr, lines);
}

void ChildProcess::close_pipe(Pipe &pipe, bool is_stderr,
                              std::vector<OutputLine> &lines) {
  split_lines(pipe.pending, is_stderr, lines);
  if (!pipe.pending.empty()) {
    lines.push_back({is_stderr, pipe.pending});
    pipe.pending.clear();
  }
  if (pipe.fd >= 0) {
    close(pipe.fd);
    pipe.fd = -1;
  }
}

void ChildProcess::close_fds() {
  if (out_.fd >= 0) {
    close(out_.fd);
    out_.fd = -1;
  }
  if (err_.fd >= 0) {
    close(err_.fd);
    err_.fd = -1;
  }
}

std::vector<OutputLine> ChildProcess::read_lines(int timeout_ms) {
  std::vector<OutputLine> lines;

  pollfd fds[2];
  nfds_t count = 0;
  if (out_.fd >= 0)
    fds[count++] = {out_.fd, POLLIN, 0};
  if (err_.fd >= 0)
    fds[count++] = {err_.fd, POLLIN, 0};

  if (count == 0) {
    if (timeout_ms > 0)
      std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
    return lines;
  }

  int ready = poll(fds, count, timeout_ms);
  if (ready <= 0)
    return lines;

  /// Drain both pipes regardless of which one woke us (non-blocking reads)
  read_available(out_, false, lines);
  read_available(err_, true, lines);
  return lines;
}

std::vector<OutputLine> ChildProcess::drain() {
  std::vector<OutputLine> lines;
  for (int i = 0; i < 20 && (out_.fd >= 0 || err_.fd >= 0); ++i) {
    pollfd fds[2];
    nfds_t count = 0;
    if (out_.fd >= 0)
      fds[count++] = {out_.fd, POLLIN, 0};
    if (err_.fd >= 0)
      fds[count++] = {err_.fd, POLLIN, 0};
    if (poll(fds, count, 50) <= 0)
      break;
    read_available(out_, false, lines);
    read_available(err_, true, lines);
  }
  /// Flush unterminated trailing text
  if (!out_.pending.empty()) {
    lines.push_back({false, out_.pending});
    out_.pending.clear();
  }
  if (!err_.pending.empty()) {
    lines.push_back({true, err_.pending});
    err_.pending.clear();
  }
  return lines;
}

bool ChildProcess::try_wait(int &exit_code) {
  if (pid_ <= 0)
    return true;
  int status = 0;
  pid_t r = waitpid(pid_, &status, WNOHANG);
  if (r == 0)
    return false;
  if (r < 0) {
    if (errno == EINTR)
      return false;
    LOG_WARN("waitpid({}) failed: {}", pid_, std::strerror(errno));
    exit_code = -1;
  } else {
    exit_code = decode_status(status);
  }
  pid_ = -1;
  return true;
}

bool ChildProcess::terminate(int grace_ms, int &exit_code) {
  if (pid_ <= 0)
    return true;

  kill(-pid_, SIGTERM);

  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(grace_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (try_wait(exit_code)) {
      /// Stragglers in the group (e.g. a shell's children) get no grace
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }

  LOG_WARN("pid {} ignored SIGTERM for {} ms, sending SIGKILL", pid_,
           grace_ms);
  kill(-pid_, SIGKILL);
  int status = 0;
  if (waitpid(pid_, &status, 0) == pid_)
    exit_code = decode_status(status);
  pid_ = -1;
  return false;
}

// **---- run_process ----**

ProcessResult run_process(const std::vector<std::string> &argv, int timeout_ms,
                          const std::atomic<bool> *cancel, size_t tail_lines) {
  ProcessResult result;
  ChildProcess child;
  if (!child.spawn(argv, result.spawn_error)) {
    result.exit_code = EXIT_SPAWN_FAILED;
    return result;
  }
  result.started = true;

  DiagnosticTail tail(tail_lines);
  auto collect = [&](const std::vector<OutputLine> &lines) {
    for (const auto &l : lines) {
      if (l.from_stderr) {
        tail.push(l.text);
      } else {
        result.output += l.text;
        result.output += '\n';
      }
    }
  };

  const int poll_ms = std::max(10, Config::poll_interval_ms());
  auto start = std::chrono::steady_clock::now();

  while (true) {
    collect(child.read_lines(poll_ms));

    int exit_code = 0;
    if (child.try_wait(exit_code)) {
      result.exit_code = exit_code;
      break;
    }

    if (cancel && cancel->load()) {
      result.cancelled = true;
      child.terminate(Config::cancel_grace_ms(), result.exit_code);
      break;
    }

    if (timeout_ms > 0) {
      auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now() - start)
                         .count();
      if (elapsed >= timeout_ms) {
        result.timed_out = true;
        child.terminate(Config::cancel_grace_ms(), result.exit_code);
        break;
      }
    }
  }

  collect(child.drain());
  result.error_tail = tail.str();
  return result;
}

} // namespace vidcut
