/**
 * @file process.hpp
 * @brief External tool execution with captured, line-oriented output
 *
 * @details ChildProcess owns one spawned external tool:
 *
 *          - posix_spawnp with stdout/stderr redirected into pipes and stdin
 *            from /dev/null
 *
 *          - the child leads its own process group, so termination reaches
 *            every process the tool started
 *
 *          - output is read without blocking the supervisor beyond the poll
 *            timeout; '\n' and '\r' both terminate a line (ffmpeg rewrites
 *            its statistics line with '\r')
 *
 * @note Linux/POSIX only.
 */

#ifndef VIDCUT_PROCESS_HPP
#define VIDCUT_PROCESS_HPP

#include <atomic>
#include <deque>
#include <string>
#include <vector>

#include <sys/types.h>

namespace vidcut {

/// Exit code reported when the tool could not be started
constexpr int EXIT_SPAWN_FAILED = 127;

/**
 * @struct OutputLine
 * @brief One complete line read from the child.
 */
struct OutputLine {
  bool from_stderr = false;
  std::string text;
};

/**
 * @class DiagnosticTail
 * @brief Keeps the last N lines of a diagnostic stream.
 */
class DiagnosticTail {
public:
  explicit DiagnosticTail(size_t max_lines) : max_lines_(max_lines) {}

  void push(const std::string &line);
  std::string str() const;
  bool empty() const { return lines_.empty(); }

private:
  size_t max_lines_;
  std::deque<std::string> lines_;
};

/**
 * @class ChildProcess
 * @brief RAII handle of a spawned external process.
 * @note The destructor kills and reaps a child that is still running.
 */
class ChildProcess {
public:
  ChildProcess() = default;
  ~ChildProcess();

  ChildProcess(const ChildProcess &) = delete;
  ChildProcess &operator=(const ChildProcess &) = delete;

  /**
   * @brief Start argv[0] (searched in PATH) with the given arguments.
   * @param error Output: reason when spawning fails
   * @return true if the process was started
   */
  bool spawn(const std::vector<std::string> &argv, std::string &error);

  bool running() const { return pid_ > 0; }
  pid_t pid() const { return pid_; }

  /**
   * @brief Wait up to timeout_ms for output and return complete lines.
   * @note Sleeps for timeout_ms when both pipes are already closed.
   */
  std::vector<OutputLine> read_lines(int timeout_ms);

  /**
   * @brief Read whatever output is still buffered after the child exited.
   * @note Bounded: stops when the pipes close or stay silent for a short
   *       interval (a leftover grandchild may keep a pipe open).
   */
  std::vector<OutputLine> drain();

  /**
   * @brief Non-blocking reap.
   * @param exit_code Output: exit status, or 128 + signal number
   * @return true if the child has exited
   */
  bool try_wait(int &exit_code);

  /**
   * @brief SIGTERM the process group, wait up to grace_ms, then SIGKILL.
   * @param exit_code Output: final exit status
   * @return true if the group exited within the grace period
   */
  bool terminate(int grace_ms, int &exit_code);

private:
  struct Pipe {
    int fd = -1;
    std::string pending;
  };

  void read_available(Pipe &pipe, bool is_stderr,
                      std::vector<OutputLine> &lines);
  void close_pipe(Pipe &pipe, bool is_stderr, std::vector<OutputLine> &lines);
  void close_fds();

  pid_t pid_ = -1;
  Pipe out_;
  Pipe err_;
};

/**
 * @struct ProcessResult
 * @brief Outcome of run_process().
 */
struct ProcessResult {
  bool started = false;
  bool timed_out = false;
  bool cancelled = false;
  int exit_code = -1;
  std::string output;      //< Complete stdout, one line per '\n'
  std::string error_tail;  //< Last stderr lines
  std::string spawn_error; //< Why the tool could not be started

  bool ok() const {
    return started && !timed_out && !cancelled && exit_code == 0;
  }
};

/**
 * @brief Run a tool to completion, capturing its output.
 *
 * @param argv Program and arguments
 * @param timeout_ms Kill the tool after this long (0 = no limit)
 * @param cancel Optional flag polled while waiting; set = terminate the tool
 * @param tail_lines Number of stderr lines kept in error_tail
 */
ProcessResult run_process(const std::vector<std::string> &argv,
                          int timeout_ms = 0,
                          const std::atomic<bool> *cancel = nullptr,
                          size_t tail_lines = 20);

} // namespace vidcut

#endif // VIDCUT_PROCESS_HPP
