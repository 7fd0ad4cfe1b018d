#pragma once
#include <filesystem>
#include <string>
#include <sys/types.h>
#include <vector>

namespace gitgate {
class SessionIo;
}

namespace gitgate::process {

class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) noexcept : fd_{fd} {}

  UniqueFd(const UniqueFd &) = delete;
  auto operator=(const UniqueFd &) -> UniqueFd & = delete;

  UniqueFd(UniqueFd &&other) noexcept : fd_{other.fd_} { other.fd_ = -1; }
  auto operator=(UniqueFd &&other) noexcept -> UniqueFd &;

  ~UniqueFd() { close_if_open(); }

  [[nodiscard]] auto valid() const noexcept -> bool { return fd_ != -1; }
  [[nodiscard]] explicit operator bool() const noexcept { return valid(); }
  [[nodiscard]] auto get() const noexcept -> int { return fd_; }

  void reset(int fd = -1) noexcept;

private:
  int fd_{-1};

  void close_if_open() noexcept;
};

// A spawned program with its three standard streams piped to us.
// Destroying an un-waited child kills and reaps it.
class Child {
public:
  Child() = default;
  Child(pid_t pid, UniqueFd in, UniqueFd out, UniqueFd err) noexcept;
  Child(Child &&other) noexcept;
  auto operator=(Child &&other) noexcept -> Child &;
  Child(const Child &) = delete;
  auto operator=(const Child &) -> Child & = delete;
  ~Child();

  UniqueFd in;  // child's stdin (write end)
  UniqueFd out; // child's stdout (read end)
  UniqueFd err; // child's stderr (read end)

  [[nodiscard]] auto pid() const noexcept -> pid_t { return pid_; }

  // Close our pipe ends and reap the child. Returns the exit code, or
  // 128 + signal number if the child was killed by a signal.
  int wait();

private:
  pid_t pid_{-1};

  void kill_and_reap() noexcept;
};

struct RunResult {
  int status = 0;
  std::string output; // stdout and stderr, interleaved as read
};

// fork + exec argv[0] directly (no shell), optionally inside `cwd`. A bare
// program name is looked up in PATH. The program inherits only the three
// pipes; every other descriptor of ours is closed before exec.
// Throws std::system_error if the program cannot be started.
Child spawn(const std::vector<std::string> &argv, const std::filesystem::path &cwd = {});

// Spawn with empty stdin, collect output, wait.
RunResult run(const std::vector<std::string> &argv, const std::filesystem::path &cwd = {});

// Wire `child` to a client connection until the child closes its output:
// client input -> child stdin, child stdout -> client, child stderr ->
// client diagnostic stream. Returns the child's exit status.
int pump(Child &child, SessionIo &io);

} // namespace gitgate::process
