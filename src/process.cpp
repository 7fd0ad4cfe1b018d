#include "gitgate/process.hpp"

#include "gitgate/session_io.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace gitgate::process {

namespace {

constexpr int kPollSliceMs = 10;
constexpr std::size_t kChunk = 32 * 1024;

[[nodiscard]] auto make_pipe() -> std::pair<UniqueFd, UniqueFd> {
  std::array<int, 2> fds{};
  if (::pipe2(fds.data(), O_CLOEXEC) != 0) {
    throw std::system_error(errno, std::generic_category(), "pipe2");
  }
  return {UniqueFd{fds[0]}, UniqueFd{fds[1]}};
}

void set_nonblocking(int fd) {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags == -1 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
    throw std::system_error(errno, std::generic_category(), "fcntl(O_NONBLOCK)");
  }
}

// execvp's PATH lookup, done before fork so the child only needs execv.
[[nodiscard]] auto resolve_program(const std::string &name) -> std::string {
  if (name.find('/') != std::string::npos)
    return name;
  const char *path_env = std::getenv("PATH");
  std::string_view dirs = path_env != nullptr ? path_env : "/usr/local/bin:/usr/bin:/bin";
  for (;;) {
    const auto colon = dirs.find(':');
    const std::string_view dir = dirs.substr(0, colon);
    const std::string candidate = dir.empty() ? name : std::string(dir) + "/" + name;
    std::error_code ec;
    if (std::filesystem::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0)
      return candidate;
    if (colon == std::string_view::npos)
      break;
    dirs.remove_prefix(colon + 1);
  }
  throw std::system_error(ENOENT, std::generic_category(), "exec " + name);
}

// Close every descriptor >= 3 except `keep`, so the program sees only its
// standard streams. Async-signal-safe.
void close_inherited(int keep, int max_fd) noexcept {
  bool ok = keep <= 3 || ::close_range(3, static_cast<unsigned>(keep - 1), 0) == 0;
  ok = ok && ::close_range(static_cast<unsigned>(keep + 1), ~0U, 0) == 0;
  if (ok)
    return;
  for (int fd = 3; fd < max_fd; ++fd) {
    if (fd != keep)
      ::close(fd);
  }
}

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void report_and_exit(int fd, int err) noexcept {
  ssize_t w = 0;
  do {
    w = ::write(fd, &err, sizeof err);
  } while (w == -1 && errno == EINTR);
  ::_exit(127);
}

[[nodiscard]] auto decode_status(int status) -> int {
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return 1;
}

// Read what is available from `fd`. Returns false once the stream ended.
template <typename Sink> auto drain(UniqueFd &fd, Sink &&sink) -> bool {
  std::array<std::uint8_t, kChunk> buf{};
  const ssize_t r = ::read(fd.get(), buf.data(), buf.size());
  if (r > 0) {
    sink(std::span<const std::uint8_t>(buf.data(), static_cast<std::size_t>(r)));
    return true;
  }
  if (r == -1 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))
    return true;
  fd.reset();
  return false;
}

} // namespace

auto UniqueFd::operator=(UniqueFd &&other) noexcept -> UniqueFd & {
  if (this != &other) {
    close_if_open();
    fd_ = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

void UniqueFd::reset(int fd) noexcept {
  if (fd_ != fd) {
    close_if_open();
    fd_ = fd;
  }
}

void UniqueFd::close_if_open() noexcept {
  if (fd_ != -1) {
    // best effort; no throw in destructor
    ::close(fd_);
    fd_ = -1;
  }
}

Child::Child(pid_t pid, UniqueFd in_fd, UniqueFd out_fd, UniqueFd err_fd) noexcept
    : in(std::move(in_fd)), out(std::move(out_fd)), err(std::move(err_fd)), pid_(pid) {}

Child::Child(Child &&other) noexcept
    : in(std::move(other.in)), out(std::move(other.out)), err(std::move(other.err)),
      pid_(std::exchange(other.pid_, -1)) {}

auto Child::operator=(Child &&other) noexcept -> Child & {
  if (this != &other) {
    kill_and_reap();
    in = std::move(other.in);
    out = std::move(other.out);
    err = std::move(other.err);
    pid_ = std::exchange(other.pid_, -1);
  }
  return *this;
}

Child::~Child() { kill_and_reap(); }

void Child::kill_and_reap() noexcept {
  in.reset();
  out.reset();
  err.reset();
  if (pid_ > 0) {
    ::kill(pid_, SIGKILL);
    while (::waitpid(pid_, nullptr, 0) == -1 && errno == EINTR) {
    }
    pid_ = -1;
  }
}

int Child::wait() {
  if (pid_ <= 0) {
    throw std::logic_error("wait: no child process");
  }
  in.reset();
  out.reset();
  err.reset();
  int status = 0;
  while (::waitpid(pid_, &status, 0) == -1) {
    if (errno != EINTR) {
      const int saved = errno;
      pid_ = -1;
      throw std::system_error(saved, std::generic_category(), "waitpid");
    }
  }
  pid_ = -1;
  return decode_status(status);
}

Child spawn(const std::vector<std::string> &argv, const std::filesystem::path &cwd) {
  if (argv.empty()) {
    throw std::invalid_argument("spawn: empty argv");
  }
  const std::string program = resolve_program(argv[0]);
  const long open_max = ::sysconf(_SC_OPEN_MAX);
  const int max_fd = open_max > 0 ? static_cast<int>(open_max) : 1024;
  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto &a : argv)
    cargv.push_back(const_cast<char *>(a.c_str()));
  cargv.push_back(nullptr);
  const std::string dir = cwd.string();

  auto [in_r, in_w] = make_pipe();
  auto [out_r, out_w] = make_pipe();
  auto [err_r, err_w] = make_pipe();
  // Closed by a successful exec; carries errno otherwise.
  auto [exec_r, exec_w] = make_pipe();

  const pid_t pid = ::fork();
  if (pid == -1) {
    throw std::system_error(errno, std::generic_category(), "fork");
  }
  if (pid == 0) {
    if (!dir.empty() && ::chdir(dir.c_str()) != 0)
      report_and_exit(exec_w.get(), errno);
    if (::dup2(in_r.get(), STDIN_FILENO) == -1 || ::dup2(out_w.get(), STDOUT_FILENO) == -1 ||
        ::dup2(err_w.get(), STDERR_FILENO) == -1)
      report_and_exit(exec_w.get(), errno);
    close_inherited(exec_w.get(), max_fd);
    ::execv(program.c_str(), cargv.data());
    report_and_exit(exec_w.get(), errno);
  }

  exec_w.reset();
  in_r.reset();
  out_w.reset();
  err_w.reset();

  int child_errno = 0;
  ssize_t n = 0;
  do {
    n = ::read(exec_r.get(), &child_errno, sizeof child_errno);
  } while (n == -1 && errno == EINTR);

  Child child{pid, std::move(in_w), std::move(out_r), std::move(err_r)};
  if (n == static_cast<ssize_t>(sizeof child_errno)) {
    (void)child.wait(); // always 127 here
    throw std::system_error(child_errno, std::generic_category(), "exec " + argv[0]);
  }
  return child;
}

RunResult run(const std::vector<std::string> &argv, const std::filesystem::path &cwd) {
  Child child = spawn(argv, cwd);
  child.in.reset();

  RunResult result;
  auto collect = [&](std::span<const std::uint8_t> bytes) {
    result.output.append(reinterpret_cast<const char *>(bytes.data()), bytes.size());
  };
  while (child.out || child.err) {
    std::array<pollfd, 2> fds{};
    nfds_t n = 0;
    if (child.out)
      fds[n++] = pollfd{.fd = child.out.get(), .events = POLLIN, .revents = 0};
    if (child.err)
      fds[n++] = pollfd{.fd = child.err.get(), .events = POLLIN, .revents = 0};
    if (::poll(fds.data(), n, -1) == -1) {
      if (errno == EINTR)
        continue;
      throw std::system_error(errno, std::generic_category(), "poll");
    }
    for (nfds_t i = 0; i < n; ++i) {
      if (fds[i].revents == 0)
        continue;
      UniqueFd &fd = fds[i].fd == child.out.get() ? child.out : child.err;
      drain(fd, collect);
    }
  }
  result.status = child.wait();
  return result;
}

int pump(Child &child, SessionIo &io) {
  set_nonblocking(child.in.get());
  set_nonblocking(child.out.get());
  set_nonblocking(child.err.get());

  std::vector<std::uint8_t> pending; // client bytes not yet accepted by the child
  bool client_eof = false;
  std::array<std::uint8_t, kChunk> inbuf{};
  const int client_fd = io.wait_fd();

  auto to_client = [&](std::span<const std::uint8_t> bytes) { io.write(bytes); };
  auto to_client_err = [&](std::span<const std::uint8_t> bytes) { io.write_stderr(bytes); };

  while (child.out || child.err) {
    // Take client input only once the child has consumed the previous chunk.
    bool want_client = child.in && pending.empty() && !client_eof;
    if (want_client) {
      const long got = io.read(inbuf, 0);
      if (got > 0) {
        pending.assign(inbuf.begin(), inbuf.begin() + got);
        want_client = false;
      } else if (got == SessionIo::kEof) {
        client_eof = true;
        want_client = false;
      }
    }
    if (client_eof && pending.empty() && child.in) {
      child.in.reset(); // EOF for the child
    }

    std::array<pollfd, 4> fds{};
    nfds_t n = 0;
    int out_idx = -1;
    int err_idx = -1;
    int in_idx = -1;
    if (child.out) {
      out_idx = static_cast<int>(n);
      fds[n++] = pollfd{.fd = child.out.get(), .events = POLLIN, .revents = 0};
    }
    if (child.err) {
      err_idx = static_cast<int>(n);
      fds[n++] = pollfd{.fd = child.err.get(), .events = POLLIN, .revents = 0};
    }
    if (child.in && !pending.empty()) {
      in_idx = static_cast<int>(n);
      fds[n++] = pollfd{.fd = child.in.get(), .events = POLLOUT, .revents = 0};
    }
    int timeout = -1;
    if (want_client) {
      if (client_fd >= 0)
        fds[n++] = pollfd{.fd = client_fd, .events = POLLIN, .revents = 0};
      else
        timeout = kPollSliceMs;
    }

    if (::poll(fds.data(), n, timeout) == -1) {
      if (errno == EINTR)
        continue;
      throw std::system_error(errno, std::generic_category(), "poll");
    }

    if (out_idx >= 0 && fds[out_idx].revents != 0)
      drain(child.out, to_client);
    if (err_idx >= 0 && fds[err_idx].revents != 0)
      drain(child.err, to_client_err);

    if (in_idx >= 0 && fds[in_idx].revents != 0) {
      const ssize_t w = ::write(child.in.get(), pending.data(), pending.size());
      if (w > 0) {
        pending.erase(pending.begin(), pending.begin() + w);
      } else if (w == -1 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
        // child stopped reading (EPIPE); drop what is left
        child.in.reset();
        pending.clear();
      }
    }
  }
  return child.wait();
}

} // namespace gitgate::process
