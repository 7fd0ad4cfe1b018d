#include "gitgate/process.hpp"
#include "support.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

namespace process = gitgate::process;

static int fail(const std::string &msg) {
  std::cerr << msg << "\n";
  return 1;
}

// Client stream backed by a pipe, so pump() has a descriptor to wait on.
class PipeIo : public gitgate::SessionIo {
public:
  explicit PipeIo(int fd) : fd_(fd) { ::fcntl(fd_, F_SETFL, ::fcntl(fd_, F_GETFL) | O_NONBLOCK); }

  auto read(std::span<std::uint8_t> buf, int /*timeout_ms*/) -> long override {
    const ssize_t n = ::read(fd_, buf.data(), buf.size());
    if (n > 0)
      return static_cast<long>(n);
    if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
      ++empty_reads;
      return 0;
    }
    return kEof;
  }
  [[nodiscard]] auto wait_fd() const -> int override { return fd_; }
  void write(std::span<const std::uint8_t> data) override { out.append(data.begin(), data.end()); }
  void write_stderr(std::span<const std::uint8_t> data) override {
    err.append(data.begin(), data.end());
  }

  std::string out;
  std::string err;
  int empty_reads = 0;

private:
  int fd_;
};

int main() {
  std::signal(SIGPIPE, SIG_IGN);
  try {
    // client bytes reach stdin, stdout and stderr come back separately
    {
      testsupport::FakeIo io{"hello\nworld\n"};
      auto child = process::spawn({"/bin/sh", "-c", "cat; echo oops >&2; exit 3"});
      const int status = process::pump(child, io);
      if (status != 3)
        return fail("expected status 3, got " + std::to_string(status));
      if (io.out != "hello\nworld\n")
        return fail("stdout mismatch: [" + io.out + "]");
      if (io.err != "oops\n")
        return fail("stderr mismatch: [" + io.err + "]");
    }

    // the child may exit without reading its input
    {
      testsupport::FakeIo io{std::string(200000, 'x')};
      auto child = process::spawn({"/bin/sh", "-c", "echo early"});
      if (process::pump(child, io) != 0 || io.out != "early\n")
        return fail("early exit mismatch: [" + io.out + "]");
    }

    // signalled children report 128 + signal
    {
      testsupport::FakeIo io;
      auto child = process::spawn({"/bin/sh", "-c", "kill -TERM $$"});
      const int status = process::pump(child, io);
      if (status != 128 + SIGTERM)
        return fail("expected 143, got " + std::to_string(status));
    }

    // late client input is picked up by waiting on the client descriptor
    {
      int p[2];
      if (::pipe(p) != 0)
        return fail("pipe failed");
      process::UniqueFd rd{p[0]};
      process::UniqueFd wr{p[1]};
      PipeIo io{rd.get()};
      auto child = process::spawn({"/bin/cat"});
      std::thread feeder([&wr] {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        const std::string_view text = "late\n";
        (void)!::write(wr.get(), text.data(), text.size());
        wr.reset();
      });
      const int status = process::pump(child, io);
      feeder.join();
      if (status != 0 || io.out != "late\n")
        return fail("delayed input mismatch: [" + io.out + "]");
      // a 10ms retry timer would have come back empty-handed about 30 times
      if (io.empty_reads > 5)
        return fail("pump spun on the client: " + std::to_string(io.empty_reads) + " empty reads");
    }

    // descriptors of ours without FD_CLOEXEC do not leak into the child
    {
      const int sock = ::socket(AF_UNIX, SOCK_STREAM, 0);
      const int file = ::open("/dev/null", O_RDONLY);
      if (sock < 0 || file < 0)
        return fail("cannot open inheritable descriptors");
      process::UniqueFd sock_guard{sock};
      process::UniqueFd file_guard{file};
      const std::string script = "for fd in " + std::to_string(sock) + " " + std::to_string(file) +
                                 "; do [ -e /proc/self/fd/$fd ] && echo leaked $fd; done; "
                                 "ls -l /proc/self/fd | grep -c socket || true";
      const auto res = process::run({"sh", "-c", script});
      if (res.status != 0 || res.output != "0\n")
        return fail("child inherited descriptors: " + res.output);
    }

    // bare program names are looked up in PATH before fork
    if (process::run({"sh", "-c", "exit 4"}).status != 4)
      return fail("bare program name not resolved");
    bool missing_threw = false;
    try {
      auto child = process::spawn({"gitgate-no-such-program"});
    } catch (const std::system_error &e) {
      missing_threw = e.code().value() == ENOENT;
    }
    if (!missing_threw)
      return fail("missing bare program did not throw ENOENT");

    testsupport::TempDir tmp{"process"};
    const auto res = process::run({"/bin/sh", "-c", "pwd"}, tmp.path());
    if (res.status != 0 || res.output.find(tmp.path().filename().string()) == std::string::npos)
      return fail("run in cwd mismatch: " + res.output);

    bool threw = false;
    try {
      auto child = process::spawn({"/nonexistent/git-upload-pack", "x.git"});
    } catch (const std::system_error &) {
      threw = true;
    }
    if (!threw)
      return fail("spawning a missing program did not throw");
  } catch (const std::exception &e) {
    return fail(std::string("exception: ") + e.what());
  }
  std::cout << "process pump test OK\n";
  return 0;
}
