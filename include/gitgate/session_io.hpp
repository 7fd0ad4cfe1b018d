#pragma once
#include <cstdint>
#include <span>
#include <string_view>

namespace gitgate {

// Byte-stream view of one client connection: its input, its output and a
// separate diagnostic (stderr) stream.
class SessionIo {
public:
  static constexpr long kEof = -1;

  virtual ~SessionIo() = default;

  // Read client bytes. Returns the number read, 0 if nothing arrived within
  // `timeout_ms` (negative: wait indefinitely), or kEof once the client has
  // closed its side.
  virtual auto read(std::span<std::uint8_t> buf, int timeout_ms) -> long = 0;

  // Descriptor that turns readable when read() may have new input, once a
  // read(…, 0) has returned 0. -1 when there is none; callers then retry
  // read() on a short timer.
  [[nodiscard]] virtual auto wait_fd() const -> int { return -1; }

  virtual void write(std::span<const std::uint8_t> data) = 0;
  virtual void write_stderr(std::span<const std::uint8_t> data) = 0;

  void print(std::string_view text) {
    write(std::span(reinterpret_cast<const std::uint8_t *>(text.data()), text.size()));
  }
  void println(std::string_view text) {
    print(text);
    print("\r\n");
  }
};

} // namespace gitgate
