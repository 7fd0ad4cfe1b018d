#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

namespace gitgate {

enum class GitOp { UploadPack, ReceivePack };

// A validated data-plane request. Only parse_command() creates one.
struct Command {
  GitOp op = GitOp::UploadPack;
  std::string repo_path; // e.g. "a/b/c.git", never absolute, never contains ".."
  bool is_write = false; // true iff op == ReceivePack

  // "git-upload-pack" or "git-receive-pack"
  [[nodiscard]] auto program() const -> std::string_view;
};

class CommandError : public std::runtime_error {
public:
  enum class Kind { Format, Disallowed, InvalidPath };

  CommandError(Kind kind, const std::string &what) : std::runtime_error(what), kind_(kind) {}

  [[nodiscard]] auto kind() const noexcept -> Kind { return kind_; }

private:
  Kind kind_;
};

/**
 * Parse the command string a client sent with its exec request:
 *   "<git-upload-pack|git-receive-pack> <path>"
 * The path may be wrapped in one layer of single or double quotes and may
 * carry one leading '/'; after that it must match
 *   [A-Za-z0-9_-]+(/[A-Za-z0-9_-]+)*\.git
 * Throws CommandError on anything else.
 */
Command parse_command(std::string_view raw);

} // namespace gitgate
