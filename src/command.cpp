#include "gitgate/command.hpp"

#include "gitgate/consts.hpp"
#include "gitgate/util.hpp"

#include <regex>

namespace gitgate {

namespace {

[[nodiscard]] auto is_quote(char c) -> bool { return c == '\'' || c == '"'; }

[[nodiscard]] auto unquote(std::string_view arg) -> std::string_view {
  if (!arg.empty() && is_quote(arg.front()))
    arg.remove_prefix(1);
  if (!arg.empty() && is_quote(arg.back()))
    arg.remove_suffix(1);
  return arg;
}

} // namespace

auto Command::program() const -> std::string_view {
  return op == GitOp::ReceivePack ? consts::kReceivePack : consts::kUploadPack;
}

Command parse_command(std::string_view raw) {
  static const std::regex kRepoPath{R"(^[A-Za-z0-9_-]+(/[A-Za-z0-9_-]+)*\.git$)"};

  const std::string line = strutil::trim(raw);
  const auto sp = line.find(consts::kSpace);
  if (sp == std::string::npos) {
    throw CommandError(CommandError::Kind::Format, "invalid command format");
  }
  const std::string_view sv{line};
  const std::string_view program = sv.substr(0, sp);

  Command cmd;
  if (program == consts::kUploadPack) {
    cmd.op = GitOp::UploadPack;
  } else if (program == consts::kReceivePack) {
    cmd.op = GitOp::ReceivePack;
  } else {
    throw CommandError(CommandError::Kind::Disallowed,
                       "command not allowed: " + std::string(program));
  }

  std::string_view path = unquote(sv.substr(sp + 1));
  if (path.starts_with('/'))
    path.remove_prefix(1);
  if (!std::regex_match(path.begin(), path.end(), kRepoPath)) {
    throw CommandError(CommandError::Kind::InvalidPath, "invalid repo path: " + std::string(path));
  }

  cmd.repo_path = std::string(path);
  cmd.is_write = cmd.op == GitOp::ReceivePack;
  return cmd;
}

} // namespace gitgate
